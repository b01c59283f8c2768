/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

extern "C" {
#if HAVE_CONFIG_H
#include "config.h"
#endif
}

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <sstream>
#include <boost/algorithm/string.hpp>

#include "taint/libtaint/taint_parser.hpp"
#include "taint/libtaint/taint_edit.hpp"
#include "taint/readers/taint_spec_reader.hpp"
#include "taint/writers/taint_writers.hpp"

using namespace Taintspec::taint_model;

#define OPTIONS "f:e:F:oh"
static const struct option longopts[] = {
    {"spec-file", required_argument, 0, 'f'},
    {"existing", required_argument, 0, 'e'},
    {"format", required_argument, 0, 'F'},
    {"overwrite", no_argument, 0, 'o'},
    {"help", no_argument, 0, 'h'},
    {0, 0, 0, 0},
};

struct taint_parse_params_t {
    std::string spec_file = "";
    std::string existing_file = "";
    std::string format = "simple";
    bool overwrite = false;
};

static void usage (int code)
{
    std::cerr << R"(
usage: taint-parse [OPTIONS...] SPEC...

Command-line utility that parses taint specs, each of the form

    <key>=<value>:<effect>     add a taint with a value
    <key>:<effect>             add a taint with an empty value
    <key>[=<value>]:<effect>-  remove the taint with key and effect
    <key>-                     remove every taint with key

where <effect> is one of NoSchedule, PreferNoSchedule or NoExecute,
and prints the taints to add and the taints to remove.

OPTIONS:
    -h, --help
            Display this usage information

    -f, --spec-file=filepath
            YAML file holding a sequence of taint specs (or a mapping
            with the sequence under "taints"). These specs are parsed
            before the ones given on the command line.

    -e, --existing=filepath
            YAML file holding the taints currently set on a resource,
            in the <key>[=<value>]:<effect> form. When given, print the
            taint list that results from applying the specs to it.

    -o, --overwrite
            With --existing, allow a spec to replace the value of an
            existing taint with the same key and effect.

    -F, --format=<simple|json>
            Specify the emit format of the result (default=simple).

)";
    exit (code);
}

static int read_spec_file (const std::string &path, std::vector<std::string> &specs)
{
    taint_spec_reader_t reader;
    if (reader.read_file (path, specs) < 0) {
        std::cerr << "ERROR: can't read " << path << ": " << strerror (errno) << std::endl;
        std::cerr << reader.err_message ();
        return -1;
    }
    return 0;
}

static int emit_parsed (std::shared_ptr<taint_writers_t> &w,
                        const std::vector<taint_t> &to_add,
                        const std::vector<taint_selector_t> &to_remove)
{
    for (const auto &taint : to_add) {
        if (w->emit_add (taint) < 0)
            return -1;
    }
    for (const auto &selector : to_remove) {
        if (w->emit_remove (selector) < 0)
            return -1;
    }
    return 0;
}

static int edit_existing (const taint_parse_params_t &params,
                          std::shared_ptr<taint_writers_t> &w,
                          const std::vector<taint_t> &to_add,
                          const std::vector<taint_selector_t> &to_remove)
{
    std::string err = "";
    std::vector<std::string> existing_specs;
    std::vector<taint_t> existing;
    std::vector<taint_selector_t> not_used;
    std::vector<taint_t> result;

    if (read_spec_file (params.existing_file, existing_specs) < 0)
        return -1;
    if (parse_taints (existing_specs, existing, not_used, err) < 0) {
        std::cerr << "ERROR: " << params.existing_file << ": " << err << std::endl;
        return -1;
    }
    if (!not_used.empty ()) {
        std::cerr << "ERROR: " << params.existing_file
                  << ": removal specs are not allowed in an existing taint list" << std::endl;
        return -1;
    }
    if (apply_taint_edits (existing, to_add, to_remove, params.overwrite, result, err) < 0) {
        std::cerr << "ERROR: " << err << std::endl;
        return -1;
    }
    if (w->emit_edited (result) < 0) {
        std::cerr << "ERROR: can't emit taints: " << strerror (errno) << std::endl;
        return -1;
    }
    return 0;
}

int main (int argc, char *argv[])
{
    int ch = 0;
    int rc = EXIT_SUCCESS;
    std::string err = "";
    std::stringstream out;
    taint_parse_params_t params;
    std::vector<std::string> specs;
    std::vector<taint_t> to_add;
    std::vector<taint_selector_t> to_remove;
    std::shared_ptr<taint_writers_t> w = nullptr;

    while ((ch = getopt_long (argc, argv, OPTIONS, longopts, NULL)) != -1) {
        switch (ch) {
            case 'h': /* --help */
                usage (0);
                break;
            case 'f': /* --spec-file */
                params.spec_file = optarg;
                break;
            case 'e': /* --existing */
                params.existing_file = optarg;
                break;
            case 'o': /* --overwrite */
                params.overwrite = true;
                break;
            case 'F': /* --format */
                params.format = optarg;
                boost::algorithm::to_lower (params.format);
                if (!known_taint_format (params.format)) {
                    std::cerr << "ERROR: unknown format (" << optarg << ")" << std::endl;
                    usage (1);
                }
                break;
            default:
                usage (1);
                break;
        }
    }

    if (params.spec_file != "" && read_spec_file (params.spec_file, specs) < 0)
        return EXIT_FAILURE;
    for (int i = optind; i < argc; i++)
        specs.push_back (argv[i]);
    if (specs.empty ()) {
        std::cerr << "ERROR: no taint spec given" << std::endl;
        usage (1);
    }

    if (parse_taints (specs, to_add, to_remove, err) < 0) {
        std::cerr << "ERROR: " << err << std::endl;
        return EXIT_FAILURE;
    }

    if (!(w = taint_writers_factory_t::create (
              taint_writers_factory_t::get_writers_type (params.format)))) {
        std::cerr << "ERROR: can't create writers: " << strerror (errno) << std::endl;
        return EXIT_FAILURE;
    }

    if (params.existing_file != "") {
        if (edit_existing (params, w, to_add, to_remove) < 0) {
            rc = EXIT_FAILURE;
            goto done;
        }
    } else if (emit_parsed (w, to_add, to_remove) < 0) {
        std::cerr << "ERROR: can't emit taints: " << strerror (errno) << std::endl;
        rc = EXIT_FAILURE;
        goto done;
    }

    if (w->emit (out) < 0) {
        std::cerr << "ERROR: can't emit taints: " << strerror (errno) << std::endl;
        rc = EXIT_FAILURE;
        goto done;
    }
    std::cout << out.str ();

done:
    return rc;
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
