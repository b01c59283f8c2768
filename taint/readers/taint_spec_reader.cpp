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
#include <fstream>
#include <yaml-cpp/yaml.h>

#include "taint/readers/taint_spec_reader.hpp"

namespace Taintspec {
namespace taint_model {

int taint_spec_reader_t::read (std::istream &is, std::vector<std::string> &specs)
{
    int rc = 0;
    std::vector<std::string> read_specs;

    try {
        YAML::Node root = YAML::Load (is);
        YAML::Node seq = root;

        if (root.IsMap ()) {
            if (!root["taints"]) {
                m_err_msg += __FUNCTION__;
                m_err_msg += ": key \"taints\" missing from mapping.\n";
                errno = EINVAL;
                rc = -1;
                goto done;
            }
            seq = root["taints"];
        }
        if (seq.IsNull ())
            goto done;
        if (!seq.IsSequence ()) {
            m_err_msg += __FUNCTION__;
            m_err_msg += ": taint specs must be a sequence.\n";
            errno = EINVAL;
            rc = -1;
            goto done;
        }
        for (auto &&entry : seq) {
            if (!entry.IsScalar ()) {
                m_err_msg += __FUNCTION__;
                m_err_msg += ": taint spec must be a string (line ";
                m_err_msg += std::to_string (entry.Mark ().line + 1) + ").\n";
                errno = EINVAL;
                rc = -1;
                goto done;
            }
            read_specs.push_back (entry.as<std::string> ());
        }
    } catch (YAML::Exception &e) {
        m_err_msg += __FUNCTION__;
        m_err_msg += ": " + std::string (e.what ()) + ".\n";
        errno = EINVAL;
        rc = -1;
        goto done;
    }
    specs.insert (specs.end (), read_specs.begin (), read_specs.end ());

done:
    return rc;
}

int taint_spec_reader_t::read_file (const std::string &path, std::vector<std::string> &specs)
{
    std::ifstream in_file (path);
    if (!in_file.good ()) {
        m_err_msg += __FUNCTION__;
        m_err_msg += ": can't open " + path + ".\n";
        errno = ENOENT;
        return -1;
    }
    return read (in_file, specs);
}

const std::string &taint_spec_reader_t::err_message () const
{
    return m_err_msg;
}

void taint_spec_reader_t::clear_err_message ()
{
    m_err_msg = "";
}

}  // namespace taint_model
}  // namespace Taintspec

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
