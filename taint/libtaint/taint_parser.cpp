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
#include <map>
#include <new>
#include <set>
#include <sstream>
#include <utility>
#include <boost/algorithm/string.hpp>

#include "taint/libtaint/taint_parser.hpp"
#include "taint/libtaint/validation.hpp"

using namespace Taintspec::taint_model;

namespace {

std::string invalid_spec_msg (const std::string &spec, const std::vector<std::string> &errs)
{
    std::string msg = "invalid taint spec: " + spec;
    if (!errs.empty ())
        msg += ", " + boost::algorithm::join (errs, "; ");
    return msg;
}

}  // namespace

Taintspec::taint_model::parse_error::parse_error (parse_error_kind_t k,
                                                  const std::string &s,
                                                  const std::string &msg)
    : std::runtime_error (msg), kind (k), spec (s)
{
}

const char *Taintspec::taint_model::parse_error_kind_to_string (parse_error_kind_t kind)
{
    switch (kind) {
        case parse_error_kind_t::FORMAT:
            return "format";
        case parse_error_kind_t::INVALID_EFFECT:
            return "invalid-effect";
        case parse_error_kind_t::INVALID_KEY:
            return "invalid-key";
        case parse_error_kind_t::INVALID_VALUE:
            return "invalid-value";
        case parse_error_kind_t::DUPLICATE:
            return "duplicate";
    }
    return "unknown";
}

taint_t Taintspec::taint_model::detail::parse_taint (const std::string &spec)
{
    taint_t taint;
    std::vector<std::string> parts;
    std::vector<std::string> errs;

    boost::split (parts, spec, boost::is_any_of (":"));
    switch (parts.size ()) {
        case 1:
            taint.key = parts[0];
            break;
        case 2: {
            std::vector<std::string> kv;
            if (effect_from_string (parts[1], taint.effect) < 0)
                throw parse_error (parse_error_kind_t::INVALID_EFFECT,
                                   spec,
                                   "invalid taint effect: " + parts[1]
                                       + ", unsupported taint effect");

            boost::split (kv, parts[0], boost::is_any_of ("="));
            if (kv.size () > 2)
                throw parse_error (parse_error_kind_t::FORMAT, spec, invalid_spec_msg (spec, errs));
            taint.key = kv[0];
            if (kv.size () == 2) {
                taint.value = kv[1];
                errs = Taintspec::validation::is_valid_label_value (taint.value);
                if (!errs.empty ())
                    throw parse_error (parse_error_kind_t::INVALID_VALUE,
                                       spec,
                                       invalid_spec_msg (spec, errs));
            }
            break;
        }
        default:
            throw parse_error (parse_error_kind_t::FORMAT, spec, invalid_spec_msg (spec, errs));
    }

    errs = Taintspec::validation::is_qualified_name (taint.key);
    if (!errs.empty ())
        throw parse_error (parse_error_kind_t::INVALID_KEY, spec, invalid_spec_msg (spec, errs));

    return taint;
}

taint_spec_t::taint_spec_t (const std::vector<std::string> &specs)
{
    // keys already added, per effect
    std::map<taint_effect_t, std::set<std::string>> unique_taints;

    for (const auto &spec : specs) {
        if (boost::algorithm::ends_with (spec, "-")) {
            taint_t taint = detail::parse_taint (spec.substr (0, spec.size () - 1));
            to_remove.push_back (taint_selector_t{taint.key, taint.effect});
            continue;
        }

        taint_t taint = detail::parse_taint (spec);
        if (taint.effect == taint_effect_t::UNSPECIFIED)
            throw parse_error (parse_error_kind_t::FORMAT,
                               spec,
                               invalid_spec_msg (spec, std::vector<std::string> ()));

        auto ret = unique_taints[taint.effect].insert (taint.key);
        if (!ret.second) {
            std::ostringstream msg;
            msg << "duplicated taints with the same key and effect: " << taint;
            throw parse_error (parse_error_kind_t::DUPLICATE, spec, msg.str ());
        }
        to_add.push_back (taint);
    }
}

int Taintspec::taint_model::parse_taints (const std::vector<std::string> &specs,
                                          std::vector<taint_t> &to_add,
                                          std::vector<taint_selector_t> &to_remove,
                                          std::string &err)
{
    int rc = 0;
    to_add.clear ();
    to_remove.clear ();
    try {
        taint_spec_t ts (specs);
        to_add = std::move (ts.to_add);
        to_remove = std::move (ts.to_remove);
    } catch (parse_error &e) {
        err = e.what ();
        errno = EINVAL;
        rc = -1;
    } catch (std::bad_alloc &e) {
        err = "out of memory while parsing taint specs";
        errno = ENOMEM;
        rc = -1;
    }
    if (rc < 0) {
        to_add.clear ();
        to_remove.clear ();
    }
    return rc;
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
