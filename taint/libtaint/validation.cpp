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

#include <boost/algorithm/string.hpp>

#include "taint/libtaint/validation.hpp"

namespace Taintspec {
namespace validation {

namespace {

const std::string QUALIFIED_NAME_MSG =
    "must consist of alphanumeric characters, '-', '_' or '.', and must start and end "
    "with an alphanumeric character (e.g. 'MyName', or 'my.name', or '123-abc')";

const std::string LABEL_VALUE_MSG =
    "a valid label must be an empty string or consist of alphanumeric characters, "
    "'-', '_' or '.', and must start and end with an alphanumeric character "
    "(e.g. 'MyValue', or 'my_value', or '12345')";

const std::string DNS1123_SUBDOMAIN_MSG =
    "a lowercase RFC 1123 subdomain must consist of lower case alphanumeric characters, "
    "'-' or '.', and must start and end with an alphanumeric character (e.g. 'example.com')";

// ASCII only: multi-byte UTF-8 sequences never qualify
bool is_alnum (char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool is_lower_alnum (char c)
{
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

std::string max_len_msg (std::size_t len)
{
    return "must be no more than " + std::to_string (len) + " characters";
}

// ([A-Za-z0-9][-A-Za-z0-9_.]*)?[A-Za-z0-9]
bool match_name (const std::string &str)
{
    if (str.empty () || !is_alnum (str.front ()) || !is_alnum (str.back ()))
        return false;
    for (char c : str) {
        if (!is_alnum (c) && c != '-' && c != '_' && c != '.')
            return false;
    }
    return true;
}

// [a-z0-9]([-a-z0-9]*[a-z0-9])?
bool match_dns1123_label (const std::string &str)
{
    if (str.empty () || !is_lower_alnum (str.front ()) || !is_lower_alnum (str.back ()))
        return false;
    for (char c : str) {
        if (!is_lower_alnum (c) && c != '-')
            return false;
    }
    return true;
}

}  // namespace

std::vector<std::string> is_dns1123_subdomain (const std::string &str)
{
    std::vector<std::string> errs;
    std::vector<std::string> labels;

    if (str.size () > DNS1123_SUBDOMAIN_MAX_LEN)
        errs.push_back (max_len_msg (DNS1123_SUBDOMAIN_MAX_LEN));

    boost::split (labels, str, boost::is_any_of ("."));
    for (const auto &label : labels) {
        if (!match_dns1123_label (label)) {
            errs.push_back (DNS1123_SUBDOMAIN_MSG);
            break;
        }
    }
    return errs;
}

std::vector<std::string> is_qualified_name (const std::string &str)
{
    std::vector<std::string> errs;
    std::vector<std::string> parts;
    std::string name;

    boost::split (parts, str, boost::is_any_of ("/"));
    switch (parts.size ()) {
        case 1:
            name = parts[0];
            break;
        case 2: {
            const std::string &prefix = parts[0];
            name = parts[1];
            if (prefix.empty ()) {
                errs.push_back ("prefix part must be non-empty");
            } else {
                for (const auto &msg : is_dns1123_subdomain (prefix))
                    errs.push_back ("prefix part " + msg);
            }
            break;
        }
        default:
            errs.push_back ("a qualified name " + QUALIFIED_NAME_MSG
                            + " with an optional DNS subdomain prefix and '/' "
                              "(e.g. 'example.com/MyName')");
            return errs;
    }

    if (name.empty ())
        errs.push_back ("name part must be non-empty");
    else if (name.size () > QUALIFIED_NAME_MAX_LEN)
        errs.push_back ("name part " + max_len_msg (QUALIFIED_NAME_MAX_LEN));
    if (!match_name (name))
        errs.push_back ("name part " + QUALIFIED_NAME_MSG);
    return errs;
}

std::vector<std::string> is_valid_label_value (const std::string &str)
{
    std::vector<std::string> errs;
    if (str.empty ())
        return errs;
    if (str.size () > LABEL_VALUE_MAX_LEN)
        errs.push_back (max_len_msg (LABEL_VALUE_MAX_LEN));
    if (!match_name (str))
        errs.push_back (LABEL_VALUE_MSG);
    return errs;
}

}  // namespace validation
}  // namespace Taintspec

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
