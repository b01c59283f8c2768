/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef TAINT_VALIDATION_HPP
#define TAINT_VALIDATION_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace Taintspec {
namespace validation {

const std::size_t QUALIFIED_NAME_MAX_LEN = 63;
const std::size_t LABEL_VALUE_MAX_LEN = 63;
const std::size_t DNS1123_SUBDOMAIN_MAX_LEN = 253;

/*! Check str against the qualified name grammar: an optional
 *  DNS-1123 subdomain prefix followed by '/', then a name of up to
 *  63 alphanumeric, '-', '_' or '.' characters that starts and ends
 *  with an alphanumeric character.
 *
 * \param str      string to check
 * \return         list of violations; empty if str is valid.
 */
std::vector<std::string> is_qualified_name (const std::string &str);

/*! Check str against the label value grammar.  The empty string is
 *  valid; otherwise the name rule of is_qualified_name applies.
 *
 * \param str      string to check
 * \return         list of violations; empty if str is valid.
 */
std::vector<std::string> is_valid_label_value (const std::string &str);

/*! Check str against the lower case RFC 1123 subdomain grammar.
 *
 * \param str      string to check
 * \return         list of violations; empty if str is valid.
 */
std::vector<std::string> is_dns1123_subdomain (const std::string &str);

}  // namespace validation
}  // namespace Taintspec

#endif  // TAINT_VALIDATION_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
