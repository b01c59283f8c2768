/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

/*
 * separate Taintspec::taint_model::parse_error header for callers that
 * catch it without needing the parser interface
 */

#ifndef TAINT_PARSE_ERROR_HPP
#define TAINT_PARSE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace Taintspec {
namespace taint_model {

enum class parse_error_kind_t { FORMAT, INVALID_EFFECT, INVALID_KEY, INVALID_VALUE, DUPLICATE };

class parse_error : public std::runtime_error {
   public:
    parse_error_kind_t kind;
    std::string spec;  // raw input fragment that failed
    parse_error (parse_error_kind_t k, const std::string &s, const std::string &msg);
};

const char *parse_error_kind_to_string (parse_error_kind_t kind);

}  // namespace taint_model
}  // namespace Taintspec

#endif  // TAINT_PARSE_ERROR_HPP
