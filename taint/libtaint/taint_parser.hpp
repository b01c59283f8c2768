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
 * This module parses taint specification strings into taints to add
 * and selectors of taints to remove.  Each spec string takes one of
 * the following forms:
 *
 *   <key>=<value>:<effect>     add a taint with a value
 *   <key>:<effect>             add a taint with an empty value
 *   <key>=<value>:<effect>-    remove the taint with key and effect
 *   <key>:<effect>-            remove the taint with key and effect
 *   <key>-                     remove every taint with key
 *
 * The value given in a removal spec is validated but then dropped.
 *
 * Flux::Jobspec style: taint_spec_t raises parse_error on the first bad
 * entry.  parse_taints() is the non-throwing interface that maps the
 * exception to a return code, errno and an error message.
 */

#ifndef TAINT_PARSER_HPP
#define TAINT_PARSER_HPP

#include <string>
#include <vector>

#include "taint/libtaint/taint.hpp"
#include "taint/libtaint/parse_error.hpp"

namespace Taintspec {
namespace taint_model {

namespace detail {

/*! Parse one taint descriptor: "<key>=<value>:<effect>",
 *  "<key>:<effect>" or "<key>".  The effect of the returned taint is
 *  UNSPECIFIED for the last form.  Throws parse_error.
 */
taint_t parse_taint (const std::string &spec);

}  // namespace detail

class taint_spec_t {
   public:
    std::vector<taint_t> to_add;
    std::vector<taint_selector_t> to_remove;

    taint_spec_t () = default;
    taint_spec_t (const std::vector<std::string> &specs);
};

/*! Parse specs into taints to add and selectors of taints to remove.
 *  Both output vectors keep the relative input order of their entries.
 *  The first bad entry aborts the whole parse.
 *
 * \param specs      ordered taint spec strings
 * \param to_add     taints to add; empty on error
 * \param to_remove  selectors of taints to remove; empty on error
 * \param err        error message naming the offending spec on error
 * \return           0 on success; -1 on error with errno set:
 *                       EINVAL: malformed, invalid or duplicated spec
 *                       ENOMEM: out of memory
 */
int parse_taints (const std::vector<std::string> &specs,
                  std::vector<taint_t> &to_add,
                  std::vector<taint_selector_t> &to_remove,
                  std::string &err);

}  // namespace taint_model
}  // namespace Taintspec

#endif  // TAINT_PARSER_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
