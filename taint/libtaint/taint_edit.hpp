/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef TAINT_EDIT_HPP
#define TAINT_EDIT_HPP

#include <string>
#include <vector>

#include "taint/libtaint/taint.hpp"

namespace Taintspec {
namespace taint_model {

/*! Apply the result of parse_taints() to an existing taint list.
 *  Surviving taints keep their order; new taints follow in the order
 *  they were given.
 *
 * \param existing   taints currently set on the resource
 * \param to_add     taints to add
 * \param to_remove  selectors of taints to remove
 * \param overwrite  allow an addition to replace the value of an
 *                   existing taint with the same key and effect
 * \param result     edited taint list
 * \param err        error message on error
 * \return           0 on success; -1 on error with errno set:
 *                       ENOENT: a selector matches no existing taint
 *                       EEXIST: an addition would change a value
 *                               without overwrite
 *                       ENOMEM: out of memory
 */
int apply_taint_edits (const std::vector<taint_t> &existing,
                       const std::vector<taint_t> &to_add,
                       const std::vector<taint_selector_t> &to_remove,
                       bool overwrite,
                       std::vector<taint_t> &result,
                       std::string &err);

}  // namespace taint_model
}  // namespace Taintspec

#endif  // TAINT_EDIT_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
