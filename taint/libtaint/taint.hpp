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
 * Taint data model.
 *
 * A taint marks a resource so that it repels work unless the work
 * tolerates it.  A taint to add carries a key, an optional value and
 * a required effect.  A taint selector is the reduced form used to
 * pick existing taints for removal: a key and, optionally, an effect.
 */

#ifndef TAINT_HPP
#define TAINT_HPP

#include <ostream>
#include <string>

namespace Taintspec {
namespace taint_model {

enum class taint_effect_t { NO_SCHEDULE, PREFER_NO_SCHEDULE, NO_EXECUTE, UNSPECIFIED };

struct taint_t {
    std::string key;
    std::string value;
    taint_effect_t effect = taint_effect_t::UNSPECIFIED;
};

struct taint_selector_t {
    std::string key;
    // UNSPECIFIED selects every taint with this key
    taint_effect_t effect = taint_effect_t::UNSPECIFIED;
};

bool operator== (const taint_t &a, const taint_t &b);
bool operator!= (const taint_t &a, const taint_t &b);
bool operator== (const taint_selector_t &a, const taint_selector_t &b);
bool operator!= (const taint_selector_t &a, const taint_selector_t &b);

/*! Convert an effect string into taint_effect_t.
 *  Only the exact spellings "NoSchedule", "PreferNoSchedule" and
 *  "NoExecute" are accepted.
 *
 * \param str      effect string
 * \param effect   parsed effect to return
 * \return         0 on success; -1 on error with errno set to EINVAL.
 */
int effect_from_string (const std::string &str, taint_effect_t &effect);

/*! Canonical spelling of an effect; "" for UNSPECIFIED.
 */
const char *effect_to_string (taint_effect_t effect);

/*! Render a taint in the "<key>=<value>:<effect>" addition form.
 *  The result parses back into the same taint.
 */
std::string to_spec_string (const taint_t &taint);

/*! Does the selector pick the taint?  Keys must be equal and the
 *  effects must agree unless the selector's effect is UNSPECIFIED.
 */
bool selector_matches (const taint_selector_t &selector, const taint_t &taint);

std::ostream &operator<< (std::ostream &s, taint_effect_t effect);
std::ostream &operator<< (std::ostream &s, const taint_t &taint);
std::ostream &operator<< (std::ostream &s, const taint_selector_t &selector);

}  // namespace taint_model
}  // namespace Taintspec

#endif  // TAINT_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
