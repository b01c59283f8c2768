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
#include <string>

#include "taint/libtaint/taint.hpp"

namespace Taintspec {
namespace taint_model {

bool operator== (const taint_t &a, const taint_t &b)
{
    return a.key == b.key && a.value == b.value && a.effect == b.effect;
}

bool operator!= (const taint_t &a, const taint_t &b)
{
    return !(a == b);
}

bool operator== (const taint_selector_t &a, const taint_selector_t &b)
{
    return a.key == b.key && a.effect == b.effect;
}

bool operator!= (const taint_selector_t &a, const taint_selector_t &b)
{
    return !(a == b);
}

int effect_from_string (const std::string &str, taint_effect_t &effect)
{
    int rc = 0;
    if (str == "NoSchedule")
        effect = taint_effect_t::NO_SCHEDULE;
    else if (str == "PreferNoSchedule")
        effect = taint_effect_t::PREFER_NO_SCHEDULE;
    else if (str == "NoExecute")
        effect = taint_effect_t::NO_EXECUTE;
    else {
        errno = EINVAL;
        rc = -1;
    }
    return rc;
}

const char *effect_to_string (taint_effect_t effect)
{
    switch (effect) {
        case taint_effect_t::NO_SCHEDULE:
            return "NoSchedule";
        case taint_effect_t::PREFER_NO_SCHEDULE:
            return "PreferNoSchedule";
        case taint_effect_t::NO_EXECUTE:
            return "NoExecute";
        case taint_effect_t::UNSPECIFIED:
        default:
            break;
    }
    return "";
}

std::string to_spec_string (const taint_t &taint)
{
    return taint.key + "=" + taint.value + ":" + effect_to_string (taint.effect);
}

bool selector_matches (const taint_selector_t &selector, const taint_t &taint)
{
    if (selector.key != taint.key)
        return false;
    return selector.effect == taint_effect_t::UNSPECIFIED || selector.effect == taint.effect;
}

std::ostream &operator<< (std::ostream &s, taint_effect_t effect)
{
    s << effect_to_string (effect);
    return s;
}

std::ostream &operator<< (std::ostream &s, const taint_t &taint)
{
    s << taint.key;
    if (!taint.value.empty ())
        s << "=" << taint.value;
    if (taint.effect != taint_effect_t::UNSPECIFIED)
        s << ":" << taint.effect;
    else if (!taint.value.empty ())
        s << ":";
    return s;
}

std::ostream &operator<< (std::ostream &s, const taint_selector_t &selector)
{
    s << selector.key;
    if (selector.effect != taint_effect_t::UNSPECIFIED)
        s << ":" << selector.effect;
    return s;
}

}  // namespace taint_model
}  // namespace Taintspec

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
