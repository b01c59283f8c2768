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

#include <algorithm>
#include <cerrno>
#include <new>
#include <sstream>
#include <utility>

#include "taint/libtaint/taint_edit.hpp"

namespace Taintspec {
namespace taint_model {

int apply_taint_edits (const std::vector<taint_t> &existing,
                       const std::vector<taint_t> &to_add,
                       const std::vector<taint_selector_t> &to_remove,
                       bool overwrite,
                       std::vector<taint_t> &result,
                       std::string &err)
{
    int rc = 0;
    std::vector<taint_t> edited;

    try {
        edited = existing;
        for (const auto &selector : to_remove) {
            auto it = std::remove_if (edited.begin (), edited.end (), [&selector] (const taint_t &t) {
                return selector_matches (selector, t);
            });
            if (it == edited.end ()) {
                std::ostringstream msg;
                msg << "taint " << selector << " not found";
                err = msg.str ();
                errno = ENOENT;
                rc = -1;
                goto done;
            }
            edited.erase (it, edited.end ());
        }

        for (const auto &taint : to_add) {
            auto it = std::find_if (edited.begin (), edited.end (), [&taint] (const taint_t &t) {
                return t.key == taint.key && t.effect == taint.effect;
            });
            if (it == edited.end ()) {
                edited.push_back (taint);
            } else if (it->value != taint.value) {
                if (!overwrite) {
                    std::ostringstream msg;
                    msg << "taint " << *it << " already exists with a different value";
                    err = msg.str ();
                    errno = EEXIST;
                    rc = -1;
                    goto done;
                }
                *it = taint;
            }
        }
        result = std::move (edited);
    } catch (std::bad_alloc &e) {
        err = "out of memory while editing taints";
        errno = ENOMEM;
        rc = -1;
    }

done:
    return rc;
}

}  // namespace taint_model
}  // namespace Taintspec

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
