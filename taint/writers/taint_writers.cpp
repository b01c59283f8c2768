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
#include <cstdlib>
#include <new>

#include "taint/writers/taint_writers.hpp"

namespace Taintspec {
namespace taint_model {

/****************************************************************************
 *                                                                          *
 *              Simple Writers Class Public Method Definitions              *
 *                                                                          *
 ****************************************************************************/

bool sim_taint_writers_t::empty ()
{
    return !m_edited && m_out.str ().empty ();
}

int sim_taint_writers_t::emit_json (json_t **o)
{
    std::stringstream out;
    if (emit (out) < 0)
        return -1;
    if (!(*o = json_string (out.str ().c_str ()))) {
        errno = ENOMEM;
        return -1;
    }
    return 0;
}

int sim_taint_writers_t::emit (std::stringstream &out)
{
    out << (m_edited ? m_edited_out.str () : m_out.str ());
    m_out.str ("");
    m_out.clear ();
    m_edited_out.str ("");
    m_edited_out.clear ();
    m_edited = false;
    return 0;
}

int sim_taint_writers_t::emit_add (const taint_t &taint)
{
    m_out << "add: " << to_spec_string (taint) << std::endl;
    return 0;
}

int sim_taint_writers_t::emit_remove (const taint_selector_t &selector)
{
    m_out << "remove: " << selector << std::endl;
    return 0;
}

int sim_taint_writers_t::emit_edited (const std::vector<taint_t> &taints)
{
    m_edited = true;
    for (const auto &taint : taints)
        m_edited_out << "taint: " << to_spec_string (taint) << std::endl;
    return 0;
}

/****************************************************************************
 *                                                                          *
 *               JSON Writers Class Public Method Definitions               *
 *                                                                          *
 ****************************************************************************/

json_taint_writers_t::json_taint_writers_t ()
{
    if (alloc_json_arrays () < 0)
        throw std::bad_alloc ();
}

json_taint_writers_t::json_taint_writers_t (const json_taint_writers_t &w)
{
    if (!(m_add = json_deep_copy (w.m_add)) || !(m_remove = json_deep_copy (w.m_remove))
        || !(m_taints = json_deep_copy (w.m_taints))) {
        free_json_arrays ();
        throw std::bad_alloc ();
    }
    m_edited = w.m_edited;
}

json_taint_writers_t &json_taint_writers_t::operator= (const json_taint_writers_t &w)
{
    if (this == &w)
        return *this;
    free_json_arrays ();
    if (!(m_add = json_deep_copy (w.m_add)) || !(m_remove = json_deep_copy (w.m_remove))
        || !(m_taints = json_deep_copy (w.m_taints))) {
        free_json_arrays ();
        throw std::bad_alloc ();
    }
    m_edited = w.m_edited;
    return *this;
}

json_taint_writers_t::~json_taint_writers_t ()
{
    free_json_arrays ();
}

bool json_taint_writers_t::empty ()
{
    return !m_edited && json_array_size (m_add) == 0 && json_array_size (m_remove) == 0;
}

int json_taint_writers_t::emit_json (json_t **o)
{
    int rc = 0;

    if (m_edited) {
        json_decref (m_add);
        json_decref (m_remove);
        *o = json_pack ("{s:o}", "taints", m_taints);
    } else {
        json_decref (m_taints);
        *o = json_pack ("{s:o s:o}", "add", m_add, "remove", m_remove);
    }
    // json_pack steals the references to the arrays even on failure
    m_add = m_remove = m_taints = NULL;
    m_edited = false;
    if (!*o) {
        errno = ENOMEM;
        rc = -1;
        goto ret;
    }
    if (alloc_json_arrays () < 0) {
        json_decref (*o);
        *o = NULL;
        rc = -1;
        goto ret;
    }

ret:
    return rc;
}

int json_taint_writers_t::emit (std::stringstream &out)
{
    int rc = 0;
    json_t *o = NULL;
    char *json_str = NULL;

    if ((rc = emit_json (&o)) < 0)
        goto ret;
    if (!(json_str = json_dumps (o, JSON_INDENT (0) | JSON_PRESERVE_ORDER))) {
        json_decref (o);
        errno = ENOMEM;
        rc = -1;
        goto ret;
    }
    out << json_str << std::endl;
    free (json_str);
    json_decref (o);
ret:
    return rc;
}

int json_taint_writers_t::emit_add (const taint_t &taint)
{
    json_t *o = NULL;
    if (!(o = taint_to_json (taint)))
        return -1;
    if (json_array_append_new (m_add, o) < 0) {
        errno = ENOMEM;
        return -1;
    }
    return 0;
}

int json_taint_writers_t::emit_remove (const taint_selector_t &selector)
{
    json_t *o = NULL;
    if (selector.effect == taint_effect_t::UNSPECIFIED)
        o = json_pack ("{s:s}", "key", selector.key.c_str ());
    else
        o = json_pack ("{s:s s:s}",
                       "key",
                       selector.key.c_str (),
                       "effect",
                       effect_to_string (selector.effect));
    if (!o || json_array_append_new (m_remove, o) < 0) {
        errno = ENOMEM;
        return -1;
    }
    return 0;
}

int json_taint_writers_t::emit_edited (const std::vector<taint_t> &taints)
{
    json_t *o = NULL;
    m_edited = true;
    for (const auto &taint : taints) {
        if (!(o = taint_to_json (taint)))
            return -1;
        if (json_array_append_new (m_taints, o) < 0) {
            errno = ENOMEM;
            return -1;
        }
    }
    return 0;
}

/****************************************************************************
 *                                                                          *
 *              JSON Writers Class Private Method Definitions               *
 *                                                                          *
 ****************************************************************************/

json_t *json_taint_writers_t::taint_to_json (const taint_t &taint)
{
    json_t *o = NULL;
    if (!(o = json_pack ("{s:s s:s s:s}",
                         "key",
                         taint.key.c_str (),
                         "value",
                         taint.value.c_str (),
                         "effect",
                         effect_to_string (taint.effect))))
        errno = ENOMEM;
    return o;
}

int json_taint_writers_t::alloc_json_arrays ()
{
    if (!(m_add = json_array ()) || !(m_remove = json_array ()) || !(m_taints = json_array ())) {
        free_json_arrays ();
        errno = ENOMEM;
        return -1;
    }
    return 0;
}

void json_taint_writers_t::free_json_arrays ()
{
    json_decref (m_add);
    json_decref (m_remove);
    json_decref (m_taints);
    m_add = m_remove = m_taints = NULL;
}

/****************************************************************************
 *                                                                          *
 *                   Taint Writers Factory Class Definitions                *
 *                                                                          *
 ****************************************************************************/

std::shared_ptr<taint_writers_t> taint_writers_factory_t::create (taint_format_t f)
{
    std::shared_ptr<taint_writers_t> w = nullptr;

    try {
        switch (f) {
            case taint_format_t::JSON:
                w = std::make_shared<json_taint_writers_t> ();
                break;
            case taint_format_t::SIMPLE:
            default:
                w = std::make_shared<sim_taint_writers_t> ();
                break;
        }
    } catch (std::bad_alloc &e) {
        errno = ENOMEM;
        w = nullptr;
    }

    return w;
}

taint_format_t taint_writers_factory_t::get_writers_type (const std::string &n)
{
    taint_format_t format = taint_format_t::SIMPLE;
    if (n == "json")
        format = taint_format_t::JSON;
    return format;
}

bool known_taint_format (const std::string &format)
{
    return (format == "simple" || format == "json");
}

}  // namespace taint_model
}  // namespace Taintspec

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
