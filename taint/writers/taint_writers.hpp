/*****************************************************************************\
 * Copyright 2024 Lawrence Livermore National Security, LLC
 * (c.f. AUTHORS, NOTICE.LLNS, LICENSE)
 *
 * This file is part of the Flux resource manager framework.
 * For details, see https://github.com/flux-framework.
 *
 * SPDX-License-Identifier: LGPL-3.0
\*****************************************************************************/

#ifndef TAINT_WRITERS_HPP
#define TAINT_WRITERS_HPP

#include <memory>
#include <string>
#include <sstream>
#include <vector>

extern "C" {
#include <jansson.h>
}

#include "taint/libtaint/taint.hpp"

namespace Taintspec {
namespace taint_model {

enum class taint_format_t { SIMPLE, JSON };

/*! Base writers class for a taint parse or edit result
 */
class taint_writers_t {
   public:
    virtual ~taint_writers_t ()
    {
    }
    virtual bool empty () = 0;
    virtual int emit_json (json_t **o) = 0;
    virtual int emit (std::stringstream &out) = 0;

    /*! Record a taint to add */
    virtual int emit_add (const taint_t &taint) = 0;

    /*! Record a selector of taints to remove */
    virtual int emit_remove (const taint_selector_t &selector) = 0;

    /*! Record a whole edited taint list.  Once called, the writers
     *  emit the edited list in place of any recorded additions and
     *  removals, even when the list is empty.
     */
    virtual int emit_edited (const std::vector<taint_t> &taints) = 0;
};

/*! Simple writers class: one line per entry
 */
class sim_taint_writers_t : public taint_writers_t {
   public:
    virtual ~sim_taint_writers_t ()
    {
    }
    virtual bool empty ();
    virtual int emit_json (json_t **o);
    virtual int emit (std::stringstream &out);
    virtual int emit_add (const taint_t &taint);
    virtual int emit_remove (const taint_selector_t &selector);
    virtual int emit_edited (const std::vector<taint_t> &taints);

   private:
    std::stringstream m_out;
    std::stringstream m_edited_out;
    bool m_edited = false;
};

/*! JSON writers class: {"add": [...], "remove": [...]}, or
 *  {"taints": [...]} once an edited taint list was recorded.
 */
class json_taint_writers_t : public taint_writers_t {
   public:
    json_taint_writers_t ();
    json_taint_writers_t (const json_taint_writers_t &w);
    json_taint_writers_t &operator= (const json_taint_writers_t &w);
    virtual ~json_taint_writers_t ();

    virtual bool empty ();
    virtual int emit_json (json_t **o);
    virtual int emit (std::stringstream &out);
    virtual int emit_add (const taint_t &taint);
    virtual int emit_remove (const taint_selector_t &selector);
    virtual int emit_edited (const std::vector<taint_t> &taints);

   private:
    json_t *taint_to_json (const taint_t &taint);
    int alloc_json_arrays ();
    void free_json_arrays ();

    json_t *m_add = NULL;
    json_t *m_remove = NULL;
    json_t *m_taints = NULL;
    bool m_edited = false;
};

class taint_writers_factory_t {
   public:
    static taint_format_t get_writers_type (const std::string &n);
    static std::shared_ptr<taint_writers_t> create (taint_format_t f);
};

bool known_taint_format (const std::string &format);

}  // namespace taint_model
}  // namespace Taintspec

#endif  // TAINT_WRITERS_HPP

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
