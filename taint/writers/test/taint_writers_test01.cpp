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
#include <config.h>
#endif
}

#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include <catch2/catch.hpp>

#include "taint/writers/taint_writers.hpp"

using namespace Taintspec::taint_model;

TEST_CASE ("taint writers factory", "[taint_writers]")
{
    CHECK (known_taint_format ("simple"));
    CHECK (known_taint_format ("json"));
    CHECK_FALSE (known_taint_format ("jgf"));
    CHECK (taint_writers_factory_t::get_writers_type ("json") == taint_format_t::JSON);
    CHECK (taint_writers_factory_t::get_writers_type ("simple") == taint_format_t::SIMPLE);
    CHECK (taint_writers_factory_t::create (taint_format_t::SIMPLE) != nullptr);
    CHECK (taint_writers_factory_t::create (taint_format_t::JSON) != nullptr);
}

TEST_CASE ("simple writers emit one line per entry", "[taint_writers]")
{
    std::stringstream out;
    std::shared_ptr<taint_writers_t> w = taint_writers_factory_t::create (taint_format_t::SIMPLE);
    REQUIRE (w != nullptr);
    CHECK (w->empty ());

    CHECK (w->emit_add (taint_t{"foo", "abc", taint_effect_t::NO_SCHEDULE}) == 0);
    CHECK (w->emit_add (taint_t{"bar", "", taint_effect_t::NO_EXECUTE}) == 0);
    CHECK (w->emit_remove (taint_selector_t{"baz", taint_effect_t::PREFER_NO_SCHEDULE}) == 0);
    CHECK (w->emit_remove (taint_selector_t{"dedicated", taint_effect_t::UNSPECIFIED}) == 0);
    CHECK_FALSE (w->empty ());

    REQUIRE (w->emit (out) == 0);
    CHECK (out.str ()
           == "add: foo=abc:NoSchedule\n"
              "add: bar=:NoExecute\n"
              "remove: baz:PreferNoSchedule\n"
              "remove: dedicated\n");
    CHECK (w->empty ());

    json_t *o = NULL;
    std::vector<taint_t> edited = {{"maint", "", taint_effect_t::NO_EXECUTE}};
    CHECK (w->emit_edited (edited) == 0);
    REQUIRE (w->emit_json (&o) == 0);
    REQUIRE (json_is_string (o));
    CHECK (std::string (json_string_value (o)) == "taint: maint=:NoExecute\n");
    json_decref (o);
}

TEST_CASE ("simple writers print the edited list in place of the parse result",
           "[taint_writers]")
{
    std::stringstream out;
    sim_taint_writers_t w;
    std::vector<taint_t> edited = {{"dedicated", "gpu", taint_effect_t::NO_SCHEDULE},
                                   {"foo", "", taint_effect_t::NO_SCHEDULE}};

    CHECK (w.emit_add (taint_t{"foo", "", taint_effect_t::NO_SCHEDULE}) == 0);
    CHECK (w.emit_edited (edited) == 0);
    REQUIRE (w.emit (out) == 0);
    CHECK (out.str () == "taint: dedicated=gpu:NoSchedule\ntaint: foo=:NoSchedule\n");
    CHECK (out.str ().find ("add:") == std::string::npos);
    CHECK (w.empty ());

    // an edit that removes everything prints nothing, but is not empty
    CHECK (w.emit_add (taint_t{"foo", "", taint_effect_t::NO_SCHEDULE}) == 0);
    CHECK (w.emit_edited (std::vector<taint_t> ()) == 0);
    CHECK_FALSE (w.empty ());
    out.str ("");
    REQUIRE (w.emit (out) == 0);
    CHECK (out.str ().empty ());
}

TEST_CASE ("json writers emit add and remove arrays", "[taint_writers]")
{
    json_t *o = NULL;
    json_t *add = NULL;
    json_t *remove = NULL;
    const char *key = NULL;
    const char *value = NULL;
    const char *effect = NULL;
    json_taint_writers_t w;

    CHECK (w.emit_add (taint_t{"foo", "abc", taint_effect_t::NO_SCHEDULE}) == 0);
    CHECK (w.emit_remove (taint_selector_t{"bar", taint_effect_t::NO_EXECUTE}) == 0);
    CHECK (w.emit_remove (taint_selector_t{"dedicated", taint_effect_t::UNSPECIFIED}) == 0);
    REQUIRE (w.emit_json (&o) == 0);
    REQUIRE (o != NULL);

    REQUIRE (json_unpack (o, "{s:o s:o}", "add", &add, "remove", &remove) == 0);
    CHECK (json_object_get (o, "taints") == NULL);
    REQUIRE (json_array_size (add) == 1);
    REQUIRE (json_array_size (remove) == 2);

    REQUIRE (json_unpack (json_array_get (add, 0),
                          "{s:s s:s s:s}",
                          "key",
                          &key,
                          "value",
                          &value,
                          "effect",
                          &effect)
             == 0);
    CHECK (std::string (key) == "foo");
    CHECK (std::string (value) == "abc");
    CHECK (std::string (effect) == "NoSchedule");

    REQUIRE (json_unpack (json_array_get (remove, 0), "{s:s s:s}", "key", &key, "effect", &effect)
             == 0);
    CHECK (std::string (key) == "bar");
    CHECK (std::string (effect) == "NoExecute");

    // a removal of every effect carries no effect member
    CHECK (json_object_get (json_array_get (remove, 1), "effect") == NULL);
    json_decref (o);

    // the writers are reset after emitting
    CHECK (w.empty ());
}

TEST_CASE ("json writers emit the edited taint list", "[taint_writers]")
{
    json_t *o = NULL;
    json_t *taints = NULL;
    json_taint_writers_t w;

    std::vector<taint_t> edited = {{"maint", "", taint_effect_t::PREFER_NO_SCHEDULE}};

    CHECK (w.emit_add (taint_t{"foo", "", taint_effect_t::NO_SCHEDULE}) == 0);
    CHECK (w.emit_remove (taint_selector_t{"bar", taint_effect_t::UNSPECIFIED}) == 0);
    CHECK (w.emit_edited (edited) == 0);
    REQUIRE (w.emit_json (&o) == 0);
    REQUIRE ((taints = json_object_get (o, "taints")) != NULL);
    CHECK (json_array_size (taints) == 1);
    CHECK (json_object_size (o) == 1);
    CHECK (json_object_get (o, "add") == NULL);
    CHECK (json_object_get (o, "remove") == NULL);
    json_decref (o);

    // an empty edited list still yields the taints member
    CHECK (w.emit_edited (std::vector<taint_t> ()) == 0);
    REQUIRE (w.emit_json (&o) == 0);
    REQUIRE ((taints = json_object_get (o, "taints")) != NULL);
    CHECK (json_array_size (taints) == 0);
    json_decref (o);
    CHECK (w.empty ());
}

TEST_CASE ("json writers emit a string", "[taint_writers]")
{
    std::stringstream out;
    json_taint_writers_t w;

    CHECK (w.emit_add (taint_t{"foo", "", taint_effect_t::NO_SCHEDULE}) == 0);
    REQUIRE (w.emit (out) == 0);
    CHECK (out.str ().find ("\"key\": \"foo\"") != std::string::npos);
    CHECK (out.str ().back () == '\n');
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
