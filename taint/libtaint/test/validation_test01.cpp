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

#include <string>
#include <vector>
#include <catch2/catch.hpp>

#include "taint/libtaint/validation.hpp"

using namespace Taintspec::validation;

TEST_CASE ("is_qualified_name: good names", "[validation]")
{
    std::vector<std::string> good = {"simple",
                                     "now-with-dashes",
                                     "1-starts-with-num",
                                     "1234",
                                     "simple/simple",
                                     "now-with-dashes/simple",
                                     "now-with-dashes/now-with-dashes",
                                     "now.with.dots/now-with-dashes",
                                     "now-with.dashes-and.dots/now_with_underscores",
                                     "Upper.Case.Name",
                                     "a",
                                     std::string (63, 'a'),
                                     std::string (253, 'a') + "/a"};
    for (const auto &name : good) {
        INFO (name);
        CHECK (is_qualified_name (name).empty ());
    }
}

TEST_CASE ("is_qualified_name: bad names", "[validation]")
{
    std::vector<std::string> bad = {"",
                                    "/simple",
                                    "simple/",
                                    "a/b/c",
                                    "nospecialchars%^=@",
                                    "cantendwithadash-",
                                    "-cantstartwithadash",
                                    ".cantstartwithadot",
                                    "cantendwithadot.",
                                    "only/one/slash",
                                    "Example.com/abc",
                                    "example_com/abc",
                                    "example.com/",
                                    std::string (64, 'a'),
                                    std::string (254, 'a') + "/abc"};
    for (const auto &name : bad) {
        INFO (name);
        CHECK_FALSE (is_qualified_name (name).empty ());
    }
}

TEST_CASE ("is_qualified_name: messages", "[validation]")
{
    std::vector<std::string> errs;

    errs = is_qualified_name (std::string (64, 'a'));
    REQUIRE (errs.size () == 1);
    CHECK (errs[0] == "name part must be no more than 63 characters");

    errs = is_qualified_name ("/abc");
    REQUIRE (errs.size () == 1);
    CHECK (errs[0] == "prefix part must be non-empty");

    errs = is_qualified_name ("abc/");
    REQUIRE (errs.size () == 2);
    CHECK (errs[0] == "name part must be non-empty");
    CHECK (errs[1].find ("name part must consist of alphanumeric characters") == 0);

    errs = is_qualified_name ("Example.com/abc");
    REQUIRE (errs.size () == 1);
    CHECK (errs[0].find ("prefix part a lowercase RFC 1123 subdomain") == 0);

    errs = is_qualified_name ("a/b/c");
    REQUIRE (errs.size () == 1);
    CHECK (errs[0].find ("a qualified name must consist of") == 0);
}

TEST_CASE ("is_valid_label_value: good and bad values", "[validation]")
{
    std::vector<std::string> good = {"",
                                     "simple",
                                     "now-with-dashes",
                                     "1-starts-with-num",
                                     "end-with-num-1",
                                     "1234",
                                     std::string (63, 'a')};
    std::vector<std::string> bad = {"nospecialchars%^=@",
                                    "Tama-nui-te-r\xc4\x81.is.M\xc4\x81ori.sun",
                                    "\\backslashes\\are\\bad",
                                    "-starts-with-dash",
                                    "ends-with-dash-",
                                    ".starts.with.dot",
                                    "ends.with.dot.",
                                    "has/slash",
                                    std::string (64, 'a')};
    for (const auto &value : good) {
        INFO (value);
        CHECK (is_valid_label_value (value).empty ());
    }
    for (const auto &value : bad) {
        INFO (value);
        CHECK_FALSE (is_valid_label_value (value).empty ());
    }
    std::vector<std::string> errs = is_valid_label_value (std::string (64, 'a'));
    REQUIRE (errs.size () == 1);
    CHECK (errs[0] == "must be no more than 63 characters");
}

TEST_CASE ("is_dns1123_subdomain: labels", "[validation]")
{
    CHECK (is_dns1123_subdomain ("example.com").empty ());
    CHECK (is_dns1123_subdomain ("a-b.c-d.e").empty ());
    CHECK (is_dns1123_subdomain ("0.1.2").empty ());
    CHECK_FALSE (is_dns1123_subdomain ("").empty ());
    CHECK_FALSE (is_dns1123_subdomain ("example..com").empty ());
    CHECK_FALSE (is_dns1123_subdomain ("-example.com").empty ());
    CHECK_FALSE (is_dns1123_subdomain ("example-.com").empty ());
    CHECK_FALSE (is_dns1123_subdomain ("under_score.com").empty ());
    CHECK_FALSE (is_dns1123_subdomain ("UPPER.com").empty ());
    CHECK_FALSE (is_dns1123_subdomain (std::string (254, 'a')).empty ());
}

/*
 * vi:tabstop=4 shiftwidth=4 expandtab
 */
