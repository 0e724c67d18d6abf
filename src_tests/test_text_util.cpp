/**
 * @file test_text_util.cpp
 * @brief Shared string helpers used by the loaders and the validator
 */

#include <catch2/catch_test_macros.hpp>

#include "vpncheck_engine/text_util.hpp"

using vpncheck::engine::is_blank;
using vpncheck::engine::to_lower_copy;
using vpncheck::engine::trim_copy;

TEST_CASE("trim_copy strips surrounding whitespace only", "[text]") {
    CHECK(trim_copy("  1234 5678\t\r\n") == "1234 5678");
    CHECK(trim_copy("\f\vproxy = host\v") == "proxy = host");
    CHECK(trim_copy("plain") == "plain");
    CHECK(trim_copy(" \t\n").empty());
    CHECK(trim_copy("").empty());
}

TEST_CASE("to_lower_copy lowers ASCII letters and keeps the rest", "[text]") {
    CHECK(to_lower_copy("SOCKS5") == "socks5");
    CHECK(to_lower_copy("Use_Proxy=TRUE") == "use_proxy=true");
    CHECK(to_lower_copy("").empty());
}

TEST_CASE("is_blank accepts empty and whitespace-only input", "[text]") {
    CHECK(is_blank(""));
    CHECK(is_blank("   \t"));
    CHECK(is_blank("\r\n"));
    CHECK_FALSE(is_blank(" 1 "));
}
