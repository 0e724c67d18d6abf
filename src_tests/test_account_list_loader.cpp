/**
 * @file test_account_list_loader.cpp
 * @brief Account list reading and creation
 */

#include <catch2/catch_test_macros.hpp>

#include "vpncheck_engine/account_list_loader.hpp"
#include "vpncheck_engine/errors.hpp"

#include "test_support.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

using vpncheck::engine::AccountListLoader;
using vpncheck::engine::ConfigError;
using vpncheck_test::TempDir;

TEST_CASE("AccountListLoader trims lines and drops blanks", "[accounts]") {
    const AccountListLoader loader;
    std::istringstream input("  1111  \n\n2222\r\n\t\n3333\n1111\n");

    CHECK(loader.load(input) == std::vector<std::string>{"1111", "2222", "3333", "1111"});
}

TEST_CASE("AccountListLoader reads files", "[accounts]") {
    TempDir dir("accounts");
    const auto file = dir / "nullvad_in.txt";
    {
        std::ofstream out(file);
        out << "1111\n2222";
    }

    const AccountListLoader loader;
    CHECK(loader.load(file) == std::vector<std::string>{"1111", "2222"});
}

TEST_CASE("AccountListLoader reports unusable paths as ConfigError", "[accounts]") {
    TempDir dir("accounts_bad");
    const AccountListLoader loader;

    CHECK_THROWS_AS(loader.load(dir / "missing.txt"), ConfigError);
    CHECK_THROWS_AS(loader.load(dir.path()), ConfigError);
}

TEST_CASE("AccountListLoader::ensure_exists creates an empty list once", "[accounts]") {
    TempDir dir("accounts_create");
    const auto file = dir / "data/nullvad_in.txt";
    const AccountListLoader loader;

    loader.ensure_exists(file);
    REQUIRE(std::filesystem::is_regular_file(file));
    CHECK(loader.load(file).empty());

    {
        std::ofstream out(file);
        out << "9999\n";
    }
    loader.ensure_exists(file);
    CHECK(loader.load(file) == std::vector<std::string>{"9999"});
}
