// tests/unit/test_config.cpp - destination registry parsing and selection

#include "../common/test_helpers.hpp"
#include "arkv/config.hpp"

#include <doctest/doctest.h>

#include <cstdlib>
#include <string>
#include <variant>

using arkv::testing::temp_dir;
using arkv::testing::write_file;

namespace
{

    constexpr auto two_destinations = R"({
        "ssh_key_path": "/keys/id_ed25519",
        "destinations": [
            { "name": "nas", "host": "10.0.0.2", "port": 2222, "username": "me",
              "remote_path": "/volume1/backups", "password": "s3cret" },
            { "name": "offsite", "host": "backup.example.org", "username": "arch",
              "remote_path": "/data" }
        ]
    })";

} // anonymous namespace

TEST_SUITE("config_parsing")
{
    TEST_CASE("well-formed registry")
    {
        auto const config = arkv::parse_config(two_destinations);
        REQUIRE(config.has_value());
        CHECK(config->ssh_key_path == "/keys/id_ed25519");
        REQUIRE(config->destinations.size() == 2);

        auto const &nas = config->destinations[0];
        CHECK(nas.name == "nas");
        CHECK(nas.port == 2222);
        CHECK(nas.password == std::optional<std::string>{"s3cret"});

        auto const &offsite = config->destinations[1];
        CHECK(offsite.port == arkv::constants::default_ssh_port);
        CHECK_FALSE(offsite.password.has_value());
    }

    TEST_CASE("no destinations is still a valid file")
    {
        auto const config = arkv::parse_config(R"({ "ssh_key_path": "/k" })");
        REQUIRE(config.has_value());
        CHECK(config->destinations.empty());
    }

    TEST_CASE("malformed registries are config_invalid")
    {
        CHECK(arkv::parse_config("{ not json").error() == arkv::error_code::config_invalid);
        CHECK(arkv::parse_config("[]").error() == arkv::error_code::config_invalid);
        CHECK(arkv::parse_config(R"({ "destinations": {} })").error() == arkv::error_code::config_invalid);
        CHECK(arkv::parse_config(R"({ "ssh_key_path": 7 })").error() == arkv::error_code::config_invalid);

        // missing host
        CHECK(arkv::parse_config(R"({ "destinations": [ { "name": "a", "username": "u", "remote_path": "/r" } ] })")
                  .error() == arkv::error_code::config_invalid);

        // port out of range
        CHECK(arkv::parse_config(
                  R"({ "destinations": [ { "name": "a", "host": "h", "username": "u", "remote_path": "/r", "port": 70000 } ] })")
                  .error() == arkv::error_code::config_invalid);

        // password of the wrong type
        CHECK(arkv::parse_config(
                  R"({ "destinations": [ { "name": "a", "host": "h", "username": "u", "remote_path": "/r", "password": 1 } ] })")
                  .error() == arkv::error_code::config_invalid);
    }

    TEST_CASE("duplicate names are rejected")
    {
        auto const config = arkv::parse_config(R"({ "destinations": [
            { "name": "a", "host": "h1", "username": "u", "remote_path": "/r" },
            { "name": "a", "host": "h2", "username": "u", "remote_path": "/r" } ] })");
        REQUIRE_FALSE(config.has_value());
        CHECK(config.error() == arkv::error_code::config_invalid);
    }

    TEST_CASE("null password means key auth")
    {
        auto const config = arkv::parse_config(
            R"({ "destinations": [ { "name": "a", "host": "h", "username": "u", "remote_path": "/r", "password": null } ] })");
        REQUIRE(config.has_value());
        CHECK_FALSE(config->destinations[0].password.has_value());
    }
}

TEST_SUITE("config_loading")
{
    TEST_CASE("missing file is not an error")
    {
        temp_dir tmp;
        auto const loaded = arkv::load_config(tmp / "config.json");
        REQUIRE(loaded.has_value());
        CHECK_FALSE(loaded->has_value());
    }

    TEST_CASE("file on disk is parsed")
    {
        temp_dir tmp;
        write_file(tmp / "config.json", two_destinations);

        auto const loaded = arkv::load_config(tmp / "config.json");
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        CHECK((*loaded)->destinations.size() == 2);
    }

    TEST_CASE("malformed file surfaces config_invalid")
    {
        temp_dir tmp;
        write_file(tmp / "config.json", "{ \"destinations\": [ 1 ] }");

        auto const loaded = arkv::load_config(tmp / "config.json");
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == arkv::error_code::config_invalid);
    }

    TEST_CASE("a directory is not a readable config")
    {
        temp_dir tmp;
        auto const loaded = arkv::load_config(tmp.path());
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == arkv::error_code::config_unreadable);
    }

    TEST_CASE("home expansion")
    {
        auto const *home = std::getenv("HOME");
        if (home == nullptr || *home == '\0')
        {
            return;
        }
        CHECK(arkv::expand_home("~/.ssh/id_rsa") == std::filesystem::path{std::string{home} + "/.ssh/id_rsa"});
        CHECK(arkv::expand_home("/abs/path") == "/abs/path");
        CHECK(arkv::expand_home("~other/x") == "~other/x");
        CHECK(arkv::default_config_path().value() == std::filesystem::path{home} / ".config/arkv/config.json");
    }
}

TEST_SUITE("destination_selection")
{
    TEST_CASE("no names selects every destination in order")
    {
        auto const config = arkv::parse_config(two_destinations);
        REQUIRE(config.has_value());

        auto const selected = arkv::select_destinations(*config, {});
        REQUIRE(selected.has_value());
        REQUIRE(selected->size() == 2);
        CHECK((*selected)[0].name == "nas");
        CHECK((*selected)[1].name == "offsite");
    }

    TEST_CASE("credentials resolve to password or key auth")
    {
        auto const config = arkv::parse_config(two_destinations);
        REQUIRE(config.has_value());

        auto const nas = arkv::resolve_destination(*config, config->destinations[0]);
        CHECK(nas.host == "10.0.0.2");
        CHECK(nas.port == 2222);
        CHECK(nas.remote_base == "/volume1/backups");
        REQUIRE(nas.uses_password());
        CHECK(std::get<arkv::password_auth>(nas.auth).secret == "s3cret");

        auto const offsite = arkv::resolve_destination(*config, config->destinations[1]);
        REQUIRE_FALSE(offsite.uses_password());
        CHECK(std::get<arkv::key_auth>(offsite.auth).private_key_path == "/keys/id_ed25519");
    }

    TEST_CASE("named selection keeps the requested order")
    {
        auto const config = arkv::parse_config(two_destinations);
        REQUIRE(config.has_value());

        auto const selected = arkv::select_destinations(*config, {"offsite", "nas"});
        REQUIRE(selected.has_value());
        REQUIRE(selected->size() == 2);
        CHECK((*selected)[0].name == "offsite");
        CHECK((*selected)[1].name == "nas");
    }

    TEST_CASE("unknown name is destination_unknown")
    {
        auto const config = arkv::parse_config(two_destinations);
        REQUIRE(config.has_value());

        auto const selected = arkv::select_destinations(*config, {"nas", "moon"});
        REQUIRE_FALSE(selected.has_value());
        CHECK(selected.error() == arkv::error_code::destination_unknown);
    }
}
