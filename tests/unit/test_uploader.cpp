// tests/unit/test_uploader.cpp - plan + connect + execute, and the error vocabulary

#include "../common/memory_transport.hpp"
#include "../common/test_helpers.hpp"
#include "arkv/uploader.hpp"

#include <doctest/doctest.h>

#include <fmt/format.h>

#include <memory>

using arkv::testing::make_memory_factory;
using arkv::testing::recording_sink;
using arkv::testing::remote_fs;
using arkv::testing::temp_dir;
using arkv::testing::test_destination;
using arkv::testing::write_file;

TEST_SUITE("uploader")
{
    TEST_CASE("upload plans and runs against the destination")
    {
        temp_dir tmp;
        write_file(tmp / "docs/a.txt", "alpha");
        write_file(tmp / "docs/sub/b.txt", "bravo");
        auto fs = std::make_shared<remote_fs>();

        arkv::upload_request request;
        request.local_root = tmp / "docs";
        request.destination = test_destination("/srv/backup");

        recording_sink sink;
        auto const summary = arkv::upload(request, make_memory_factory(fs), sink);
        REQUIRE(summary.has_value());
        CHECK(summary->ok());
        CHECK(summary->files_transferred == 2);
        CHECK(fs->text("/srv/backup/docs/sub/b.txt") == "bravo");
        CHECK(fs->disconnects == 1);
    }

    TEST_CASE("pre-flight failures come back before any event")
    {
        temp_dir tmp;
        write_file(tmp / "a.txt", "a");
        auto fs = std::make_shared<remote_fs>();

        arkv::upload_request request;
        request.local_root = tmp / "a.txt";
        request.destination = test_destination();

        SUBCASE("unreachable")
        {
            fs->connect_error = arkv::error_code::host_unreachable;
            recording_sink sink;
            auto const summary = arkv::upload(request, make_memory_factory(fs), sink);
            REQUIRE_FALSE(summary.has_value());
            CHECK(summary.error() == arkv::error_code::host_unreachable);
            CHECK(sink.events.empty());
        }
        SUBCASE("wrong password")
        {
            fs->auth_error = arkv::error_code::auth_failed;
            recording_sink sink;
            auto const summary = arkv::upload(request, make_memory_factory(fs), sink);
            REQUIRE_FALSE(summary.has_value());
            CHECK(summary.error() == arkv::error_code::auth_failed);
            CHECK(sink.events.empty());
        }

        CHECK(fs->contents.empty());
    }

    TEST_CASE("planning errors never open a connection")
    {
        temp_dir tmp;
        auto fs = std::make_shared<remote_fs>();

        arkv::upload_request request;
        request.local_root = tmp / "missing";
        request.destination = test_destination();

        recording_sink sink;
        auto const summary = arkv::upload(request, make_memory_factory(fs), sink);
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error() == arkv::error_code::not_found);
        CHECK(fs->connects == 0);
        CHECK(sink.events.empty());
    }

    TEST_CASE("a shared plan can be executed against several destinations")
    {
        temp_dir tmp;
        write_file(tmp / "docs/a.txt", "alpha");
        auto const plan = arkv::plan_upload(tmp / "docs", "/srv/backup");
        REQUIRE(plan.has_value());

        auto first = std::make_shared<remote_fs>();
        auto second = std::make_shared<remote_fs>();
        arkv::null_sink sink;

        auto const one = arkv::execute_upload(*plan, test_destination(), {}, {}, make_memory_factory(first), sink);
        auto const two = arkv::execute_upload(*plan, test_destination(), {}, {}, make_memory_factory(second), sink);
        REQUIRE(one.has_value());
        REQUIRE(two.has_value());
        CHECK(first->text("/srv/backup/docs/a.txt") == "alpha");
        CHECK(second->text("/srv/backup/docs/a.txt") == "alpha");
    }
}

TEST_SUITE("error_vocabulary")
{
    TEST_CASE("session-level errors are the reconnectable ones")
    {
        CHECK(arkv::is_session_level(arkv::error_code::session_lost));
        CHECK(arkv::is_session_level(arkv::error_code::timeout));
        CHECK_FALSE(arkv::is_session_level(arkv::error_code::remote_io_error));
        CHECK_FALSE(arkv::is_session_level(arkv::error_code::auth_failed));
        CHECK_FALSE(arkv::is_session_level(arkv::error_code::local_io_error));
    }

    TEST_CASE("error codes format by name")
    {
        CHECK(fmt::format("{}", arkv::error_code::path_conflict) == "path_conflict");
        CHECK(fmt::format("{}", arkv::error_code::destination_unknown) == "destination_unknown");
        CHECK(arkv::error_code_formatter::describe(arkv::error_code::host_unreachable) == "host unreachable");
    }

    TEST_CASE("outcomes format with their reason")
    {
        CHECK(fmt::format("{}", arkv::entry_outcome::success()) == "succeeded");
        CHECK(fmt::format("{}", arkv::entry_outcome::skipped(arkv::skip_reason::cancelled)) == "skipped(cancelled)");
        CHECK(fmt::format("{}", arkv::entry_outcome::failed(arkv::error_code::local_io_error)) ==
              "failed(local_io_error)");
    }

    TEST_CASE("outcome equality ignores fields that do not apply")
    {
        auto a = arkv::entry_outcome::success();
        a.error = arkv::error_code::timeout;
        CHECK(a == arkv::entry_outcome::success());
        CHECK_FALSE(arkv::entry_outcome::failed(arkv::error_code::timeout) ==
                    arkv::entry_outcome::failed(arkv::error_code::session_lost));
    }
}
