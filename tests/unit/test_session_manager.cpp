// tests/unit/test_session_manager.cpp - connect, auth, channel, single reconnect

#include "../common/memory_transport.hpp"
#include "../common/test_helpers.hpp"
#include "arkv/session_manager.hpp"

#include <doctest/doctest.h>

#include <memory>

using arkv::testing::make_memory_factory;
using arkv::testing::remote_fs;
using arkv::testing::test_destination;

TEST_SUITE("session_manager")
{
    TEST_CASE("connect opens an authenticated session")
    {
        auto fs = std::make_shared<remote_fs>();
        arkv::session_manager sessions{make_memory_factory(fs)};

        REQUIRE(sessions.connect(test_destination()).has_value());
        REQUIRE(sessions.has_session());
        CHECK(sessions.current().is_open());
        CHECK(fs->connects == 1);
        CHECK(sessions.can_reconnect());
    }

    TEST_CASE("pre-flight failures are reported by kind")
    {
        auto fs = std::make_shared<remote_fs>();
        arkv::session_manager sessions{make_memory_factory(fs)};

        SUBCASE("unreachable host")
        {
            fs->connect_error = arkv::error_code::host_unreachable;
            CHECK(sessions.connect(test_destination()).error() == arkv::error_code::host_unreachable);
        }
        SUBCASE("bad handshake")
        {
            fs->connect_error = arkv::error_code::handshake_error;
            CHECK(sessions.connect(test_destination()).error() == arkv::error_code::handshake_error);
        }
        SUBCASE("rejected credentials")
        {
            fs->auth_error = arkv::error_code::auth_failed;
            CHECK(sessions.connect(test_destination()).error() == arkv::error_code::auth_failed);
            CHECK(fs->disconnects == 1);
        }
        SUBCASE("sftp subsystem unavailable")
        {
            fs->channel_error = arkv::error_code::handshake_error;
            CHECK(sessions.connect(test_destination()).error() == arkv::error_code::handshake_error);
            CHECK(fs->disconnects == 1);
        }

        CHECK_FALSE(sessions.has_session());
    }

    TEST_CASE("missing factory is a handshake_error")
    {
        arkv::session_manager sessions{arkv::transport_factory{}};
        CHECK(sessions.connect(test_destination()).error() == arkv::error_code::handshake_error);
    }

    TEST_CASE("reconnect is allowed exactly once")
    {
        auto fs = std::make_shared<remote_fs>();
        arkv::session_manager sessions{make_memory_factory(fs)};
        REQUIRE(sessions.connect(test_destination()).has_value());

        REQUIRE(sessions.reconnect().has_value());
        CHECK(sessions.reconnects_used() == 1);
        CHECK(sessions.current().is_open());
        CHECK(fs->connects == 2);
        CHECK(fs->disconnects == 1);

        CHECK_FALSE(sessions.can_reconnect());
        CHECK(sessions.reconnect().error() == arkv::error_code::session_lost);
        CHECK(fs->connects == 2);
    }

    TEST_CASE("failed reconnect leaves no session")
    {
        auto fs = std::make_shared<remote_fs>();
        fs->connects_allowed = 1;
        arkv::session_manager sessions{make_memory_factory(fs)};
        REQUIRE(sessions.connect(test_destination()).has_value());

        CHECK(sessions.reconnect().error() == arkv::error_code::host_unreachable);
        CHECK_FALSE(sessions.has_session());
    }

    TEST_CASE("reconnect without a prior connect is session_lost")
    {
        arkv::session_manager sessions{make_memory_factory(std::make_shared<remote_fs>())};
        CHECK_FALSE(sessions.can_reconnect());
        CHECK(sessions.reconnect().error() == arkv::error_code::session_lost);
    }

    TEST_CASE("a new connect resets the reconnect budget")
    {
        auto fs = std::make_shared<remote_fs>();
        arkv::session_manager sessions{make_memory_factory(fs)};
        REQUIRE(sessions.connect(test_destination()).has_value());
        REQUIRE(sessions.reconnect().has_value());
        CHECK_FALSE(sessions.can_reconnect());

        REQUIRE(sessions.connect(test_destination()).has_value());
        CHECK(sessions.reconnects_used() == 0);
        CHECK(sessions.can_reconnect());
    }

    TEST_CASE("close and destruction disconnect")
    {
        auto fs = std::make_shared<remote_fs>();
        {
            arkv::session_manager sessions{make_memory_factory(fs)};
            REQUIRE(sessions.connect(test_destination()).has_value());
            sessions.close();
            CHECK_FALSE(sessions.has_session());
            CHECK(fs->disconnects == 1);

            REQUIRE(sessions.connect(test_destination()).has_value());
        }
        CHECK(fs->disconnects == 2);
    }
}

TEST_SUITE("destination_context")
{
    TEST_CASE("formatting never shows the credential")
    {
        auto const ctx = test_destination();
        auto const text = fmt::format("{}", ctx);
        CHECK(text == "test (tester@127.0.0.1:22)");
        CHECK(text.find("hunter2") == std::string::npos);
        CHECK(ctx.uses_password());
    }

    TEST_CASE("unnamed destinations format as user@host:port")
    {
        auto ctx = test_destination();
        ctx.name.clear();
        ctx.port = 2222;
        CHECK(fmt::format("{}", ctx) == "tester@127.0.0.1:2222");
    }
}
