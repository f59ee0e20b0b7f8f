// tests/unit/test_devmode.cpp - developer mode token probe

#include "mock_transport.hpp"
#include "sshpool/devmode.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

using namespace sshpool;
using namespace sshpool::testing;

namespace
{

    auto token_file_contains(mock_world &world, std::string content) -> void
    {
        world.set_on_exec(
            [content = std::move(content)](std::string const &command)
            {
                CHECK(command == "cat /var/luna/preferences/devmode_enabled");
                return exec_script{.accept = true,
                                   .events = {data_event(content), transport::event::eof{}, transport::event::closed{}}};
            });
    }

} // anonymous namespace

TEST_SUITE("devmode")
{
    TEST_CASE("token validation")
    {
        CHECK(devmode::is_valid_token("A1b2C3d4"));
        CHECK(devmode::is_valid_token("0"));

        CHECK_FALSE(devmode::is_valid_token(""));
        CHECK_FALSE(devmode::is_valid_token("abc def"));
        CHECK_FALSE(devmode::is_valid_token("abc\n"));
        CHECK_FALSE(devmode::is_valid_token("abc-123"));
        CHECK_FALSE(devmode::is_valid_token("cat: can't open"));
    }

    TEST_CASE("a valid token file is returned as is")
    {
        manager_fixture fx;
        token_file_contains(*fx.world, "5F3C9A1B");

        auto const token = devmode::token(fx.manager, test_device("tv"));
        REQUIRE(token.has_value());
        CHECK(*token == "5F3C9A1B");
    }

    TEST_CASE("garbage in the token file means no token")
    {
        manager_fixture fx;
        token_file_contains(*fx.world, "not a token");

        auto const read = devmode::read_token(fx.manager, test_device("tv"));
        REQUIRE(read.has_value());
        CHECK_FALSE(read->has_value());

        auto const token = devmode::token(fx.manager, test_device("tv"));
        REQUIRE_FALSE(token.has_value());
        CHECK(token.error() == error::unsupported);
    }

    TEST_CASE("only the developer mode account has a token")
    {
        manager_fixture fx;
        token_file_contains(*fx.world, "5F3C9A1B");
        auto dev = test_device("tv");
        dev.username = "root";

        auto const token = devmode::token(fx.manager, dev);
        REQUIRE_FALSE(token.has_value());
        CHECK(token.error() == error::unsupported);
        CHECK(fx.world->connect_attempts() == 0);
    }

    TEST_CASE("transport errors propagate")
    {
        manager_fixture fx;
        fx.world->fail_next_connect(error::connection_failed);

        auto const token = devmode::token(fx.manager, test_device("tv"));
        REQUIRE_FALSE(token.has_value());
        CHECK(token.error() == error::connection_failed);
    }
}
