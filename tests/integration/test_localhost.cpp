// tests/integration/test_localhost.cpp - against a real sshd
// skipped unless SSHPOOL_TEST_HOST is set; SSHPOOL_TEST_PORT, SSHPOOL_TEST_USER,
// SSHPOOL_TEST_PASSWORD and SSHPOOL_TEST_KEY fill in the rest

#include <doctest/doctest.h>
#include "sshpool/libssh_transport.hpp"
#include "sshpool/session_manager.hpp"

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace {

[[nodiscard]] auto env(char const *name) -> std::optional<std::string> {
    if (auto const *value = std::getenv(name); value != nullptr && *value != '\0') {
        return std::string{value};
    }
    return std::nullopt;
}

[[nodiscard]] auto server_configured() -> bool {
    return env("SSHPOOL_TEST_HOST").has_value();
}

[[nodiscard]] auto server_device(std::string name = "integration") -> sshpool::device {
    sshpool::device dev{};
    dev.name = std::move(name);
    dev.host = env("SSHPOOL_TEST_HOST").value_or("127.0.0.1");
    dev.port = static_cast<std::uint16_t>(std::stoul(env("SSHPOOL_TEST_PORT").value_or("22")));
    dev.username = env("SSHPOOL_TEST_USER").value_or("root");
    dev.password = env("SSHPOOL_TEST_PASSWORD");
    if (auto key = env("SSHPOOL_TEST_KEY")) {
        dev.private_key = sshpool::key_file{.path = *key};
    }
    return dev;
}

[[nodiscard]] auto as_text(std::vector<std::uint8_t> const &bytes) -> std::string {
    return {bytes.begin(), bytes.end()};
}

} // anonymous namespace

TEST_SUITE("localhost_integration" * doctest::skip(!server_configured())) {

    TEST_CASE("exec returns stdout") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        auto output = manager.exec(server_device(), "echo hello");
        REQUIRE(output.has_value());
        CHECK(as_text(*output) == "hello\n");
    }

    TEST_CASE("exec forwards stdin") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        std::string const input = "piped through cat";
        auto output = manager.exec(server_device(), "cat", std::vector<std::uint8_t>{input.begin(), input.end()});
        REQUIRE(output.has_value());
        CHECK(as_text(*output) == input);
    }

    TEST_CASE("repeated exec reuses the pooled connection") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        for (int i = 0; i < 3; ++i) {
            REQUIRE(manager.exec(server_device(), "true").has_value());
        }
        CHECK(manager.pooled_connections() == 1);
    }

    TEST_CASE("spawned process streams output and ends") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        auto spawned = manager.spawn(server_device(), "for i in 1 2 3; do echo $i; done");
        REQUIRE(spawned.has_value());

        std::mutex mutex;
        std::string collected;
        (*spawned)->set_callback([&](std::uint32_t ext, std::span<std::uint8_t const> bytes) {
            if (ext == 0) {
                std::lock_guard lock{mutex};
                collected.append(bytes.begin(), bytes.end());
            }
        });
        REQUIRE((*spawned)->start().has_value());
        REQUIRE((*spawned)->wait_closed(std::chrono::seconds{10}));

        std::lock_guard lock{mutex};
        CHECK(collected == "1\n2\n3\n");
    }

    TEST_CASE("a kill signal stops a long running process") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        auto spawned = manager.spawn(server_device(), "sleep 30");
        REQUIRE(spawned.has_value());
        REQUIRE((*spawned)->start().has_value());

        REQUIRE((*spawned)->signal(sshpool::transport::signal::kill).has_value());
        CHECK((*spawned)->wait_closed(std::chrono::seconds{10}));
    }

    TEST_CASE("shell open and close") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        auto opened = manager.shell_open(server_device(), 80, 24);
        REQUIRE(opened.has_value());
        CHECK(manager.shell_list().size() == 1);

        REQUIRE(manager.shell_close((*opened)->token()).has_value());
        CHECK(manager.shell_find((*opened)->token()).error() == sshpool::error::not_found);
    }

    TEST_CASE("wrong password is an authorization error") {
        sshpool::session_manager manager{std::make_shared<sshpool::transport::libssh_connector>()};

        auto dev = server_device("bad-password");
        dev.private_key.reset();
        dev.password = "definitely-not-the-password";

        auto output = manager.exec(dev, "true");
        REQUIRE_FALSE(output.has_value());
        CHECK(output.error() == sshpool::error::authorization);
    }
}
