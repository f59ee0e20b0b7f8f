// tests/unit/test_libssh_transport.cpp - connect error classification
// libssh only reports negotiation failures as text, so the mapping is worth pinning down

#include "sshpool/libssh_transport.hpp"

#include <doctest/doctest.h>

#include <cstdint>
#include <string_view>
#include <vector>

using sshpool::error;
using sshpool::transport::classify_connect_error;

TEST_SUITE("libssh_transport")
{
    TEST_CASE("no common kex algorithm")
    {
        CHECK(classify_connect_error("kex error : no match for method kex algos: server [diffie-hellman-group1-sha1], "
                                     "client [curve25519-sha256]") == error::no_common_kex_algorithm);
    }

    TEST_CASE("no common host key algorithm")
    {
        CHECK(classify_connect_error("kex error : no match for method server host key algo: server [ssh-rsa], "
                                     "client [ssh-ed25519,rsa-sha2-512]") == error::no_common_key_algorithm);
    }

    TEST_CASE("no common cipher")
    {
        CHECK(classify_connect_error("kex error : no match for method encryption client->server: server "
                                     "[aes128-cbc], client [aes256-gcm@openssh.com]") == error::no_common_cipher);
    }

    TEST_CASE("other key exchange failures")
    {
        CHECK(classify_connect_error("ssh_packet_kexinit: Invalid kexinit packet") == error::kex_init);
    }

    TEST_CASE("timeouts")
    {
        CHECK(classify_connect_error("Timeout connecting to 192.0.2.10") == error::timeout);
    }

    TEST_CASE("everything else is a plain connection failure")
    {
        CHECK(classify_connect_error("Connection refused") == error::connection_failed);
        CHECK(classify_connect_error("") == error::connection_failed);
    }
}

TEST_SUITE("arrival_buffer")
{
    using sshpool::transport::arrival_buffer;

    auto bytes(std::string_view text) -> std::vector<std::uint8_t>
    {
        return {text.begin(), text.end()};
    }

    TEST_CASE("stderr that arrived first is delivered first")
    {
        arrival_buffer buffer;
        buffer.append(1, bytes("A"));
        buffer.append(0, bytes("B"));

        auto first = buffer.pop();
        REQUIRE(first.has_value());
        CHECK(first->ext == 1);
        CHECK(first->bytes == bytes("A"));

        auto second = buffer.pop();
        REQUIRE(second.has_value());
        CHECK(second->ext == 0);
        CHECK(second->bytes == bytes("B"));

        CHECK_FALSE(buffer.pop().has_value());
    }

    TEST_CASE("adjacent chunks of one stream are merged, interleaving is kept")
    {
        arrival_buffer buffer;
        buffer.append(0, bytes("line 1\n"));
        buffer.append(0, bytes("line 2\n"));
        buffer.append(1, bytes("warning\n"));
        buffer.append(0, bytes("line 3\n"));

        auto chunk = buffer.pop();
        REQUIRE(chunk.has_value());
        CHECK(chunk->ext == 0);
        CHECK(chunk->bytes == bytes("line 1\nline 2\n"));

        chunk = buffer.pop();
        REQUIRE(chunk.has_value());
        CHECK(chunk->ext == 1);

        chunk = buffer.pop();
        REQUIRE(chunk.has_value());
        CHECK(chunk->bytes == bytes("line 3\n"));
        CHECK(buffer.empty());
    }

    TEST_CASE("empty chunks are ignored")
    {
        arrival_buffer buffer;
        buffer.append(1, {});
        CHECK(buffer.empty());
    }
}
