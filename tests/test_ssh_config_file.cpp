#include <catch2/catch_test_macros.hpp>
#include "ssh_config_file.hpp"

using namespace sshmcp;

TEST_CASE("parse_ssh_config: keyword and value", "[ssh_config]") {
    auto d = parse_ssh_config("PasswordAuthentication yes\n");
    REQUIRE(d.size() == 1);
    REQUIRE(d[0].keyword == "passwordauthentication");
    REQUIRE(d[0].value == "yes");
    REQUIRE(d[0].line == 1);
}

TEST_CASE("parse_ssh_config: skips comments and blank lines", "[ssh_config]") {
    auto d = parse_ssh_config(
        "# global settings\n"
        "\n"
        "   # indented comment\n"
        "Port 2222\n");
    REQUIRE(d.size() == 1);
    REQUIRE(d[0].keyword == "port");
    REQUIRE(d[0].line == 4);
}

TEST_CASE("parse_ssh_config: equals separator forms", "[ssh_config]") {
    auto d = parse_ssh_config(
        "Ciphers=aes128-cbc,aes256-ctr\n"
        "MACs = hmac-md5\n"
        "KexAlgorithms\t=\tcurve25519-sha256\n");
    REQUIRE(d.size() == 3);
    REQUIRE(d[0].keyword == "ciphers");
    REQUIRE(d[0].value == "aes128-cbc,aes256-ctr");
    REQUIRE(d[1].keyword == "macs");
    REQUIRE(d[1].value == "hmac-md5");
    REQUIRE(d[2].value == "curve25519-sha256");
}

TEST_CASE("parse_ssh_config: quoted values lose their quotes", "[ssh_config]") {
    auto d = parse_ssh_config("IdentityFile \"/home/a b/.ssh/id\"\n");
    REQUIRE(d.size() == 1);
    REQUIRE(d[0].value == "/home/a b/.ssh/id");
}

TEST_CASE("parse_ssh_config: Host blocks are ordinary directives", "[ssh_config]") {
    auto d = parse_ssh_config(
        "Host web\n"
        "    StrictHostKeyChecking no\r\n");
    REQUIRE(d.size() == 2);
    REQUIRE(d[0].keyword == "host");
    REQUIRE(d[0].value == "web");
    REQUIRE(d[1].keyword == "stricthostkeychecking");
    REQUIRE(d[1].value == "no");
    REQUIRE(d[1].line == 2);
}
