#include <catch2/catch_test_macros.hpp>
#include "tools/check_config.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "test_support.hpp"
#include <filesystem>

using namespace sshmcp;
using namespace sshmcp_test;

static ToolResult run_check(const Config& cfg, const nlohmann::json& args) {
    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<CheckConfigTool>(cfg));
    Dispatcher d(std::move(tools));
    return d.dispatch({"check_ssh_config", args});
}

// ── group_config_blocks ──────────────────────────────────────────

TEST_CASE("group_config_blocks: options attach to the preceding block", "[check_config]") {
    auto blocks = group_config_blocks(parse_ssh_config(
        "AddKeysToAgent yes\n"
        "\n"
        "Host web web.example.com\n"
        "    User deploy\n"
        "    Port 2222\n"
        "Match host *.internal exec \"true\"\n"
        "    ProxyJump bastion\n"));

    REQUIRE(blocks.size() == 3);
    REQUIRE(blocks[0].kind == "global");
    REQUIRE(blocks[0].line == 0);
    REQUIRE(blocks[0].options.size() == 1);

    REQUIRE(blocks[1].kind == "host");
    REQUIRE(blocks[1].line == 3);
    REQUIRE(blocks[1].patterns == std::vector<std::string>{"web", "web.example.com"});
    REQUIRE(blocks[1].options.size() == 2);
    REQUIRE(blocks[1].options[1].keyword == "port");
    REQUIRE(blocks[1].options[1].value == "2222");

    REQUIRE(blocks[2].kind == "match");
    REQUIRE(blocks[2].patterns.front() == "host");
    REQUIRE(blocks[2].options[0].line == 7);
}

TEST_CASE("group_config_blocks: no global block without global options", "[check_config]") {
    auto blocks = group_config_blocks(parse_ssh_config("# comment\nHost *\n"));
    REQUIRE(blocks.size() == 1);
    REQUIRE(blocks[0].kind == "host");
    REQUIRE(blocks[0].options.empty());

    REQUIRE(group_config_blocks({}).empty());
}

// ── CheckConfigTool ──────────────────────────────────────────────

TEST_CASE("CheckConfigTool: summarizes config and key directory", "[check_config]") {
    auto dir = make_temp_dir();
    write_file(dir + "/config",
               "Host db\n    HostName 10.0.0.5\n    User admin\n"
               "Host *\n    ServerAliveInterval 60\n", 0600);
    write_file(dir + "/id_ed25519.pub", "ssh-ed25519 AAAA me\n", 0644);
    std::filesystem::create_directory(dir + "/sockets");

    Config cfg;
    cfg.ssh.key_directory = dir;
    auto result = run_check(cfg, {{"config_file", dir + "/config"}});
    REQUIRE(result.ok());
    const auto& p = result.payload();
    REQUIRE(p["exists"] == true);
    REQUIRE(p["mode"] == "0600");
    REQUIRE(p["permissions_ok"] == true);
    REQUIRE(p["directive_count"] == 5);
    REQUIRE(p["host_count"] == 2);
    REQUIRE(p["blocks"][0]["patterns"] == nlohmann::json::array({"db"}));
    REQUIRE(p["blocks"][0]["options"][0]["keyword"] == "hostname");
    REQUIRE_FALSE(p.contains("content"));

    const auto& keys = p["key_directory"];
    REQUIRE(keys["exists"] == true);
    // Sorted, regular files only
    REQUIRE(keys["files"].size() == 2);
    REQUIRE(keys["files"][0]["name"] == "config");
    REQUIRE(keys["files"][1]["name"] == "id_ed25519.pub");
    REQUIRE(keys["files"][1]["mode"] == "0644");
    REQUIRE(keys["files"][1]["size"] == 20);

    std::filesystem::remove_all(dir);
}

TEST_CASE("CheckConfigTool: group-writable config is flagged", "[check_config]") {
    auto dir = make_temp_dir();
    write_file(dir + "/config", "Host *\n", 0664);

    Config cfg;
    cfg.ssh.key_directory = dir;
    auto result = run_check(cfg, {{"config_file", dir + "/config"}});
    REQUIRE(result.ok());
    REQUIRE(result.payload()["mode"] == "0664");
    REQUIRE(result.payload()["permissions_ok"] == false);

    std::filesystem::remove_all(dir);
}

TEST_CASE("CheckConfigTool: missing config is not an error", "[check_config]") {
    auto dir = make_temp_dir();
    Config cfg;
    cfg.ssh.client_config = dir + "/config";
    cfg.ssh.key_directory = dir + "/nope";

    auto result = run_check(cfg, {});
    REQUIRE(result.ok());
    const auto& p = result.payload();
    REQUIRE(p["config_file"] == dir + "/config");
    REQUIRE(p["exists"] == false);
    REQUIRE(p["host_count"] == 0);
    REQUIRE(p["blocks"].empty());
    REQUIRE(p["key_directory"]["exists"] == false);

    std::filesystem::remove_all(dir);
}

TEST_CASE("CheckConfigTool: a directory is not a config file", "[check_config]") {
    auto dir = make_temp_dir();
    Config cfg;
    auto result = run_check(cfg, {{"config_file", dir}});
    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error().kind == ErrorKind::InvalidInput);

    std::filesystem::remove_all(dir);
}
