#include "mcpmux/config.hpp"
#include "mcpmux/exceptions.hpp"
#include "mcpmux/settings.hpp"
#include "mcpmux/util/log.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace mcpmux;

static bool config_error(const std::string& text)
{
    try
    {
        (void)config::parse_server_descriptors(text);
    }
    catch (const ConfigError&)
    {
        return true;
    }
    return false;
}

static void test_wrapped_jsonc()
{
    std::string text = R"({
        // servers used by the assistant
        "mcpServers": {
            "time": {
                "command": ["python", "time_service.py"],
                "env": {"TZ": "Asia/Shanghai", "RETRIES": 3},
                "timeout": 60,
                "cwd": "/srv/tools"
            },
            /* temporarily off */
            "search": {"command": "search-mcp", "disabled": true}
        }
    })";
    auto servers = config::parse_server_descriptors(text);
    assert(servers.size() == 1);
    const auto& d = servers[0];
    assert(d.name == "time");
    assert(d.command == "python");
    assert(d.args.size() == 1 && d.args[0] == "time_service.py");
    assert(d.env.at("TZ") == "Asia/Shanghai");
    assert(d.env.at("RETRIES") == "3");
    assert(d.timeout && d.timeout->count() == 60000);
    assert(d.cwd && *d.cwd == "/srv/tools");
    std::cout << "[PASS] mcpServers wrapper with comments" << std::endl;
}

static void test_bare_map()
{
    std::string text = R"({
        "calc": {"command": "calc-server", "args": ["--stdio"], "timeout": 1.5},
        "files": {"command": ["node", "files.js"], "args": ["--root", "/tmp"]}
    })";
    auto servers = config::parse_server_descriptors(text);
    assert(servers.size() == 2);
    // nlohmann::json objects iterate in key order
    assert(servers[0].name == "calc");
    assert(servers[0].command == "calc-server");
    assert(servers[0].args.size() == 1);
    assert(servers[0].timeout->count() == 1500);
    assert(!servers[0].cwd);
    assert(servers[1].name == "files");
    assert(servers[1].command == "node");
    assert(servers[1].args.size() == 3);
    assert(servers[1].args[0] == "files.js" && servers[1].args[2] == "/tmp");
    assert(!servers[1].timeout);
    std::cout << "[PASS] bare server map" << std::endl;
}

static void test_invalid_entries()
{
    assert(config_error("{ not json"));
    assert(config_error("[]"));
    assert(config_error(R"({"mcpServers": []})"));
    assert(config_error(R"({"a": {"args": []}})"));
    assert(config_error(R"({"a": {"command": ""}})"));
    assert(config_error(R"({"a": {"command": []}})"));
    assert(config_error(R"({"a": {"command": ["x", 1]}})"));
    assert(config_error(R"({"a": {"command": "x", "args": "y"}})"));
    assert(config_error(R"({"a": {"command": "x", "env": {"K": {"nested": 1}}}})"));
    assert(config_error(R"({"a": {"command": "x", "timeout": 0}})"));
    assert(config_error(R"({"a": {"command": "x", "timeout": "10"}})"));
    assert(config_error(R"({"a": {"command": "x", "cwd": 5}})"));
    assert(config_error(R"({"a": "x"})"));

    try
    {
        (void)config::parse_server_descriptors(std::string(R"({"broken": {"args": []}})"));
        assert(false);
    }
    catch (const ConfigError& e)
    {
        assert(std::string(e.what()).find("broken") != std::string::npos);
    }
    std::cout << "[PASS] invalid entries rejected with server name" << std::endl;
}

static void test_load_file()
{
    namespace fs = std::filesystem;
    fs::path path =
        fs::temp_directory_path() / ("mcpmux_config_" + std::to_string(::getpid()) + ".json");
    {
        std::ofstream out(path);
        out << R"({"mcpServers": {"echo": {"command": "cat"}}})";
    }
    auto servers = config::load_server_descriptors(path);
    fs::remove(path);
    assert(servers.size() == 1);
    assert(servers[0].command == "cat");

    bool missing = false;
    try
    {
        (void)config::load_server_descriptors(path);
    }
    catch (const ConfigError&)
    {
        missing = true;
    }
    assert(missing);
    std::cout << "[PASS] config files load; missing file is a ConfigError" << std::endl;
}

static void test_settings()
{
    Settings defaults;
    assert(defaults.log_level == "INFO");
    assert(defaults.request_timeout.count() == 30000);
    assert(defaults.shutdown_grace.count() == 2000);
    assert(defaults.client_name == "mcpmux");
    assert(!defaults.client_version.empty());

    auto s = Settings::from_json(Json{{"log_level", "debug"},
                                      {"request_timeout_ms", 1500},
                                      {"client_name", "assistant"}});
    assert(s.log_level == "debug");
    assert(s.request_timeout.count() == 1500);
    assert(s.shutdown_grace.count() == 2000);
    assert(s.client_name == "assistant");

    setenv("MCPMUX_LOG_LEVEL", "warn", 1);
    setenv("MCPMUX_REQUEST_TIMEOUT_MS", "250", 1);
    setenv("MCPMUX_SHUTDOWN_GRACE_MS", "not-a-number", 1);
    auto e = Settings::from_env();
    assert(e.log_level == "WARN");
    assert(e.request_timeout.count() == 250);
    assert(e.shutdown_grace.count() == 2000);
    unsetenv("MCPMUX_LOG_LEVEL");
    unsetenv("MCPMUX_REQUEST_TIMEOUT_MS");
    unsetenv("MCPMUX_SHUTDOWN_GRACE_MS");
    std::cout << "[PASS] settings from json and environment" << std::endl;
}

static void test_logger()
{
    using util::LogLevel;
    assert(util::log_level_from_string("warn") == LogLevel::Warning);
    assert(util::log_level_from_string("DEBUG") == LogLevel::Debug);
    assert(util::log_level_from_string("off") == LogLevel::Off);
    assert(util::log_level_from_string("bogus") == LogLevel::Info);

    std::ostringstream sink;
    auto logger = util::make_logger("warning", &sink);
    logger->info("test", "hidden");
    logger->warning("test", "shown");
    logger->error("session:calc", "broken");
    std::string out = sink.str();
    assert(out.find("hidden") == std::string::npos);
    assert(out.find("[mcpmux] WARNING [test] shown") != std::string::npos);
    assert(out.find("[mcpmux] ERROR [session:calc] broken") != std::string::npos);

    logger->set_level(LogLevel::Off);
    logger->error("test", "silenced");
    assert(sink.str().find("silenced") == std::string::npos);
    std::cout << "[PASS] logger levels and format" << std::endl;
}

int main()
{
    test_wrapped_jsonc();
    test_bare_map();
    test_invalid_entries();
    test_load_file();
    test_settings();
    test_logger();
    std::cout << "\n[OK] configuration tests passed" << std::endl;
    return 0;
}
