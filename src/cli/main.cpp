#include "mcpmux/client/manager.hpp"
#include "mcpmux/config.hpp"
#include "mcpmux/exceptions.hpp"
#include "mcpmux/settings.hpp"
#include "mcpmux/util/json.hpp"
#include "mcpmux/version.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

static int usage(int exit_code = 1)
{
    std::cout << "mcpmux " << mcpmux::version_string() << "\n";
    std::cout << "Usage:\n";
    std::cout << "  mcpmux --help\n";
    std::cout << "  mcpmux tools     <config> [options]\n";
    std::cout << "  mcpmux call      <config> <server_tool> [json-arguments] [options]\n";
    std::cout << "  mcpmux resources <config> [options]\n";
    std::cout << "  mcpmux prompts   <config> [options]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  --log-level <level>   DEBUG, INFO, WARNING, ERROR or OFF (default: INFO)\n";
    std::cout << "  --timeout-ms <n>      Default per-request timeout in milliseconds\n";
    std::cout << "  --pretty              Indent JSON output\n";
    std::cout << "\n";
    std::cout << "<config> is a JSON/JSONC file with an \"mcpServers\" map (or a bare map)\n";
    std::cout << "of server name -> {command, args, env, timeout, cwd, disabled}.\n";
    return exit_code;
}

static bool is_flag(const std::string& s)
{
    return !s.empty() && s[0] == '-';
}

static std::optional<std::string> consume_flag_value(std::vector<std::string>& args,
                                                     const std::string& flag)
{
    for (size_t i = 0; i + 1 < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            std::string value = args[i + 1];
            args.erase(args.begin() + static_cast<long long>(i),
                       args.begin() + static_cast<long long>(i) + 2);
            return value;
        }
    }
    return std::nullopt;
}

static bool consume_flag(std::vector<std::string>& args, const std::string& flag)
{
    for (size_t i = 0; i < args.size(); ++i)
    {
        if (args[i] == flag)
        {
            args.erase(args.begin() + static_cast<long long>(i));
            return true;
        }
    }
    return false;
}

static std::optional<long long> parse_positive(const std::string& s)
{
    try
    {
        size_t pos = 0;
        long long v = std::stoll(s, &pos, 10);
        if (pos != s.size() || v <= 0)
            return std::nullopt;
        return v;
    }
    catch (const std::logic_error&)
    {
        return std::nullopt;
    }
}

/// Start every configured server, reporting the ones that fail
static void start_servers(mcpmux::client::McpManager& manager, const std::string& config_path)
{
    auto descriptors = mcpmux::config::load_server_descriptors(config_path);
    if (descriptors.empty())
        throw mcpmux::ConfigError("No enabled servers in " + config_path);

    auto report = manager.add_servers(descriptors);
    for (const auto& [server, message] : report.failed)
        std::cerr << "Failed to start '" << server << "': " << message << "\n";
    if (report.added.empty())
        throw mcpmux::Error("No MCP server could be started");
}

template <typename Map>
static mcpmux::Json listing_json(const Map& items)
{
    mcpmux::Json out = mcpmux::Json::object();
    for (const auto& [qualified, item] : items)
        out[qualified] = item;
    return out;
}

static int run_command(const std::string& cmd, std::vector<std::string> args)
{
    mcpmux::Settings settings = mcpmux::Settings::from_env();
    if (auto level = consume_flag_value(args, "--log-level"))
        settings.log_level = *level;
    if (auto t = consume_flag_value(args, "--timeout-ms"))
    {
        auto ms = parse_positive(*t);
        if (!ms)
        {
            std::cerr << "Invalid --timeout-ms: " << *t << "\n";
            return 2;
        }
        settings.request_timeout = std::chrono::milliseconds(*ms);
    }
    bool pretty = consume_flag(args, "--pretty");

    for (const auto& a : args)
    {
        if (is_flag(a))
        {
            std::cerr << "Unknown option: " << a << "\n";
            return 2;
        }
    }

    if (args.empty())
    {
        std::cerr << "Missing <config>. See: mcpmux --help\n";
        return 2;
    }
    std::string config_path = args.front();
    args.erase(args.begin());

    auto dump_json = [pretty](const mcpmux::Json& j)
    {
        std::cout << (pretty ? mcpmux::util::json::dump_pretty(j) : mcpmux::util::json::dump(j))
                  << "\n";
    };

    std::string tool_name;
    mcpmux::Json arguments = mcpmux::Json::object();
    if (cmd == "call")
    {
        if (args.empty())
        {
            std::cerr << "Missing tool name. See: mcpmux --help\n";
            return 2;
        }
        tool_name = args.front();
        args.erase(args.begin());
        if (!args.empty())
        {
            try
            {
                arguments = mcpmux::util::json::parse(args.front());
            }
            catch (const mcpmux::Json::parse_error& e)
            {
                std::cerr << "Invalid JSON arguments: " << e.what() << "\n";
                return 2;
            }
            if (!arguments.is_object())
            {
                std::cerr << "Tool arguments must be a JSON object\n";
                return 2;
            }
            args.erase(args.begin());
        }
    }
    if (!args.empty())
    {
        std::cerr << "Unexpected argument: " << args.front() << "\n";
        return 2;
    }

    try
    {
        mcpmux::client::McpManager manager(settings);
        start_servers(manager, config_path);

        if (cmd == "tools")
            dump_json(listing_json(manager.list_all_tools()));
        else if (cmd == "resources")
            dump_json(listing_json(manager.list_all_resources()));
        else if (cmd == "prompts")
            dump_json(listing_json(manager.list_all_prompts()));
        else
            dump_json(manager.call_tool(tool_name, arguments));

        for (const auto& message : manager.close_all())
            std::cerr << "Shutdown: " << message << "\n";
        return 0;
    }
    catch (const mcpmux::Error& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

} // namespace

int main(int argc, char** argv)
{
    if (argc < 2)
        return usage();

    std::string cmd = argv[1];
    if (cmd == "--help" || cmd == "-h")
        return usage(0);
    if (cmd == "--version")
    {
        std::cout << mcpmux::version_string() << "\n";
        return 0;
    }

    if (cmd != "tools" && cmd != "call" && cmd != "resources" && cmd != "prompts")
        return usage();

    std::vector<std::string> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 2; i < argc; ++i)
        args.emplace_back(argv[i]);

    if (consume_flag(args, "--help") || consume_flag(args, "-h"))
        return usage(0);

    return run_command(cmd, std::move(args));
}
