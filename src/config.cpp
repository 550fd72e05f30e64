#include "mcpmux/config.hpp"

#include "mcpmux/exceptions.hpp"
#include "mcpmux/util/json.hpp"

#include <cmath>
#include <fstream>
#include <sstream>

namespace mcpmux::config
{

namespace
{

[[noreturn]] void fail(const std::string& name, const std::string& message)
{
    throw ConfigError("server '" + name + "': " + message);
}

std::vector<std::string> string_list(const std::string& name, const Json& value,
                                     const char* field)
{
    if (!value.is_array())
        fail(name, std::string(field) + " must be an array of strings");
    std::vector<std::string> out;
    for (const auto& item : value)
    {
        if (!item.is_string())
            fail(name, std::string(field) + " must be an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string scalar_to_string(const Json& value)
{
    if (value.is_string())
        return value.get<std::string>();
    return value.dump();
}

} // namespace

ServerDescriptor parse_server_descriptor(const std::string& name, const Json& entry)
{
    if (name.empty())
        throw ConfigError("server name must not be empty");
    if (!entry.is_object())
        fail(name, "entry must be an object");

    ServerDescriptor d;
    d.name = name;

    auto command = entry.find("command");
    if (command == entry.end())
        fail(name, "missing command");
    if (command->is_string())
    {
        d.command = command->get<std::string>();
    }
    else
    {
        auto parts = string_list(name, *command, "command");
        if (parts.empty())
            fail(name, "command must not be empty");
        d.command = parts.front();
        d.args.assign(parts.begin() + 1, parts.end());
    }
    if (d.command.empty())
        fail(name, "command must not be empty");

    if (entry.contains("args"))
    {
        auto extra = string_list(name, entry["args"], "args");
        d.args.insert(d.args.end(), extra.begin(), extra.end());
    }

    if (entry.contains("env"))
    {
        const auto& env = entry["env"];
        if (!env.is_object())
            fail(name, "env must be an object");
        for (auto it = env.begin(); it != env.end(); ++it)
        {
            if (it.value().is_object() || it.value().is_array() || it.value().is_null())
                fail(name, "env value for '" + it.key() + "' must be a scalar");
            d.env[it.key()] = scalar_to_string(it.value());
        }
    }

    if (entry.contains("timeout"))
    {
        const auto& timeout = entry["timeout"];
        if (!timeout.is_number() || timeout.get<double>() <= 0.0)
            fail(name, "timeout must be a positive number of seconds");
        d.timeout = std::chrono::milliseconds(
            static_cast<long long>(std::llround(timeout.get<double>() * 1000.0)));
    }

    if (entry.contains("cwd"))
    {
        if (!entry["cwd"].is_string())
            fail(name, "cwd must be a string");
        d.cwd = entry["cwd"].get<std::string>();
    }

    return d;
}

std::vector<ServerDescriptor> parse_server_descriptors(const Json& root)
{
    if (!root.is_object())
        throw ConfigError("configuration must be a JSON object");

    const Json* servers = &root;
    if (root.contains("mcpServers"))
    {
        servers = &root["mcpServers"];
        if (!servers->is_object())
            throw ConfigError("mcpServers must be an object");
    }

    std::vector<ServerDescriptor> out;
    for (auto it = servers->begin(); it != servers->end(); ++it)
    {
        if (it.value().is_object() && it.value().value("disabled", false))
            continue;
        out.push_back(parse_server_descriptor(it.key(), it.value()));
    }
    return out;
}

std::vector<ServerDescriptor> parse_server_descriptors(const std::string& text)
{
    Json root;
    try
    {
        root = util::json::parse_jsonc(text);
    }
    catch (const Json::parse_error& e)
    {
        throw ConfigError(std::string("invalid configuration JSON: ") + e.what());
    }
    return parse_server_descriptors(root);
}

std::vector<ServerDescriptor> load_server_descriptors(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("cannot open configuration file " + path.string());
    std::ostringstream text;
    text << in.rdbuf();
    try
    {
        return parse_server_descriptors(text.str());
    }
    catch (const ConfigError& e)
    {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

} // namespace mcpmux::config
