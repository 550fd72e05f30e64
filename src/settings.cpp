#include "mcpmux/settings.hpp"

#include "mcpmux/version.hpp"

#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace mcpmux
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static std::chrono::milliseconds getenv_ms(const char* key, std::chrono::milliseconds defv)
{
    const char* v = std::getenv(key);
    if (!v || !*v)
        return defv;
    try
    {
        long long ms = std::stoll(v);
        if (ms <= 0)
            return defv;
        return std::chrono::milliseconds(ms);
    }
    catch (const std::exception&)
    {
        return defv;
    }
}

Settings::Settings() : client_version(version_string()) {}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("MCPMUX_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;
    s.request_timeout = getenv_ms("MCPMUX_REQUEST_TIMEOUT_MS", s.request_timeout);
    s.shutdown_grace = getenv_ms("MCPMUX_SHUTDOWN_GRACE_MS", s.shutdown_grace);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
        s.log_level = j.at("log_level").get<std::string>();
    if (j.contains("request_timeout_ms"))
        s.request_timeout = std::chrono::milliseconds(j.at("request_timeout_ms").get<long long>());
    if (j.contains("shutdown_grace_ms"))
        s.shutdown_grace = std::chrono::milliseconds(j.at("shutdown_grace_ms").get<long long>());
    if (j.contains("client_name"))
        s.client_name = j.at("client_name").get<std::string>();
    if (j.contains("client_version"))
        s.client_version = j.at("client_version").get<std::string>();
    return s;
}

} // namespace mcpmux
