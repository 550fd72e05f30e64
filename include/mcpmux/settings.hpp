#pragma once
#include "mcpmux/types.hpp"

#include <chrono>
#include <string>

namespace mcpmux
{

struct Settings
{
    std::string log_level{"INFO"};
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds shutdown_grace{2000};
    std::string client_name{"mcpmux"};
    std::string client_version;

    Settings();

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace mcpmux
