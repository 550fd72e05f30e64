#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace mcpmux::util::json {

using json = nlohmann::json;

inline json parse(const std::string& s) { return json::parse(s); }
inline std::string dump(const json& j) { return j.dump(); }
inline std::string dump_pretty(const json& j, int indent = 2) { return j.dump(indent); }

// JSON with // and /* */ comments (config files)
inline json parse_jsonc(const std::string& s)
{
  return json::parse(s, nullptr, /*allow_exceptions=*/true, /*ignore_comments=*/true);
}

} // namespace mcpmux::util::json
