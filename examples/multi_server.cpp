#include <iostream>
#include "mcpmux.hpp"

// Start every server in a config file and call one tool on it:
//   mcpmux_example_multi_server servers.json time_now '{"tz":"UTC"}'
int main(int argc, char** argv) {
  using namespace mcpmux;
  if (argc < 3) {
    std::cerr << "usage: " << argv[0] << " <config> <server_tool> [json-args]" << std::endl;
    return 2;
  }

  client::McpManager manager(Settings::from_env());
  try {
    auto report = manager.add_servers(config::load_server_descriptors(argv[1]));
    for (const auto& s : report.added)
      std::cout << s.name << ": " << s.tool_count << " tools (protocol " << s.protocol_version
                << ")" << std::endl;
    for (const auto& [name, error] : report.failed)
      std::cerr << name << " failed: " << error << std::endl;

    Json args = argc > 3 ? util::json::parse(argv[3]) : Json::object();
    auto out = manager.call_tool(argv[2], args);
    std::cout << out.dump(2) << std::endl;
  } catch (const Json::parse_error& e) {
    std::cerr << "invalid arguments: " << e.what() << std::endl;
    return 2;
  } catch (const mcpmux::Error& e) {
    std::cerr << "mcpmux error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
