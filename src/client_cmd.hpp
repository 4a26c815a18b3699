#pragma once
#include <string>

namespace toolwire {

struct ClientCommandOptions {
    std::string url;
    std::string path = "/mcp";
    int timeout_ms = 30000;
};

// Prints the remote tools and their arguments.
int cmd_tools(const ClientCommandOptions& opts);
int cmd_call(const ClientCommandOptions& opts, const std::string& tool, const std::string& args_json);

} // namespace toolwire
