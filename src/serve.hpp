#pragma once
#include "config.hpp"
#include <string>

namespace toolwire {

struct ServeOptions {
    std::string config_path;
    std::string host;      // empty = from config
    int port = 0;          // 0 = from config
    bool no_builtin = false;
};

// Serves the built-in tool providers.
int cmd_serve(const ServeOptions& opts);
// Re-serves the tools of the upstream servers named in the config.
int cmd_gateway(const ServeOptions& opts);

} // namespace toolwire
