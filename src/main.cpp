#include <iostream>
#include <string>
#include <vector>
#include "serve.hpp"
#include "client_cmd.hpp"

static void print_usage() {
    std::cout << "Usage: toolwire <command> [options]\n\n"
              << "Commands:\n"
              << "  serve [--host H] [--port P] [--config F] [--no-builtin]\n"
              << "                              Serve the built-in tools over HTTP\n"
              << "  gateway [--host H] [--port P] [--config F] [--no-builtin]\n"
              << "                              Re-serve the tools of configured upstream servers\n"
              << "  tools --url U [--path P] [--timeout MS]\n"
              << "                              List the tools of a remote server\n"
              << "  call --url U [--path P] [--timeout MS] NAME [JSON_ARGS]\n"
              << "                              Invoke a remote tool\n";
}

static bool parse_int(const std::string& s, int& out) {
    try {
        size_t pos = 0;
        out = std::stoi(s, &pos);
        return pos == s.size();
    } catch (const std::exception&) {
        return false;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        args.push_back(argv[i]);
    }

    if (cmd == "serve" || cmd == "gateway") {
        toolwire::ServeOptions opts;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                opts.host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                if (!parse_int(args[++i], opts.port)) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            } else if (args[i] == "--config" && i + 1 < args.size()) {
                opts.config_path = args[++i];
            } else if (args[i] == "--no-builtin") {
                opts.no_builtin = true;
            } else {
                std::cerr << "Unknown option: " << args[i] << "\n";
                print_usage();
                return 1;
            }
        }
        return cmd == "serve" ? toolwire::cmd_serve(opts) : toolwire::cmd_gateway(opts);
    }
    else if (cmd == "tools" || cmd == "call") {
        toolwire::ClientCommandOptions opts;
        std::vector<std::string> positional;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--url" && i + 1 < args.size()) {
                opts.url = args[++i];
            } else if (args[i] == "--path" && i + 1 < args.size()) {
                opts.path = args[++i];
            } else if (args[i] == "--timeout" && i + 1 < args.size()) {
                if (!parse_int(args[++i], opts.timeout_ms) || opts.timeout_ms <= 0) {
                    std::cerr << "Invalid timeout: " << args[i] << "\n";
                    return 1;
                }
            } else {
                positional.push_back(args[i]);
            }
        }
        if (opts.url.empty()) {
            std::cerr << "--url is required\n";
            return 1;
        }
        if (cmd == "tools") return toolwire::cmd_tools(opts);
        if (positional.empty() || positional.size() > 2) {
            print_usage();
            return 1;
        }
        return toolwire::cmd_call(opts, positional[0], positional.size() > 1 ? positional[1] : "");
    }
    else {
        std::cerr << "Unknown command: " << cmd << "\n";
        print_usage();
        return 1;
    }
}
