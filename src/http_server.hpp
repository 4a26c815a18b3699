#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "rate_limiter.hpp"
#include "session_store.hpp"
#include <httplib.h>
#include <string>
#include <thread>

namespace toolwire {

struct HttpReply {
    int status = 200;
    std::string body;            // encoded envelope, empty for 202/204
    std::string issued_session;  // set when initialize opened a session
};

// Serves the protocol on POST /mcp. Each inbound call runs on its own
// worker thread; the codec rejects malformed bodies before dispatch.
class HttpServer {
public:
    HttpServer(const Dispatcher& dispatcher, const ServerConfig& cfg);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds cfg.host:cfg.port and starts listening in the background.
    bool start();
    // Binds an ephemeral port on cfg.host. Returns the port, or -1.
    int start_any_port();
    void stop();

    bool running() const { return server_.is_running(); }
    int port() const { return port_; }
    const std::string& host() const { return config_.host; }

    SessionStore& sessions() { return sessions_; }

    // Transport-independent core of POST /mcp and DELETE /mcp.
    HttpReply handle_post(const std::string& body, const std::string& session_id);
    HttpReply handle_delete(const std::string& session_id);

private:
    const Dispatcher& dispatcher_;
    ServerConfig config_;
    SessionStore sessions_;
    RateLimiter rate_limiter_;
    httplib::Server server_;
    std::thread thread_;
    int port_ = -1;

    void install_routes();
    void launch();
};

} // namespace toolwire
