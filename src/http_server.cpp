#include "http_server.hpp"
#include <chrono>
#include <iostream>

namespace toolwire {

static HttpReply error_reply(int status, const nlohmann::json& id, int code, const std::string& msg) {
    HttpReply r;
    r.status = status;
    r.body = encode(Envelope::failure(id, code, msg));
    return r;
}

HttpServer::HttpServer(const Dispatcher& dispatcher, const ServerConfig& cfg)
    : dispatcher_(dispatcher), config_(cfg), sessions_(server_capabilities(), std::chrono::seconds(cfg.session_idle_timeout_s)),
      rate_limiter_(cfg.rate_limit_rpm) {
    size_t workers = config_.worker_threads > 0 ? static_cast<size_t>(config_.worker_threads) : 1;
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    install_routes();
}

HttpServer::~HttpServer() {
    stop();
}

HttpReply HttpServer::handle_post(const std::string& body, const std::string& session_id) {
    if (!rate_limiter_.allow()) {
        return error_reply(429, nullptr, error_code::rate_limited, "rate limit exceeded");
    }

    Envelope req;
    try {
        req = decode(body);
    } catch (const DecodeError& e) {
        std::cerr << "[http] Rejected envelope: " << e.what() << "\n";
        return error_reply(400, e.id(), e.code(), e.what());
    }
    if (!req.is_request()) {
        return error_reply(400, req.id, error_code::invalid_request, "expected a request envelope");
    }

    if (req.is_notification()) {
        if (auto session = sessions_.find(session_id)) {
            dispatcher_.notify(req, *session);
        }
        HttpReply r;
        r.status = 202;
        return r;
    }

    std::shared_ptr<Session> session;
    std::string issued;
    if (req.method == "initialize" && session_id.empty()) {
        session = sessions_.create();
        issued = session->id();
    } else if (session_id.empty()) {
        return error_reply(400, req.id, error_code::session_not_initialized,
                           std::string("missing ") + SESSION_HEADER + " header, send initialize first");
    } else {
        session = sessions_.find(session_id);
        if (!session) {
            return error_reply(404, req.id, error_code::session_not_initialized,
                               "unknown session: " + session_id);
        }
    }

    auto started = std::chrono::steady_clock::now();
    Envelope resp = dispatcher_.dispatch(req, *session);

    if (!issued.empty() && resp.error) {
        // A rejected initialize leaves nothing behind.
        sessions_.close(issued);
        issued.clear();
    }

    if (req.method == "tools/call") {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        const auto& name = req.params.contains("name") ? req.params["name"] : nlohmann::json();
        std::cerr << "[http] tools/call " << (name.is_string() ? name.get<std::string>() : "?") << " id="
                  << req.id.dump() << " done in " << ms << "ms\n";
    }

    HttpReply r;
    r.body = encode(resp);
    r.issued_session = issued;
    return r;
}

HttpReply HttpServer::handle_delete(const std::string& session_id) {
    HttpReply r;
    if (session_id.empty() || !sessions_.close(session_id)) {
        r.status = 404;
        return r;
    }
    std::cerr << "[http] Session " << session_id << " closed by client\n";
    r.status = 204;
    return r;
}

void HttpServer::install_routes() {
    server_.Get("/", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json j;
        j["name"] = dispatcher_.info().name;
        j["version"] = dispatcher_.info().version;
        j["protocolVersions"] = SUPPORTED_PROTOCOL_VERSIONS;
        j["endpoints"] = {{"mcp", "/mcp"}, {"health", "/health"}};
        res.set_content(j.dump(), "application/json");
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json j;
        j["status"] = "ok";
        j["server"] = dispatcher_.info().name;
        j["tools"] = dispatcher_.tools().size();
        sessions_.reap_idle();
        j["sessions"] = sessions_.size();
        res.set_content(j.dump(), "application/json");
    });

    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[http] Unhandled exception: " << msg << "\n";
        res.status = 500;
        res.set_content(encode(Envelope::failure(nullptr, error_code::internal_error, msg)),
                        "application/json");
    });

    server_.Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handle_post(req.body, req.get_header_value(SESSION_HEADER));
        res.status = reply.status;
        if (!reply.issued_session.empty()) {
            res.set_header(SESSION_HEADER, reply.issued_session);
        }
        if (!reply.body.empty()) {
            res.set_content(reply.body, "application/json");
        }
    });

    server_.Delete("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
        HttpReply reply = handle_delete(req.get_header_value(SESSION_HEADER));
        res.status = reply.status;
    });
}

bool HttpServer::start() {
    if (!server_.bind_to_port(config_.host, config_.port)) {
        std::cerr << "[http] Failed to bind " << config_.host << ":" << config_.port << "\n";
        return false;
    }
    port_ = config_.port;
    launch();
    return true;
}

int HttpServer::start_any_port() {
    int port = server_.bind_to_any_port(config_.host);
    if (port < 0) {
        std::cerr << "[http] Failed to bind any port on " << config_.host << "\n";
        return -1;
    }
    port_ = port;
    launch();
    return port_;
}

void HttpServer::launch() {
    thread_ = std::thread([this]() {
        std::cerr << "[http] Listening on " << config_.host << ":" << port_ << "\n";
        if (!server_.listen_after_bind()) {
            std::cerr << "[http] Listener on port " << port_ << " exited with an error\n";
        }
    });
    server_.wait_until_ready();
}

void HttpServer::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
    sessions_.close_all();
}

} // namespace toolwire
