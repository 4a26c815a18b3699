#include "http_client.hpp"
#include "session.hpp"
#include <httplib.h>
#include <iostream>

namespace toolwire {

const char* transport_error_name(TransportError::Kind kind) {
    switch (kind) {
    case TransportError::Kind::timeout: return "Timeout";
    case TransportError::Kind::unreachable: return "Unreachable";
    case TransportError::Kind::malformed: return "Malformed";
    }
    return "Unknown";
}

HttpTransport::HttpTransport(const std::string& base_url, const std::string& path,
                             std::map<std::string, std::string> headers)
    : base_url_(base_url), path_(path), headers_(std::move(headers)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
    if (path_.empty() || path_[0] != '/') path_ = "/" + path_;
}

std::string HttpTransport::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

HttpTransport::RawReply HttpTransport::post(const std::string& body, std::chrono::milliseconds timeout) {
    httplib::Client cli(base_url_);
    if (!cli.is_valid()) {
        throw TransportError(TransportError::Kind::unreachable, "invalid url: " + base_url_);
    }
    cli.set_connection_timeout(timeout);
    cli.set_read_timeout(timeout);
    cli.set_write_timeout(timeout);

    httplib::Request req;
    req.method = "POST";
    req.path = path_;
    for (auto& [k, v] : headers_) req.set_header(k, v);
    std::string sid = session_id();
    if (!sid.empty()) req.set_header(SESSION_HEADER, sid);
    req.set_header("Content-Type", "application/json");
    req.body = body;

    // The socket timeouts apply per read; a peer that trickles bytes is cut
    // off here once the whole call is over budget.
    auto started = std::chrono::steady_clock::now();
    auto deadline = started + timeout;
    std::string received;
    req.content_receiver = [&received, deadline](const char* data, size_t len, uint64_t, uint64_t) {
        received.append(data, len);
        return std::chrono::steady_clock::now() < deadline;
    };

    auto res = cli.send(req);
    if (!res) {
        auto elapsed = std::chrono::steady_clock::now() - started;
        std::string detail = httplib::to_string(res.error());
        // httplib reports an expired read or connect as a plain I/O error;
        // the elapsed time tells the two apart.
        if (elapsed >= timeout * 9 / 10) {
            throw TransportError(TransportError::Kind::timeout,
                                 "no response from " + base_url_ + " within " +
                                 std::to_string(timeout.count()) + "ms");
        }
        throw TransportError(TransportError::Kind::unreachable,
                             base_url_ + " unreachable: " + detail);
    }

    if (res->has_header(SESSION_HEADER)) {
        std::lock_guard<std::mutex> lock(mutex_);
        session_id_ = res->get_header_value(SESSION_HEADER);
    }
    return {res->status, received};
}

Envelope HttpTransport::send(const Envelope& request, std::chrono::milliseconds timeout) {
    RawReply reply = post(encode(request), timeout);

    Envelope resp;
    try {
        resp = decode(reply.body);
    } catch (const DecodeError& e) {
        throw TransportError(TransportError::Kind::malformed,
                             "HTTP " + std::to_string(reply.status) + " with undecodable body: " + e.what());
    }
    if (!resp.is_response()) {
        throw TransportError(TransportError::Kind::malformed, "peer answered with a request envelope");
    }
    // id null is the server's answer to a request it could not read
    bool anonymous_error = resp.id.is_null() && resp.error.has_value();
    if (resp.id != request.id && !anonymous_error) {
        throw TransportError(TransportError::Kind::malformed,
                             "response id " + resp.id.dump() + " does not match request id " + request.id.dump());
    }
    return resp;
}

void HttpTransport::notify(const Envelope& notification, std::chrono::milliseconds timeout) {
    RawReply reply = post(encode(notification), timeout);
    if (reply.status < 200 || reply.status >= 300) {
        throw TransportError(TransportError::Kind::malformed,
                             "notification rejected with HTTP " + std::to_string(reply.status));
    }
}

void HttpTransport::close() {
    std::string sid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sid.swap(session_id_);
    }
    if (sid.empty()) return;

    httplib::Client cli(base_url_);
    cli.set_connection_timeout(std::chrono::seconds(2));
    cli.set_read_timeout(std::chrono::seconds(2));
    httplib::Headers hdrs{{SESSION_HEADER, sid}};
    auto res = cli.Delete(path_, hdrs);
    if (!res) {
        std::cerr << "[client] Could not close session " << sid << " at " << base_url_ << ": "
                  << httplib::to_string(res.error()) << "\n";
    }
}

} // namespace toolwire
