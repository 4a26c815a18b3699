#pragma once
#include "envelope.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <string>

namespace toolwire {

// Request/response exchange with a remote endpoint. Throws TransportError;
// never retries on its own.
class Transport {
public:
    virtual ~Transport() = default;
    virtual Envelope send(const Envelope& request, std::chrono::milliseconds timeout) = 0;
    virtual void notify(const Envelope& notification, std::chrono::milliseconds timeout) = 0;
    virtual void close() {}
};

// One HTTP POST per call. A session id handed out by the server is echoed
// back on later calls.
class HttpTransport : public Transport {
public:
    HttpTransport(const std::string& base_url, const std::string& path = "/mcp",
                  std::map<std::string, std::string> headers = {});

    Envelope send(const Envelope& request, std::chrono::milliseconds timeout) override;
    void notify(const Envelope& notification, std::chrono::milliseconds timeout) override;
    void close() override;

    std::string session_id() const;
    const std::string& url() const { return base_url_; }

private:
    std::string base_url_;
    std::string path_;
    std::map<std::string, std::string> headers_;

    mutable std::mutex mutex_;
    std::string session_id_;

    struct RawReply {
        int status = 0;
        std::string body;
    };
    RawReply post(const std::string& body, std::chrono::milliseconds timeout);
};

} // namespace toolwire
