#pragma once
#include "session.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace toolwire {

// Live sessions of a server, keyed by the id handed to clients in the
// Mcp-Session-Id header. A session nobody has used for idle_timeout is
// closed and dropped; a zero timeout keeps sessions until closed.
class SessionStore {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionStore(nlohmann::json server_capabilities,
                          Clock::duration idle_timeout = Clock::duration::zero())
        : capabilities_(std::move(server_capabilities)), idle_timeout_(idle_timeout) {}

    std::shared_ptr<Session> create();
    // Marks the session as used.
    std::shared_ptr<Session> find(const std::string& id);

    // Closes and forgets the session. Returns false if the id is unknown.
    bool close(const std::string& id);
    void close_all();

    // Closes sessions idle for longer than the timeout. Returns how many.
    size_t reap_idle();

    size_t size() const;

private:
    struct Entry {
        std::shared_ptr<Session> session;
        Clock::time_point last_seen;
    };

    nlohmann::json capabilities_;
    Clock::duration idle_timeout_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> sessions_;
};

} // namespace toolwire
