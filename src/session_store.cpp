#include "session_store.hpp"
#include <iostream>
#include <vector>

namespace toolwire {

std::shared_ptr<Session> SessionStore::create() {
    reap_idle();

    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    do {
        id = generate_session_id();
    } while (sessions_.count(id));
    auto session = std::make_shared<Session>(id, capabilities_);
    sessions_[id] = Entry{session, Clock::now()};
    return session;
}

std::shared_ptr<Session> SessionStore::find(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return nullptr;
    it->second.last_seen = Clock::now();
    return it->second.session;
}

bool SessionStore::close(const std::string& id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return false;
        session = std::move(it->second.session);
        sessions_.erase(it);
    }
    session->close();
    return true;
}

void SessionStore::close_all() {
    std::map<std::string, Entry> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        doomed.swap(sessions_);
    }
    for (auto& [_, e] : doomed) e.session->close();
}

size_t SessionStore::reap_idle() {
    if (idle_timeout_ <= Clock::duration::zero()) return 0;

    std::vector<std::shared_ptr<Session>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cutoff = Clock::now() - idle_timeout_;
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second.last_seen < cutoff) {
                doomed.push_back(std::move(it->second.session));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& s : doomed) {
        std::cerr << "[http] Session " << s->id() << " expired after idling\n";
        s->close();
    }
    return doomed.size();
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace toolwire
