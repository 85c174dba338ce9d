//===----------------------------------------------------------------------===//
//                         PgMux Server
//
// proxy/session_registry.cpp
//
// Session registry implementation
//===----------------------------------------------------------------------===//

#include "proxy/session_registry.hpp"
#include "logging/logger.hpp"

namespace pgmux {

SessionRegistry::SessionRegistry(size_t max_sessions)
    : max_sessions_(max_sessions)
    , random_(std::random_device{}())
    , total_sessions_(0) {
}

CancelKey SessionRegistry::GenerateKey() {
    std::lock_guard<std::mutex> lock(random_mutex_);
    std::uniform_int_distribution<int32_t> pid_dist(1, INT32_MAX);
    std::uniform_int_distribution<int32_t> secret_dist(INT32_MIN, INT32_MAX);
    CancelKey key;
    key.process_id = pid_dist(random_);
    key.secret_key = secret_dist(random_);
    return key;
}

bool SessionRegistry::Register(std::weak_ptr<ClientSession> session, CancelKey& key) {
    // Approximate check, like the accept path
    if (sessions_.size() >= max_sessions_) {
        LOG_WARN("registry", "Maximum client sessions reached: " + std::to_string(max_sessions_));
        return false;
    }

    while (true) {
        key = GenerateKey();
        Entry entry;
        entry.session = session;
        entry.secret_key = key.secret_key;
        if (sessions_.try_emplace(key.process_id, std::move(entry)).second) {
            break;
        }
    }

    total_sessions_++;
    LOG_DEBUG("registry", "Registered session " + std::to_string(key.process_id) +
              " (active: " + std::to_string(sessions_.size()) + ")");
    return true;
}

bool SessionRegistry::Unregister(const CancelKey& key) {
    bool erased = sessions_.erase_if(key.process_id, [&key](const auto& item) {
        return item.second.secret_key == key.secret_key;
    });
    if (erased) {
        LOG_DEBUG("registry", "Unregistered session " + std::to_string(key.process_id) +
                  " (active: " + std::to_string(sessions_.size()) + ")");
        return true;
    }
    return false;
}

bool SessionRegistry::CancelQuery(int32_t process_id, int32_t secret_key) {
    std::shared_ptr<ClientSession> target;
    sessions_.if_contains(process_id, [&](const auto& item) {
        if (item.second.secret_key == secret_key) {
            target = item.second.session.lock();
        }
    });

    if (!target) {
        LOG_WARN("registry", "Cancel request for unknown session " + std::to_string(process_id));
        return false;
    }

    LOG_INFO("registry", "Cancelling query for session " + std::to_string(process_id));
    return target->CancelBackendQuery();
}

void SessionRegistry::CloseAll() {
    std::vector<std::shared_ptr<ClientSession>> live;
    sessions_.for_each([&live](const auto& item) {
        if (auto session = item.second.session.lock()) {
            live.push_back(std::move(session));
        }
    });

    for (auto& session : live) {
        session->Close();
    }

    if (!live.empty()) {
        LOG_INFO("registry", "Closed " + std::to_string(live.size()) + " client sessions");
    }
}

} // namespace pgmux
