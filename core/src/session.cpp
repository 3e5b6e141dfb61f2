#include "labwright/session.h"
#include "labwright/orchestrator.h"

#include <iostream>

namespace labwright {

PublishedLab publish_view(const LabSession& s) {
    PublishedLab v;
    v.lab_id = s.lab_id;
    v.status = s.status;
    v.jupyter_url = s.jupyter_url;
    v.error_message = s.error_message;
    return v;
}

void SessionRegistry::put(LabSession s) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string id = s.lab_id;
    sessions_[id] = std::move(s);
}

std::optional<PublishedLab> SessionRegistry::view(const std::string& lab_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(lab_id);
    if (it == sessions_.end()) return std::nullopt;
    return publish_view(it->second);
}

std::vector<PublishedLab> SessionRegistry::list() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<PublishedLab> out;
    out.reserve(sessions_.size());
    for (const auto& kv : sessions_) out.push_back(publish_view(kv.second));
    return out;
}

std::optional<LabSession> SessionRegistry::take(const std::string& lab_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(lab_id);
    if (it == sessions_.end()) return std::nullopt;
    LabSession s = std::move(it->second);
    sessions_.erase(it);
    return s;
}

std::vector<LabSession> SessionRegistry::take_all() {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<LabSession> out;
    out.reserve(sessions_.size());
    for (auto& kv : sessions_) out.push_back(std::move(kv.second));
    sessions_.clear();
    return out;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sessions_.size();
}

int stop_all(SessionRegistry& registry, LabOrchestrator& orch) {
    int stopped = 0;
    for (auto& s : registry.take_all()) {
        if (s.status != LabStatus::RUNNING && s.status != LabStatus::STARTING) continue;
        if (orch.teardown(s)) {
            stopped++;
        } else {
            std::cerr << "[shutdown] lab " << s.lab_id << " teardown incomplete: " << s.error_message << "\n";
        }
    }
    return stopped;
}

} // namespace labwright
