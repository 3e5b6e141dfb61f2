#include "labwright/port_pool.h"

namespace labwright {

PortPool::PortPool(int first, int last)
    : first_(first), last_(last < first ? first : last) {}

std::optional<int> PortPool::acquire() {
    std::lock_guard<std::mutex> lk(mu_);
    for (int p = first_; p <= last_; p++) {
        if (used_.insert(p).second) return p;
    }
    return std::nullopt;
}

bool PortPool::release(int port) {
    std::lock_guard<std::mutex> lk(mu_);
    return used_.erase(port) > 0;
}

size_t PortPool::in_use() const {
    std::lock_guard<std::mutex> lk(mu_);
    return used_.size();
}

} // namespace labwright
