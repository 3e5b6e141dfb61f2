#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <set>

namespace labwright {

// Bounded set of host ports, one lock for every mutation.
// Ports are handed out lowest-first.
class PortPool {
public:
    // Inclusive range. last < first yields the single port `first`.
    PortPool(int first, int last);

    // nullopt when every port in the range is taken.
    std::optional<int> acquire();

    // Returns false if the port was not held (double release, foreign port).
    bool release(int port);

    size_t in_use() const;
    size_t capacity() const { return (size_t)(last_ - first_ + 1); }
    int first() const { return first_; }
    int last() const { return last_; }

private:
    int first_;
    int last_;
    mutable std::mutex mu_;
    std::set<int> used_;
};

} // namespace labwright
