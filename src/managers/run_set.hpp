#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <platform/process.hpp>

using SteadyClock = std::chrono::steady_clock;

// One target whose remote command is executing.
struct RunningEntry {
    std::string target;
    platform::ProcessHandle process;
    SteadyClock::time_point started;
};

// Targets currently executing, bounded by a fixed capacity.
class RunSet {
public:
    explicit RunSet(size_t capacity);

    // Takes ownership of the entry. Throws std::logic_error when the set
    // is already at capacity.
    void add(RunningEntry&& entry);

    bool has_capacity() const { return entries_.size() < capacity_; }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

    // Earliest start + timeout across all entries; nullopt when empty.
    // timeout must not exceed max_timeout().
    std::optional<SteadyClock::time_point> next_deadline(std::chrono::milliseconds timeout) const;

    // Output pipes of every entry that are still open.
    std::vector<int> poll_fds() const;

    // Remove every entry for which pred(entry) returns true. The predicate
    // may consume the entry (its process handle) before it is destroyed.
    template <typename Pred>
    size_t remove_if(Pred pred) {
        size_t removed = 0;
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (pred(*it)) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    const std::vector<RunningEntry>& entries() const { return entries_; }

private:
    size_t capacity_;
    std::vector<RunningEntry> entries_;
};
