#include "run_set.hpp"
#include <algorithm>
#include <stdexcept>

RunSet::RunSet(size_t capacity) : capacity_(capacity) {}

void RunSet::add(RunningEntry&& entry) {
    if (!has_capacity()) {
        throw std::logic_error("RunSet::add on a full set");
    }
    entries_.push_back(std::move(entry));
}

std::optional<SteadyClock::time_point> RunSet::next_deadline(std::chrono::milliseconds timeout) const {
    if (entries_.empty()) return std::nullopt;
    auto earliest = std::min_element(entries_.begin(), entries_.end(),
        [](const RunningEntry& a, const RunningEntry& b) { return a.started < b.started; });
    return earliest->started + timeout;
}

std::vector<int> RunSet::poll_fds() const {
    std::vector<int> fds;
    fds.reserve(entries_.size() * 2);
    for (const auto& e : entries_) {
        if (e.process.stdout_fd() >= 0) fds.push_back(e.process.stdout_fd());
        if (e.process.stderr_fd() >= 0) fds.push_back(e.process.stderr_fd());
    }
    return fds;
}
