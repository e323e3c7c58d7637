#pragma once

#include <deque>
#include <string>
#include <vector>

// Targets waiting to be launched. FIFO: input order is launch order.
class LaunchQueue {
public:
    LaunchQueue() = default;
    explicit LaunchQueue(const std::vector<std::string>& targets);

    void push(std::string target);

    // Remove and return the next target. Must not be called when empty.
    std::string pop();

    bool empty() const { return pending_.empty(); }
    size_t size() const { return pending_.size(); }

private:
    std::deque<std::string> pending_;
};
