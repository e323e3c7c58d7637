#include "launch_queue.hpp"
#include <stdexcept>

LaunchQueue::LaunchQueue(const std::vector<std::string>& targets)
    : pending_(targets.begin(), targets.end()) {}

void LaunchQueue::push(std::string target) {
    pending_.push_back(std::move(target));
}

std::string LaunchQueue::pop() {
    if (pending_.empty()) {
        throw std::logic_error("LaunchQueue::pop on empty queue");
    }
    std::string target = std::move(pending_.front());
    pending_.pop_front();
    return target;
}
