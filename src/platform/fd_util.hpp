#pragma once

// File descriptor helpers for pipe plumbing.

#include <vector>

namespace platform {

// Set a descriptor to non-blocking mode. Returns false if fcntl fails.
bool set_nonblocking(int fd);

// Close a descriptor and reset it to -1. No-op for fd < 0.
void close_fd(int& fd);

// Block until any descriptor in `fds` is readable or hung up, or until
// timeout_ms elapses (-1 = no timeout). Negative entries are skipped.
// Returns the number of ready descriptors, 0 on timeout or signal
// interruption, -1 on poll failure.
int wait_readable(const std::vector<int>& fds, int timeout_ms);

} // namespace platform
