#include "fd_util.hpp"

#include <poll.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>

namespace platform {

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void close_fd(int& fd) {
    if (fd < 0) return;
    close(fd);
    fd = -1;
}

int wait_readable(const std::vector<int>& fds, int timeout_ms) {
    std::vector<struct pollfd> pfds;
    pfds.reserve(fds.size());
    for (int fd : fds) {
        if (fd < 0) continue;
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        pfds.push_back(pfd);
    }

    // Nothing to watch: still honour the timeout so callers pace themselves.
    int ret = poll(pfds.empty() ? nullptr : pfds.data(),
                   static_cast<nfds_t>(pfds.size()), timeout_ms);
    if (ret < 0) {
        return errno == EINTR ? 0 : -1;
    }
    return ret;
}

} // namespace platform
