#include "system_utils.hpp"
#include <cerrno>
#include <cstring>

namespace procutil {

bool write_all(int fd, const std::string& data) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t w = write(fd, p, left);
        if (w < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        p += w;
        left -= static_cast<size_t>(w);
    }
    return true;
}

std::string errno_message(int err) { return std::strerror(err); }

} // namespace procutil
