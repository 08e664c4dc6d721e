#ifndef SYSTEM_UTILS_HPP
#define SYSTEM_UTILS_HPP
#include <string>
#include <unistd.h>

namespace procutil {

/**
 * @brief RAII wrapper for POSIX file descriptors.
 *
 * Closes the descriptor when the object goes out of scope. Use to manage
 * ownership of file descriptors returned by open, pipe and similar calls.
 */
class UniqueFd {
  public:
    UniqueFd() noexcept : fd(-1) {}
    explicit UniqueFd(int f) noexcept : fd(f) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd(other.fd) { other.fd = -1; }

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd = other.fd;
            other.fd = -1;
        }
        return *this;
    }

    int get() const noexcept { return fd; }
    explicit operator bool() const noexcept { return fd >= 0; }

    int release() noexcept {
        int tmp = fd;
        fd = -1;
        return tmp;
    }

    void reset(int f = -1) noexcept {
        if (fd >= 0)
            close(fd);
        fd = f;
    }

  private:
    int fd;
};

/**
 * @brief Write the whole of @p data to @p fd, retrying on EINTR and short
 *        writes.
 *
 * @return `true` when every byte was written.
 */
bool write_all(int fd, const std::string& data);

/**
 * @brief Human readable text for an errno value, e.g. "Permission denied".
 */
std::string errno_message(int err);

} // namespace procutil

#endif // SYSTEM_UTILS_HPP
