#include "util/files.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>
#include <stdexcept>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace ferry::util {

bool isLocked(const fs::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return false;

    bool locked = false;
    if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
        const int e = errno;
        if (e == EWOULDBLOCK) locked = true;
        else if (e != EINVAL && e != EOPNOTSUPP && e != ENOLCK)
            log::Registry::storage()->warn("[files] flock failed for {}: {}", path.string(), std::strerror(e));
    } else {
        ::flock(fd, LOCK_UN);
    }

    ::close(fd);
    return locked;
}

void moveFile(const fs::path& from, const fs::path& to) {
    if (fs::exists(fs::symlink_status(to)))
        throw fs::filesystem_error("target already exists", from, to,
                                   std::make_error_code(std::errc::file_exists));

    std::error_code ec;
    fs::rename(from, to, ec);
    if (!ec) return;

    if (ec != std::errc::cross_device_link) throw fs::filesystem_error("rename failed", from, to, ec);

    log::Registry::storage()->debug("[files] {} and {} are on different filesystems, copying", from.string(), to.string());
    fs::copy_file(from, to, fs::copy_options::none);
    fs::remove(from);
}

void copyFile(const fs::path& from, const fs::path& to) {
    fs::copy_file(from, to, fs::copy_options::none);
}

fs::path expandUser(const std::string& path) {
    if (path.empty() || path.front() != '~') return path;
    if (path.size() > 1 && path[1] != '/') return path;

    const char* home = std::getenv("HOME");
    if (!home || !*home) throw std::runtime_error("[files] Cannot expand '~': HOME is not set");

    return path.size() <= 2 ? fs::path(home) : fs::path(home) / path.substr(2);
}

std::string randomDigits(const size_t length) {
    static constexpr char charset[] = "0123456789";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

}
