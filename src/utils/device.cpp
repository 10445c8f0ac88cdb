#include "device.hpp"
#include "logger.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#ifdef __linux__
#include <linux/fs.h>
#include <sys/ioctl.h>
#endif


std::string resolveRawDevicePath(const std::string& path) {
    std::string resolved = path;
    while (resolved.size() > 1 && resolved.back() == '/')
        resolved.pop_back();
    return resolved;
}

std::optional<uint64_t> deviceSize(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0)
        return std::nullopt;

    if (S_ISREG(st.st_mode))
        return static_cast<uint64_t>(st.st_size);

#ifdef __linux__
    if (S_ISBLK(st.st_mode)) {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            Logger::debug("deviceSize: cannot open " + path);
            return std::nullopt;
        }
        uint64_t size = 0;
        int rc = ::ioctl(fd, BLKGETSIZE64, &size);
        ::close(fd);
        if (rc == 0)
            return size;
        Logger::debug("deviceSize: BLKGETSIZE64 failed on " + path);
    }
#endif
    return std::nullopt;
}
