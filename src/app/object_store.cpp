#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <vector>

#include "app/object_store.hpp"
#include "util/log.hpp"

namespace app
{
namespace fs = std::filesystem;

std::string safe_file_name(const std::string &name)
{
    std::string base = fs::path(name).filename().string();
    if (base.empty() || base == "." || base == "..")
        return "object.bin";
    return base;
}

static bool write_all(int fd, const std::vector<std::uint8_t> &data)
{
    std::size_t done = 0;
    while (done < data.size())
    {
        ssize_t n = ::write(fd, data.data() + done, data.size() - done);
        if (n > 0)
        {
            done += static_cast<std::size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        return false;
    }
    return true;
}

std::optional<fs::path> save_object(const fs::path &dir, const chunk::Object &obj, int max_copies)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(), ec.message().c_str());
        return std::nullopt;
    }

    const std::string base = safe_file_name(obj.name);
    for (int n = 0; n < max_copies; n++)
    {
        const fs::path target = dir / (n == 0 ? base : base + "." + std::to_string(n));
        // O_EXCL: an earlier download of the same name is never clobbered
        int fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd == -1)
        {
            if (errno == EEXIST)
                continue;
            LOG_ERROR("cannot create %s: %s", target.string().c_str(), std::strerror(errno));
            return std::nullopt;
        }

        const bool ok = write_all(fd, obj.bytes);
        const int  saved_errno = errno;
        ::close(fd);
        if (!ok)
        {
            LOG_ERROR("short write to %s: %s", target.string().c_str(), std::strerror(saved_errno));
            fs::remove(target, ec);
            return std::nullopt;
        }
        LOG_SYSTEM("[XFER] saved %s", target.string().c_str());
        return target;
    }

    LOG_ERROR("no free name for %s in %s after %d tries", base.c_str(), dir.string().c_str(),
              max_copies);
    return std::nullopt;
}

}  // namespace app
