#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "app/object_source.hpp"
#include "util/log.hpp"

namespace app
{

bool MemorySource::read(std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out)
{
    if (offset > bytes_.size() || len > bytes_.size() - offset)
        return false;
    const auto first = bytes_.begin() + static_cast<std::ptrdiff_t>(offset);
    out.assign(first, first + static_cast<std::ptrdiff_t>(len));
    return true;
}

std::unique_ptr<FileSource> FileSource::open(const std::string &path)
{
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        LOG_ERROR("open: %s is not a regular file", path.c_str());
        return nullptr;
    }
    const auto size = fs::file_size(path, ec);
    if (ec)
    {
        LOG_ERROR("open: file_size(%s) failed: %s", path.c_str(), ec.message().c_str());
        return nullptr;
    }
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        LOG_ERROR("open: cannot read %s: %s", path.c_str(), std::strerror(errno));
        return nullptr;
    }
    return std::unique_ptr<FileSource>(
        new FileSource(path, std::move(in), static_cast<std::uint64_t>(size)));
}

bool FileSource::read(std::uint64_t offset, std::size_t len, std::vector<std::uint8_t> &out)
{
    if (offset > size_ || len > size_ - offset)
        return false;
    out.resize(len);
    in_.clear();
    in_.seekg(static_cast<std::streamoff>(offset));
    if (!in_)
        return false;
    in_.read(reinterpret_cast<char *>(out.data()), static_cast<std::streamsize>(len));
    if (in_.gcount() != static_cast<std::streamsize>(len))
    {
        LOG_ERROR("read: short read on %s at %llu (%lld of %zu)", path_.c_str(),
                  (unsigned long long)offset, (long long)in_.gcount(), len);
        return false;
    }
    return true;
}

}  // namespace app
