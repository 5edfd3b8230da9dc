#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>

#include "util/log.hpp"

namespace constants
{
// Discriminator carried in every chunk message's `kind` field
inline constexpr std::string_view CHUNK_KIND = "ChunkRelayChunk";

// Host channel: 25 MiB hard ceiling per attachment; chunks stay 0.5 MiB under it
inline constexpr std::size_t ATTACHMENT_LIMIT   = 25u * 1024 * 1024;
inline constexpr std::size_t DEFAULT_CHUNK_SIZE = ATTACHMENT_LIMIT - 512u * 1024;
inline constexpr std::uint64_t DEFAULT_MAX_OBJECT_SIZE = 500ull * 1024 * 1024;

inline constexpr std::chrono::milliseconds DEFAULT_EXPIRY_WINDOW{5 * 60 * 1000};
inline constexpr std::chrono::milliseconds DEFAULT_SWEEP_INTERVAL{60 * 1000};

// Control socket path (Unix domain socket)
[[maybe_unused]] static std::string ctl_sock_path()
{
    if (const char *p = std::getenv("CHUNKRELAY_CTL_SOCK"); p && *p)
    {
        return std::string(p);
    }
    const char *home      = std::getenv("HOME");
    std::string base      = home && *home ? std::string(home) : "/tmp";
    std::string sock_path = base + "/.cache/chunkrelay/ctl.sock";
    LOG_SYSTEM("Control socket at %s", sock_path.c_str());
    return sock_path;
}

}  // namespace constants
