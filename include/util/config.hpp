#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "util/constants.hpp"

namespace config
{

struct Config
{
    std::size_t               chunk_size       = constants::DEFAULT_CHUNK_SIZE;
    std::size_t               attachment_limit = constants::ATTACHMENT_LIMIT;
    std::chrono::milliseconds expiry_window    = constants::DEFAULT_EXPIRY_WINDOW;
    std::chrono::milliseconds sweep_interval   = constants::DEFAULT_SWEEP_INTERVAL;
    std::uint64_t             max_object_size  = constants::DEFAULT_MAX_OBJECT_SIZE;  // 0 = no cap
    bool                      auto_merge       = true;
    std::string               out_dir          = "~/Downloads/chunkrelay";
};

// Strict decimal parse; rejects signs, blanks and trailing garbage.
std::optional<std::uint64_t> parse_u64(const char *s);

// Reads CHUNKRELAY_* variables on top of the defaults. Invalid values are
// logged and ignored.
Config load_config_from_env();

// chunk_size must be positive and strictly below attachment_limit.
bool validate(const Config &c);

}  // namespace config
