#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

std::optional<std::uint64_t> parse_u64(const char *s)
{
    if (!s || !*s)
        return std::nullopt;
    for (const char *p = s; *p; ++p)
    {
        if (!std::isdigit(static_cast<unsigned char>(*p)))
            return std::nullopt;
    }
    errno                = 0;
    char              *end = nullptr;
    unsigned long long v   = std::strtoull(s, &end, 10);
    if (errno == ERANGE || !end || *end != '\0')
        return std::nullopt;
    return static_cast<std::uint64_t>(v);
}

static std::optional<bool> parse_bool(const char *s)
{
    if (!s || !*s)
        return std::nullopt;
    if (!std::strcmp(s, "1") || !::strcasecmp(s, "on") || !::strcasecmp(s, "true") ||
        !::strcasecmp(s, "yes"))
        return true;
    if (!std::strcmp(s, "0") || !::strcasecmp(s, "off") || !::strcasecmp(s, "false") ||
        !::strcasecmp(s, "no"))
        return false;
    return std::nullopt;
}

// Applies a positive integer env value through `apply`, warning on junk.
template <typename Apply>
static void read_u64(const char *key, bool allow_zero, Apply apply)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    auto v = parse_u64(e);
    if (!v || (!allow_zero && *v == 0))
    {
        LOG_WARN("Ignoring invalid %s='%s'", key, e);
        return;
    }
    apply(*v);
    LOG_INFO("Using %s=%llu", key, (unsigned long long)*v);
}

Config load_config_from_env()
{
    Config c;

    read_u64("CHUNKRELAY_ATTACHMENT_LIMIT", false,
             [&](std::uint64_t v) { c.attachment_limit = static_cast<std::size_t>(v); });
    read_u64("CHUNKRELAY_CHUNK_SIZE", false,
             [&](std::uint64_t v) { c.chunk_size = static_cast<std::size_t>(v); });
    read_u64("CHUNKRELAY_EXPIRY_MS", false,
             [&](std::uint64_t v) { c.expiry_window = std::chrono::milliseconds(v); });
    read_u64("CHUNKRELAY_SWEEP_MS", false,
             [&](std::uint64_t v) { c.sweep_interval = std::chrono::milliseconds(v); });
    read_u64("CHUNKRELAY_MAX_OBJECT_SIZE", true, [&](std::uint64_t v) { c.max_object_size = v; });

    if (const char *e = std::getenv("CHUNKRELAY_AUTO_MERGE"))
    {
        if (auto b = parse_bool(e))
            c.auto_merge = *b;
        else
            LOG_WARN("Ignoring invalid CHUNKRELAY_AUTO_MERGE='%s'", e);
    }
    if (const char *e = std::getenv("CHUNKRELAY_OUT_DIR"); e && *e)
        c.out_dir = e;

    // a chunk that does not fit under the ceiling would fail every send
    if (c.chunk_size >= c.attachment_limit)
    {
        constexpr std::size_t margin = constants::ATTACHMENT_LIMIT - constants::DEFAULT_CHUNK_SIZE;
        const std::size_t     fallback =
            c.attachment_limit > 2 * margin ? c.attachment_limit - margin : c.attachment_limit / 2;
        LOG_WARN("chunk_size %zu does not fit under attachment_limit %zu, using %zu", c.chunk_size,
                 c.attachment_limit, fallback);
        c.chunk_size = fallback;
    }
    return c;
}

bool validate(const Config &c)
{
    if (c.chunk_size == 0)
    {
        LOG_ERROR("chunk_size must be positive");
        return false;
    }
    if (c.chunk_size >= c.attachment_limit)
    {
        LOG_ERROR("chunk_size %zu must be below attachment_limit %zu", c.chunk_size,
                  c.attachment_limit);
        return false;
    }
    if (c.expiry_window.count() <= 0 || c.sweep_interval.count() <= 0)
    {
        LOG_ERROR("expiry_window and sweep_interval must be positive");
        return false;
    }
    return true;
}

}  // namespace config
