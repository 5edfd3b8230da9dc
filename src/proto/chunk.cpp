#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <limits>
#include <nlohmann/json.hpp>
#include <sodium.h>

#include "proto/chunk.hpp"
#include "util/log.hpp"

namespace chunk
{

using json = nlohmann::json;

// wire field names
static constexpr const char F_KIND[]  = "kind";
static constexpr const char F_INDEX[] = "index";
static constexpr const char F_TOTAL[] = "total";
static constexpr const char F_KEY[]   = "objectKey";
static constexpr const char F_SIZE[]  = "objectSize";
static constexpr const char F_TS[]    = "timestamp";
static constexpr const char F_NAME[]  = "name";

static constexpr std::size_t KEY_NONCE_BYTES = 4;

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::uint32_t chunk_count(std::uint64_t object_size, std::size_t chunk_size)
{
    if (chunk_size == 0)
        return 0;
    const std::uint64_t n = (object_size + chunk_size - 1) / chunk_size;
    if (n > std::numeric_limits<std::uint32_t>::max())
        return 0;
    return static_cast<std::uint32_t>(n);
}

std::vector<Descriptor> plan_chunks(const Identity &id,
                                    std::uint64_t   object_size,
                                    std::size_t     chunk_size,
                                    std::int64_t    stamp_ms)
{
    if (chunk_size == 0)
    {
        LOG_ERROR("plan_chunks: invalid chunk_size (0)");
        return {};
    }
    if (object_size == 0)
    {
        LOG_ERROR("plan_chunks: nothing to transfer for '%s'", id.name.c_str());
        return {};
    }
    if (object_size <= chunk_size)
    {
        LOG_ERROR("plan_chunks: '%s' (%llu bytes) fits in one message, send it unsplit",
                  id.name.c_str(), (unsigned long long)object_size);
        return {};
    }

    const std::uint32_t total = chunk_count(object_size, chunk_size);
    if (total == 0)
    {
        LOG_ERROR("plan_chunks: object too large (%llu bytes at chunk_size %zu)",
                  (unsigned long long)object_size, chunk_size);
        return {};
    }

    std::vector<Descriptor> out;
    out.reserve(total);
    for (std::uint32_t i = 0; i < total; i++)
    {
        const std::uint64_t start = static_cast<std::uint64_t>(i) * chunk_size;
        const std::uint64_t end   = std::min<std::uint64_t>(start + chunk_size, object_size);

        Descriptor d;
        d.meta.index       = i;
        d.meta.total       = total;
        d.meta.object_key  = id.object_key;
        d.meta.object_size = object_size;
        d.meta.timestamp   = stamp_ms;
        d.meta.name        = id.name;
        d.range.offset     = start;
        d.range.length     = static_cast<std::size_t>(end - start);
        out.push_back(std::move(d));
    }
    return out;
}

std::string make_object_key(std::string_view name, std::uint64_t object_size, std::int64_t start_ms)
{
    // name alone collides when two same-named objects are in flight
    std::array<std::uint8_t, KEY_NONCE_BYTES> nonce{};
    if (ensure_sodium_init())
        randombytes_buf(nonce.data(), nonce.size());
    else
        LOG_WARN("make_object_key: libsodium init failed, key has no random part");

    std::array<char, KEY_NONCE_BYTES * 2 + 1> hex{};
    sodium_bin2hex(hex.data(), hex.size(), nonce.data(), nonce.size());

    std::string key(name);
    key += '-';
    key += std::to_string(object_size);
    key += '-';
    key += std::to_string(start_ms);
    key += '-';
    key += hex.data();
    return key;
}

std::string part_name(std::string_view name, std::uint32_t index, std::uint32_t total)
{
    // one-based like the receiver's download listing, at least three digits
    const std::string digits = std::to_string(total);
    const std::size_t width  = digits.size() < 3 ? 3 : digits.size();
    std::string       num    = std::to_string(static_cast<std::uint64_t>(index) + 1);
    if (num.size() < width)
        num.insert(0, width - num.size(), '0');
    return std::string(name) + ".part" + num;
}

std::string encode(const Metadata &m)
{
    json j = {
        {F_KIND, m.kind},
        {F_INDEX, m.index},
        {F_TOTAL, m.total},
        {F_KEY, m.object_key},
        {F_SIZE, m.object_size},
        {F_TS, m.timestamp},
    };
    if (!m.name.empty())
        j[F_NAME] = m.name;
    return j.dump();
}

static bool get_u32(const json &j, const char *key, std::uint32_t &out)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned())
        return false;
    const auto v = it->get<std::uint64_t>();
    if (v > std::numeric_limits<std::uint32_t>::max())
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

std::optional<Metadata> parse(std::string_view text)
{
    // cheap reject for ordinary chat lines; JSON allows leading whitespace
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos || text[first] != '{')
        return std::nullopt;

    json j = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object())
        return std::nullopt;

    auto kind = j.find(F_KIND);
    if (kind == j.end() || !kind->is_string() || kind->get<std::string>() != constants::CHUNK_KIND)
        return std::nullopt;

    Metadata m;
    m.kind = kind->get<std::string>();
    if (!get_u32(j, F_INDEX, m.index) || !get_u32(j, F_TOTAL, m.total))
        return std::nullopt;

    auto key = j.find(F_KEY);
    if (key == j.end() || !key->is_string())
        return std::nullopt;
    m.object_key = key->get<std::string>();

    auto size = j.find(F_SIZE);
    if (size == j.end() || !size->is_number_unsigned())
        return std::nullopt;
    m.object_size = size->get<std::uint64_t>();

    auto ts = j.find(F_TS);
    if (ts == j.end() || !ts->is_number_integer())
        return std::nullopt;
    if (ts->is_number_unsigned() &&
        ts->get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
        return std::nullopt;
    m.timestamp = ts->get<std::int64_t>();

    if (auto name = j.find(F_NAME); name != j.end())
    {
        if (!name->is_string())
            return std::nullopt;
        m.name = name->get<std::string>();
    }
    return m;
}

}  // namespace chunk
