#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "util/constants.hpp"

/*
TX:
send_object(source, name)
  -> make_object_key(name, size, start_ms)
     -> plan_chunks(identity, size, chunk_size, now_ms)   // ranges only, no bytes
        -> for each Descriptor:
             source.read(range) -> payload
             encode(meta) -> message text
               -> transport.send({text, part_name(...), payload})

RX:
transport.on_rx({text, attachments})
  -> parse(text)  // not ours? drop silently
     -> cache.insert({meta, attachments[0].ref})
        -> complete ? cache.take_complete(key) -> merge(records, resolve) -> object
*/

namespace chunk
{

struct Metadata
{
    std::string   kind{constants::CHUNK_KIND};
    std::uint32_t index{0};
    std::uint32_t total{0};
    std::string   object_key;
    std::uint64_t object_size{0};
    std::int64_t  timestamp{0};  // sender wall clock, ms since epoch; never used for ordering
    std::string   name;          // optional on the wire
};

// Caller-supplied identity of the object being split.
struct Identity
{
    std::string name;
    std::string object_key;
};

struct Range
{
    std::uint64_t offset{0};
    std::size_t   length{0};
};

struct Descriptor
{
    Metadata meta;
    Range    range;
};

// TX
// Empty when the object cannot be split: size 0, chunk_size 0, size <= chunk_size
// (send it unsplit), or more chunks than the index field can carry.
std::vector<Descriptor> plan_chunks(const Identity &id,
                                    std::uint64_t   object_size,
                                    std::size_t     chunk_size,
                                    std::int64_t    stamp_ms);
std::uint32_t           chunk_count(std::uint64_t object_size, std::size_t chunk_size);
std::string             make_object_key(std::string_view name,
                                        std::uint64_t    object_size,
                                        std::int64_t     start_ms);
std::string             part_name(std::string_view name, std::uint32_t index, std::uint32_t total);
std::string             encode(const Metadata &m);
std::int64_t            now_ms();

// RX
// nullopt for anything that is not a well-formed chunk message; the channel
// carries unrelated traffic, so this is not an error.
std::optional<Metadata> parse(std::string_view text);

}  // namespace chunk
