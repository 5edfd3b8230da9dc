#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "proto/assembly_cache.hpp"
#include "transport/itransport.hpp"

namespace chunk
{

enum class MergeErrc
{
    None = 0,
    IncompleteSet,       // record set is not exactly [0, total); a cache defect
    PayloadUnavailable,  // a payload could not be resolved; nothing is returned
    SizeMismatch,        // bytes assembled but their count differs from objectSize
};

const char *merge_errc_name(MergeErrc e);

struct Object
{
    std::string                name;
    std::string                object_key;
    std::vector<std::uint8_t>  bytes;
};

struct MergeResult
{
    MergeErrc             error{MergeErrc::None};
    std::string           detail;
    std::optional<Object> object;  // also set on SizeMismatch

    bool ok() const { return error == MergeErrc::None; }
};

using Resolver = std::function<bool(const transport::PayloadRef &,
                                    transport::Payload &,
                                    transport::TransportError &)>;

MergeResult merge(std::vector<ChunkRecord> records, const Resolver &resolve);

}  // namespace chunk
