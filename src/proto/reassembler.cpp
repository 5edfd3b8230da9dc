#include <algorithm>
#include <cstdint>
#include <string>

#include "proto/reassembler.hpp"
#include "util/log.hpp"

namespace chunk
{

const char *merge_errc_name(MergeErrc e)
{
    switch (e)
    {
        case MergeErrc::None:
            return "none";
        case MergeErrc::IncompleteSet:
            return "incomplete-set";
        case MergeErrc::PayloadUnavailable:
            return "payload-unavailable";
        case MergeErrc::SizeMismatch:
            return "size-mismatch";
    }
    return "?";
}

static MergeResult fail(MergeErrc e, std::string detail)
{
    MergeResult r;
    r.error  = e;
    r.detail = std::move(detail);
    return r;
}

MergeResult merge(std::vector<ChunkRecord> records, const Resolver &resolve)
{
    if (records.empty())
        return fail(MergeErrc::IncompleteSet, "no records");

    std::stable_sort(records.begin(), records.end(),
                     [](const ChunkRecord &a, const ChunkRecord &b) {
                         return a.meta.index < b.meta.index;
                     });

    // the cache guarantees this; check again before touching the transport
    const Metadata &first = records.front().meta;
    if (records.size() != first.total)
        return fail(MergeErrc::IncompleteSet, "have " + std::to_string(records.size()) +
                                                  " of " + std::to_string(first.total));
    for (std::size_t i = 0; i < records.size(); i++)
    {
        const Metadata &m = records[i].meta;
        if (m.index != i || m.total != first.total || m.object_key != first.object_key)
            return fail(MergeErrc::IncompleteSet, "gap or foreign record at position " +
                                                      std::to_string(i));
    }

    Object obj;
    obj.object_key = first.object_key;
    obj.name       = first.name.empty() ? first.object_key : first.name;

    transport::Payload part;
    for (const auto &rec : records)
    {
        transport::TransportError err;
        part.clear();
        if (!resolve(rec.payload_ref, part, err))
        {
            LOG_ERROR("merge: chunk %u of %s unavailable (%s: %s)", rec.meta.index + 1,
                      obj.object_key.c_str(), transport::errc_name(err.code), err.detail.c_str());
            return fail(MergeErrc::PayloadUnavailable,
                        "chunk " + std::to_string(rec.meta.index) + ": " + err.detail);
        }
        // objectSize is remote input; size the buffer from bytes actually received
        if (obj.bytes.empty())
        {
            const std::uint64_t guess = static_cast<std::uint64_t>(part.size()) * records.size();
            obj.bytes.reserve(static_cast<std::size_t>(std::min(guess, first.object_size)));
        }
        obj.bytes.insert(obj.bytes.end(), part.begin(), part.end());
    }

    MergeResult r;
    if (obj.bytes.size() != first.object_size)
    {
        r.error  = MergeErrc::SizeMismatch;
        r.detail = "assembled " + std::to_string(obj.bytes.size()) + " bytes, expected " +
                   std::to_string(first.object_size);
        LOG_WARN("merge: %s for %s", r.detail.c_str(), obj.object_key.c_str());
    }
    r.object = std::move(obj);
    return r;
}

}  // namespace chunk
