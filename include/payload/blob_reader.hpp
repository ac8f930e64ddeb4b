#pragma once

#include "io/io.hpp"
#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <vector>

namespace otadump {

// Fetches operation blobs from the payload data region. Holds no cursor, so
// one instance can serve every worker.
class BlobReader {
public:
    BlobReader(const IReadAt& payload, std::uint64_t data_region_offset)
        : payload_(payload), data_region_offset_(data_region_offset) {}

    std::expected<std::vector<std::uint8_t>, Result> Read(std::uint64_t data_offset,
                                                          std::uint64_t data_length) const;
    std::expected<std::vector<std::uint8_t>, Result> Read(const BlobRef& blob) const {
        return Read(blob.offset, blob.length);
    }

    std::uint64_t DataRegionOffset() const { return data_region_offset_; }

private:
    const IReadAt& payload_;
    std::uint64_t data_region_offset_ = 0;
};

} // namespace otadump
