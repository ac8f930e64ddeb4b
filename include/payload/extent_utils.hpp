#pragma once

#include "io/io.hpp"
#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace otadump {

// Total byte length of |extents|, failing with SizeMismatch on overflow.
std::expected<std::uint64_t, Result> ExtentsByteLength(const ExtentList& extents,
                                                       std::uint32_t block_size);

// Byte offset one past the furthest block any extent touches.
std::expected<std::uint64_t, Result> ExtentsEndOffset(const ExtentList& extents,
                                                      std::uint32_t block_size);

// Reads every extent in order and concatenates the bytes.
std::expected<std::vector<std::uint8_t>, Result> ReadExtents(const IReadAt& in,
                                                             const ExtentList& extents,
                                                             std::uint32_t block_size);

// Slices |data| at running offsets and writes each slice at its extent.
// |data| must cover the extents exactly.
Result WriteExtents(IWriteAt& out,
                    const ExtentList& extents,
                    std::uint32_t block_size,
                    std::span<const std::uint8_t> data);

// Zero-fills every extent without materializing the whole range in memory.
Result ZeroExtents(IWriteAt& out, const ExtentList& extents, std::uint32_t block_size);

} // namespace otadump
