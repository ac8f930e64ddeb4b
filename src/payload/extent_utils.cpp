#include "payload/extent_utils.hpp"

#include <algorithm>
#include <string>

namespace otadump {

namespace {

constexpr std::uint64_t kZeroChunk = 1024 * 1024;

Result Overflow(const Extent& e) {
    return Result::Fail(ErrorKind::SizeMismatch,
                        "Extent {" + std::to_string(e.start_block) + ", " +
                            std::to_string(e.num_blocks) + "} overflows the byte range");
}

// [offset, offset + length) of one extent.
std::expected<std::pair<std::uint64_t, std::uint64_t>, Result> ExtentBytes(const Extent& e,
                                                                          std::uint32_t block_size) {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::uint64_t end = 0;
    if (__builtin_mul_overflow(e.start_block, block_size, &offset) ||
        __builtin_mul_overflow(e.num_blocks, block_size, &length) ||
        __builtin_add_overflow(offset, length, &end)) {
        return std::unexpected(Overflow(e));
    }
    return std::make_pair(offset, length);
}

} // namespace

std::expected<std::uint64_t, Result> ExtentsByteLength(const ExtentList& extents,
                                                       std::uint32_t block_size) {
    std::uint64_t total = 0;
    for (const auto& e : extents) {
        auto bytes = ExtentBytes(e, block_size);
        if (!bytes) return std::unexpected(bytes.error());
        if (__builtin_add_overflow(total, bytes->second, &total)) {
            return std::unexpected(Overflow(e));
        }
    }
    return total;
}

std::expected<std::uint64_t, Result> ExtentsEndOffset(const ExtentList& extents,
                                                      std::uint32_t block_size) {
    std::uint64_t end = 0;
    for (const auto& e : extents) {
        auto bytes = ExtentBytes(e, block_size);
        if (!bytes) return std::unexpected(bytes.error());
        end = std::max(end, bytes->first + bytes->second);
    }
    return end;
}

std::expected<std::vector<std::uint8_t>, Result> ReadExtents(const IReadAt& in,
                                                             const ExtentList& extents,
                                                             std::uint32_t block_size) {
    auto total = ExtentsByteLength(extents, block_size);
    if (!total) return std::unexpected(total.error());

    std::vector<std::uint8_t> buf(static_cast<size_t>(*total));
    size_t pos = 0;
    for (const auto& e : extents) {
        auto bytes = ExtentBytes(e, block_size);
        if (!bytes) return std::unexpected(bytes.error());
        const auto [offset, length] = *bytes;
        auto r = in.ReadAt(offset, std::span<std::uint8_t>(buf.data() + pos, length));
        if (!r.ok) return std::unexpected(r);
        pos += length;
    }
    return buf;
}

Result WriteExtents(IWriteAt& out,
                    const ExtentList& extents,
                    std::uint32_t block_size,
                    std::span<const std::uint8_t> data) {
    auto total = ExtentsByteLength(extents, block_size);
    if (!total) return total.error();
    if (*total != data.size()) {
        return Result::Fail(ErrorKind::SizeMismatch,
                            "Decoded " + std::to_string(data.size()) + " bytes for " +
                                std::to_string(*total) + " bytes of destination extents");
    }

    size_t pos = 0;
    for (const auto& e : extents) {
        auto bytes = ExtentBytes(e, block_size);
        if (!bytes) return bytes.error();
        const auto [offset, length] = *bytes;
        auto r = out.WriteAt(offset, data.subspan(pos, length));
        if (!r.ok) return r;
        pos += length;
    }
    return Result::Ok();
}

Result ZeroExtents(IWriteAt& out, const ExtentList& extents, std::uint32_t block_size) {
    const std::vector<std::uint8_t> zeros(kZeroChunk, 0);
    for (const auto& e : extents) {
        auto bytes = ExtentBytes(e, block_size);
        if (!bytes) return bytes.error();
        auto [offset, length] = *bytes;
        while (length > 0) {
            const std::uint64_t n = std::min(length, kZeroChunk);
            auto r = out.WriteAt(offset, std::span<const std::uint8_t>(zeros.data(), n));
            if (!r.ok) return r;
            offset += n;
            length -= n;
        }
    }
    return Result::Ok();
}

} // namespace otadump
