#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <array>
#include <cstdint>
#include <expected>
#include <span>

namespace otadump {

inline constexpr std::array<std::uint8_t, 4> kPayloadMagic = {'C', 'r', 'A', 'U'};
inline constexpr std::uint64_t kSupportedMajorVersion = 2;

// Fixed prefix of a major version 2 payload:
//   magic[4] | major_version u64be | manifest_size u64be | signature_size u32be
struct PayloadHeader {
    static constexpr std::uint64_t kSize = 4 + 8 + 8 + 4;

    std::uint64_t major_version = 0;
    std::uint64_t manifest_size = 0;
    std::uint32_t manifest_signature_size = 0;

    std::uint64_t ManifestOffset() const { return kSize; }
    std::uint64_t SignatureOffset() const { return kSize + manifest_size; }
    // Absolute offset of the data region that every blob offset is relative to.
    std::uint64_t DataOffset() const { return kSize + manifest_size + manifest_signature_size; }
};

std::expected<PayloadHeader, Result> ParsePayloadHeader(std::span<const std::uint8_t> bytes);
std::expected<PayloadHeader, Result> ReadPayloadHeader(const IReadAt& in);

} // namespace otadump
