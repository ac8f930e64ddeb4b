#include "payload/payload_header.hpp"

#include <algorithm>
#include <limits>
#include <string>

namespace otadump {

namespace {

template <typename T>
T LoadBigEndian(const std::uint8_t* p) {
    T v = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        v = static_cast<T>((v << 8) | p[i]);
    }
    return v;
}

} // namespace

std::expected<PayloadHeader, Result> ParsePayloadHeader(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < PayloadHeader::kSize) {
        return std::unexpected(Result::Fail(ErrorKind::TruncatedBlob,
                                            "Payload too short for header: " +
                                                std::to_string(bytes.size()) + " bytes"));
    }
    if (!std::equal(kPayloadMagic.begin(), kPayloadMagic.end(), bytes.begin())) {
        return std::unexpected(Result::Fail(ErrorKind::BadMagic, "Bad payload magic, expected CrAU"));
    }

    PayloadHeader h;
    h.major_version = LoadBigEndian<std::uint64_t>(bytes.data() + 4);
    if (h.major_version != kSupportedMajorVersion) {
        return std::unexpected(Result::Fail(ErrorKind::UnsupportedVersion,
                                            "Unsupported payload major version " +
                                                std::to_string(h.major_version)));
    }
    h.manifest_size = LoadBigEndian<std::uint64_t>(bytes.data() + 12);
    h.manifest_signature_size = LoadBigEndian<std::uint32_t>(bytes.data() + 20);

    // Keeps DataOffset() free of wraparound.
    constexpr auto kMax = std::numeric_limits<std::uint64_t>::max();
    if (h.manifest_size > kMax - PayloadHeader::kSize - h.manifest_signature_size) {
        return std::unexpected(Result::Fail(ErrorKind::TruncatedBlob,
                                            "Manifest size " + std::to_string(h.manifest_size) +
                                                " is out of range"));
    }
    return h;
}

std::expected<PayloadHeader, Result> ReadPayloadHeader(const IReadAt& in) {
    std::array<std::uint8_t, PayloadHeader::kSize> buf{};
    if (in.Size() < buf.size()) {
        return std::unexpected(Result::Fail(ErrorKind::TruncatedBlob,
                                            "Payload too short for header: " +
                                                std::to_string(in.Size()) + " bytes"));
    }
    auto r = in.ReadAt(0, buf);
    if (!r.ok) return std::unexpected(r);
    return ParsePayloadHeader(buf);
}

} // namespace otadump
