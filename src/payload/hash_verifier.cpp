#include "payload/hash_verifier.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace otadump {

namespace {

Result Compare(const Sha256Digest& actual, const Sha256Digest& expected, std::string_view what) {
    if (actual == expected) return Result::Ok();
    return Result::Fail(ErrorKind::HashMismatch,
                        std::string(what) + " sha256 mismatch: expected=" + HexEncode(expected) +
                            " actual=" + HexEncode(actual));
}

} // namespace

Result VerifySha256(std::span<const std::uint8_t> data,
                    const std::optional<Sha256Digest>& expected,
                    std::string_view what) {
    if (!expected) return Result::Ok();

    Sha256Digest actual{};
    if (!Sha256(data, actual)) {
        return Result::Fail(ErrorKind::Io, std::string(what) + ": sha256 compute failed");
    }
    return Compare(actual, *expected, what);
}

Result VerifySha256(const IReadAt& in,
                    std::uint64_t length,
                    const std::optional<Sha256Digest>& expected,
                    std::string_view what) {
    if (!expected) return Result::Ok();

    Sha256Hasher hasher;
    std::vector<std::uint8_t> buf(1024 * 1024);
    std::uint64_t pos = 0;
    while (pos < length) {
        const size_t n = static_cast<size_t>(std::min<std::uint64_t>(buf.size(), length - pos));
        auto r = in.ReadAt(pos, std::span<std::uint8_t>(buf.data(), n));
        if (!r.ok) return r;
        hasher.Update(std::span<const std::uint8_t>(buf.data(), n));
        pos += n;
    }

    Sha256Digest actual{};
    if (!hasher.Final(actual)) {
        return Result::Fail(ErrorKind::Io, std::string(what) + ": sha256 compute failed");
    }
    return Compare(actual, *expected, what);
}

} // namespace otadump
