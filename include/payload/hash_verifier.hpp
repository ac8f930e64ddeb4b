#pragma once

#include "crypto/sha256.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace otadump {

// Compares SHA-256(|data|) to |expected|. Nothing declared means nothing to
// check. |what| names the checked object in the failure message, e.g.
// "system operation 12 data".
Result VerifySha256(std::span<const std::uint8_t> data,
                    const std::optional<Sha256Digest>& expected,
                    std::string_view what);

// Same check over the first |length| bytes of a file.
Result VerifySha256(const IReadAt& in,
                    std::uint64_t length,
                    const std::optional<Sha256Digest>& expected,
                    std::string_view what);

} // namespace otadump
