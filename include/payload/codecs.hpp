#pragma once

#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace otadump {

const char* ReplaceCodecName(ReplaceCodec codec);
const char* DiffFormatName(DiffFormat format);

// Whether this build links the library behind a codec.
bool ReplaceCodecAvailable(ReplaceCodec codec);
bool DiffFormatAvailable(DiffFormat format);

// Turns a verified REPLACE* blob into exactly |expected_size| output bytes.
// Producing fewer or more bytes is a SizeMismatch.
std::expected<std::vector<std::uint8_t>, Result> DecodeReplaceBlob(ReplaceCodec codec,
                                                                   std::vector<std::uint8_t> blob,
                                                                   std::uint64_t expected_size);

// Applies a binary patch to the concatenated source-extent bytes. The result
// depends only on (|source|, |patch|).
std::expected<std::vector<std::uint8_t>, Result> ApplyDiffPatch(DiffFormat format,
                                                                std::span<const std::uint8_t> source,
                                                                std::span<const std::uint8_t> patch,
                                                                std::uint64_t expected_size);

} // namespace otadump
