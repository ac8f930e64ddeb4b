#pragma once

#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <span>

namespace otadump {

namespace update_metadata {
class DeltaArchiveManifest;
} // namespace update_metadata

// Parses the protobuf manifest blob and converts it to the typed model.
std::expected<Manifest, Result> DecodeManifest(std::span<const std::uint8_t> bytes);

// Conversion step on its own, for callers that already hold the message.
std::expected<Manifest, Result> ConvertManifest(const update_metadata::DeltaArchiveManifest& pb);

// Number of signatures in the metadata signature blob. The signatures are
// decoded for reporting only and never verified.
std::expected<std::size_t, Result> CountManifestSignatures(std::span<const std::uint8_t> bytes);

} // namespace otadump
