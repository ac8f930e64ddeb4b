#pragma once

#include "crypto/sha256.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace otadump {

struct Extent {
    std::uint64_t start_block = 0;
    std::uint64_t num_blocks = 0;
};

using ExtentList = std::vector<Extent>;

// Byte range of an operation's raw data, relative to the payload data region.
struct BlobRef {
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    std::optional<Sha256Digest> sha256;
};

enum class ReplaceCodec { None, Bzip2, Xz, Zstd };

enum class DiffFormat { Bsdiff, BrotliBsdiff, Puffdiff };

struct ReplaceOp {
    ReplaceCodec codec = ReplaceCodec::None;
    BlobRef blob;
    ExtentList dst_extents;
};

// ZERO and DISCARD both produce zero-filled blocks in an image file.
struct ZeroOp {
    bool discard = false;
    ExtentList dst_extents;
};

struct SourceCopyOp {
    ExtentList src_extents;
    ExtentList dst_extents;
    std::optional<Sha256Digest> src_sha256;
};

struct DiffOp {
    DiffFormat format = DiffFormat::Bsdiff;
    BlobRef blob;
    ExtentList src_extents;
    ExtentList dst_extents;
    std::optional<Sha256Digest> src_sha256;
};

// An operation kind that cannot be applied (legacy or unknown). Kept in the
// operation list so that execution fails instead of silently skipping it.
struct UnsupportedOp {
    std::uint32_t type = 0;
    ExtentList dst_extents;
};

using InstallOperation = std::variant<ReplaceOp, ZeroOp, SourceCopyOp, DiffOp, UnsupportedOp>;

struct PartitionUpdate {
    std::string name;
    std::uint64_t new_size = 0;
    std::optional<Sha256Digest> new_hash;
    // Present only in incremental payloads.
    std::optional<std::uint64_t> old_size;
    std::optional<Sha256Digest> old_hash;
    std::string version;
    std::vector<InstallOperation> operations;
};

struct Manifest {
    std::uint32_t block_size = 0;
    std::uint32_t minor_version = 0;
    std::int64_t max_timestamp = 0;
    bool partial_update = false;
    std::string security_patch_level;
    std::vector<PartitionUpdate> partitions;

    const PartitionUpdate* FindPartition(const std::string& name) const;
    bool IsIncremental() const;
};

// Name of the manifest type number, e.g. "REPLACE_XZ" or "TYPE_42".
std::string OperationTypeName(std::uint32_t type);
// Type number an operation was decoded from.
std::uint32_t OperationTypeOf(const InstallOperation& op);
const ExtentList& DstExtentsOf(const InstallOperation& op);

} // namespace otadump
