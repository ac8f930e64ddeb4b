#include "payload/manifest_decoder.hpp"

#include "update_metadata.pb.h"
#include "util/path_utils.hpp"

#include <algorithm>
#include <limits>
#include <set>
#include <string>

namespace otadump {

namespace pb = update_metadata;

namespace {

Result Missing(const std::string& what) {
    return Result::Fail(ErrorKind::MissingField, "Manifest is missing " + what);
}

// Empty digest fields mean "not declared".
std::expected<std::optional<Sha256Digest>, Result> ConvertDigest(const std::string& raw,
                                                                  const std::string& what) {
    if (raw.empty()) return std::optional<Sha256Digest>{};
    if (raw.size() != kSha256Size) {
        return std::unexpected(Result::Fail(ErrorKind::ManifestDecodeError,
                                            what + " has length " + std::to_string(raw.size()) +
                                                ", expected " + std::to_string(kSha256Size)));
    }
    Sha256Digest d{};
    std::copy(raw.begin(), raw.end(), d.begin());
    return std::optional<Sha256Digest>{d};
}

ExtentList ConvertExtents(const google::protobuf::RepeatedPtrField<pb::Extent>& in) {
    ExtentList out;
    out.reserve(static_cast<size_t>(in.size()));
    for (const auto& e : in) {
        out.push_back(Extent{.start_block = e.start_block(), .num_blocks = e.num_blocks()});
    }
    return out;
}

std::expected<InstallOperation, Result> ConvertOperation(const pb::InstallOperation& op,
                                                         const std::string& where) {
    auto data_hash = ConvertDigest(op.data_sha256_hash(), where + " data_sha256_hash");
    if (!data_hash) return std::unexpected(data_hash.error());
    auto src_hash = ConvertDigest(op.src_sha256_hash(), where + " src_sha256_hash");
    if (!src_hash) return std::unexpected(src_hash.error());

    BlobRef blob{.offset = op.data_offset(), .length = op.data_length(), .sha256 = *data_hash};

    switch (op.type()) {
        case pb::InstallOperation::REPLACE:
        case pb::InstallOperation::REPLACE_BZ:
        case pb::InstallOperation::REPLACE_XZ:
        case pb::InstallOperation::REPLACE_ZSTD: {
            ReplaceOp r;
            r.codec = op.type() == pb::InstallOperation::REPLACE_BZ   ? ReplaceCodec::Bzip2
                      : op.type() == pb::InstallOperation::REPLACE_XZ ? ReplaceCodec::Xz
                      : op.type() == pb::InstallOperation::REPLACE_ZSTD
                          ? ReplaceCodec::Zstd
                          : ReplaceCodec::None;
            r.blob = blob;
            r.dst_extents = ConvertExtents(op.dst_extents());
            return r;
        }
        case pb::InstallOperation::ZERO:
        case pb::InstallOperation::DISCARD:
            return ZeroOp{.discard = op.type() == pb::InstallOperation::DISCARD,
                          .dst_extents = ConvertExtents(op.dst_extents())};
        case pb::InstallOperation::SOURCE_COPY:
            return SourceCopyOp{.src_extents = ConvertExtents(op.src_extents()),
                                .dst_extents = ConvertExtents(op.dst_extents()),
                                .src_sha256 = *src_hash};
        case pb::InstallOperation::SOURCE_BSDIFF:
        case pb::InstallOperation::BROTLI_BSDIFF:
        case pb::InstallOperation::PUFFDIFF: {
            DiffOp d;
            d.format = op.type() == pb::InstallOperation::PUFFDIFF        ? DiffFormat::Puffdiff
                       : op.type() == pb::InstallOperation::BROTLI_BSDIFF ? DiffFormat::BrotliBsdiff
                                                                          : DiffFormat::Bsdiff;
            d.blob = blob;
            d.src_extents = ConvertExtents(op.src_extents());
            d.dst_extents = ConvertExtents(op.dst_extents());
            d.src_sha256 = *src_hash;
            return d;
        }
        default:
            return UnsupportedOp{.type = op.type(), .dst_extents = ConvertExtents(op.dst_extents())};
    }
}

} // namespace

std::expected<Manifest, Result> ConvertManifest(const pb::DeltaArchiveManifest& in) {
    if (!in.has_block_size()) return std::unexpected(Missing("block_size"));
    if (in.block_size() == 0) {
        return std::unexpected(Result::Fail(ErrorKind::MissingField, "Manifest block_size is zero"));
    }
    if (in.partitions_size() == 0) return std::unexpected(Missing("partitions"));

    Manifest m;
    m.block_size = in.block_size();
    m.minor_version = in.minor_version();
    m.max_timestamp = in.max_timestamp();
    m.partial_update = in.partial_update();
    m.security_patch_level = in.security_patch_level();
    m.partitions.reserve(static_cast<size_t>(in.partitions_size()));

    std::set<std::string> seen;
    for (const auto& p : in.partitions()) {
        if (p.partition_name().empty()) return std::unexpected(Missing("a partition name"));
        // Names become output file names.
        if (!IsPlainFileName(p.partition_name())) {
            return std::unexpected(Result::Fail(ErrorKind::ManifestDecodeError,
                                                "Invalid partition name '" + p.partition_name() + "'"));
        }
        if (!seen.insert(p.partition_name()).second) {
            return std::unexpected(Result::Fail(ErrorKind::ManifestDecodeError,
                                                "Duplicate partition " + p.partition_name()));
        }
        if (!p.has_new_partition_info() || !p.new_partition_info().has_size()) {
            return std::unexpected(Missing("new_partition_info.size of " + p.partition_name()));
        }

        PartitionUpdate out;
        out.name = p.partition_name();
        out.new_size = p.new_partition_info().size();
        out.version = p.version();

        auto new_hash = ConvertDigest(p.new_partition_info().hash(), out.name + " new_partition_info.hash");
        if (!new_hash) return std::unexpected(new_hash.error());
        out.new_hash = *new_hash;

        if (p.has_old_partition_info()) {
            out.old_size = p.old_partition_info().size();
            auto old_hash =
                ConvertDigest(p.old_partition_info().hash(), out.name + " old_partition_info.hash");
            if (!old_hash) return std::unexpected(old_hash.error());
            out.old_hash = *old_hash;
        }

        out.operations.reserve(static_cast<size_t>(p.operations_size()));
        for (int i = 0; i < p.operations_size(); ++i) {
            auto op = ConvertOperation(p.operations(i),
                                       out.name + " operation " + std::to_string(i));
            if (!op) return std::unexpected(op.error());
            out.operations.push_back(std::move(*op));
        }
        m.partitions.push_back(std::move(out));
    }
    return m;
}

std::expected<Manifest, Result> DecodeManifest(std::span<const std::uint8_t> bytes) {
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return std::unexpected(Result::Fail(ErrorKind::ManifestDecodeError,
                                            "Manifest too large: " + std::to_string(bytes.size())));
    }
    pb::DeltaArchiveManifest msg;
    if (!msg.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return std::unexpected(Result::Fail(ErrorKind::ManifestDecodeError,
                                            "Failed to parse manifest protobuf (" +
                                                std::to_string(bytes.size()) + " bytes)"));
    }
    return ConvertManifest(msg);
}

std::expected<std::size_t, Result> CountManifestSignatures(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) return std::size_t{0};
    pb::Signatures sigs;
    if (bytes.size() > static_cast<size_t>(std::numeric_limits<int>::max()) ||
        !sigs.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return std::unexpected(Result::Fail(ErrorKind::ManifestDecodeError,
                                            "Failed to parse metadata signature blob"));
    }
    return static_cast<std::size_t>(sigs.signatures_size());
}

} // namespace otadump
