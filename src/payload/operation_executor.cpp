#include "payload/operation_executor.hpp"

#include "payload/codecs.hpp"
#include "payload/extent_utils.hpp"
#include "payload/hash_verifier.hpp"
#include "util/logger.hpp"
#include "util/overloaded.hpp"

#include <utility>

namespace otadump {

namespace {

Result WithContext(Result r, const std::string& where) {
    if (!r.ok) r.msg = where + ": " + r.msg;
    return r;
}

} // namespace

Result OperationExecutor::Execute(const InstallOperation& op,
                                  std::size_t index,
                                  std::uint64_t* bytes_written) {
    const std::string where = ctx_.partition + " operation " + std::to_string(index) + " (" +
                              OperationTypeName(OperationTypeOf(op)) + ")";

    auto dst_len = ExtentsByteLength(DstExtentsOf(op), ctx_.block_size);
    if (!dst_len) return WithContext(dst_len.error(), where);
    auto dst_end = ExtentsEndOffset(DstExtentsOf(op), ctx_.block_size);
    if (!dst_end) return WithContext(dst_end.error(), where);
    if (*dst_end > ctx_.image_size) {
        return WithContext(Result::Fail(ErrorKind::SizeMismatch,
                                        "Destination extents end at byte " + std::to_string(*dst_end) +
                                            ", past image size " + std::to_string(ctx_.image_size)),
                           where);
    }

    Result r = std::visit(
        Overloaded{
            [&](const ReplaceOp& o) { return ExecuteReplace(o, *dst_len); },
            [&](const ZeroOp& o) { return ExecuteZero(o); },
            [&](const SourceCopyOp& o) { return ExecuteSourceCopy(o, *dst_len); },
            [&](const DiffOp& o) { return ExecuteDiff(o, where, *dst_len); },
            [&](const UnsupportedOp& o) {
                return Result::Fail(ErrorKind::UnsupportedOperation,
                                    "Unsupported operation type " + OperationTypeName(o.type));
            },
        },
        op);
    if (!r.ok) return WithContext(std::move(r), where);

    if (bytes_written) *bytes_written = *dst_len;
    return Result::Ok();
}

// Failures from here on are prefixed with the operation by Execute.
std::expected<std::vector<std::uint8_t>, Result> OperationExecutor::ReadBlob(const BlobRef& blob) {
    auto data = ctx_.blobs->Read(blob);
    if (!data) return data;
    if (ctx_.verify_blob_hashes) {
        auto v = VerifySha256(*data, blob.sha256, "data");
        if (!v.ok) return std::unexpected(v);
    }
    return data;
}

std::expected<std::vector<std::uint8_t>, Result> OperationExecutor::ReadSource(
    const ExtentList& extents,
    const std::optional<Sha256Digest>& hash) {
    if (!ctx_.source) {
        return std::unexpected(Result::Fail(ErrorKind::Io,
                                            "Source image required but none was provided"));
    }
    auto data = ReadExtents(*ctx_.source, extents, ctx_.block_size);
    if (!data) return data;
    if (ctx_.verify_source_hashes) {
        auto v = VerifySha256(*data, hash, "source");
        if (!v.ok) return std::unexpected(v);
    }
    return data;
}

Result OperationExecutor::ExecuteReplace(const ReplaceOp& op, std::uint64_t dst_len) {
    auto blob = ReadBlob(op.blob);
    if (!blob) return blob.error();

    auto decoded = DecodeReplaceBlob(op.codec, std::move(*blob), dst_len);
    if (!decoded) return decoded.error();

    return WriteExtents(*ctx_.target, op.dst_extents, ctx_.block_size, *decoded);
}

Result OperationExecutor::ExecuteZero(const ZeroOp& op) {
    return ZeroExtents(*ctx_.target, op.dst_extents, ctx_.block_size);
}

Result OperationExecutor::ExecuteSourceCopy(const SourceCopyOp& op, std::uint64_t dst_len) {
    auto src = ReadSource(op.src_extents, op.src_sha256);
    if (!src) return src.error();
    if (src->size() != dst_len) {
        return Result::Fail(ErrorKind::SizeMismatch,
                            "Source extents hold " + std::to_string(src->size()) +
                                " bytes, destination extents " + std::to_string(dst_len));
    }
    return WriteExtents(*ctx_.target, op.dst_extents, ctx_.block_size, *src);
}

Result OperationExecutor::ExecuteDiff(const DiffOp& op,
                                      const std::string& where,
                                      std::uint64_t dst_len) {
    if (!DiffFormatAvailable(op.format)) {
        return Result::Fail(ErrorKind::UnsupportedOperation,
                            std::string("Patch format ") + DiffFormatName(op.format) +
                                " is not supported by this build");
    }

    auto patch = ReadBlob(op.blob);
    if (!patch) return patch.error();
    auto src = ReadSource(op.src_extents, op.src_sha256);
    if (!src) return src.error();

    LogDebug("%s: applying %s patch (%zu bytes) to %zu source bytes",
             where.c_str(), DiffFormatName(op.format), patch->size(), src->size());

    auto out = ApplyDiffPatch(op.format, *src, *patch, dst_len);
    if (!out) return out.error();

    return WriteExtents(*ctx_.target, op.dst_extents, ctx_.block_size, *out);
}

} // namespace otadump
