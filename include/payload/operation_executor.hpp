#pragma once

#include "io/io.hpp"
#include "payload/blob_reader.hpp"
#include "payload/manifest.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace otadump {

// Everything one partition's operations need. The target belongs to the
// calling worker; the blob reader and source may be shared.
struct OperationContext {
    std::string partition;
    std::uint32_t block_size = 0;
    // Declared size of the target image; dst extents must end within it.
    std::uint64_t image_size = 0;
    const BlobReader* blobs = nullptr;
    const IReadAt* source = nullptr;  // nullptr when no base image is available
    IWriteAt* target = nullptr;
    bool verify_blob_hashes = true;
    bool verify_source_hashes = true;
};

class OperationExecutor {
public:
    explicit OperationExecutor(const OperationContext& ctx) : ctx_(ctx) {}

    // Produces the operation's output bytes and writes them to its dst extents.
    // On failure the message names the partition and operation index.
    Result Execute(const InstallOperation& op, std::size_t index, std::uint64_t* bytes_written = nullptr);

private:
    Result ExecuteReplace(const ReplaceOp& op, std::uint64_t dst_len);
    Result ExecuteZero(const ZeroOp& op);
    Result ExecuteSourceCopy(const SourceCopyOp& op, std::uint64_t dst_len);
    Result ExecuteDiff(const DiffOp& op, const std::string& where, std::uint64_t dst_len);

    std::expected<std::vector<std::uint8_t>, Result> ReadSource(const ExtentList& extents,
                                                                const std::optional<Sha256Digest>& hash);
    std::expected<std::vector<std::uint8_t>, Result> ReadBlob(const BlobRef& blob);

    const OperationContext& ctx_;
};

} // namespace otadump
