#pragma once

#include "payload/extraction_scheduler.hpp"
#include "payload/manifest.hpp"
#include "payload/payload_file.hpp"
#include "payload/progress.hpp"
#include "util/result.hpp"

#include <atomic>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace otadump {

inline constexpr unsigned kDefaultWorkerCount = 4;

struct ExtractOptions {
    std::string payload_path;
    // Directory holding <name>.img base images, or one image shared by every
    // partition. Only incremental payloads need it.
    std::optional<std::string> source_path;
    // Empty selects every partition in the manifest.
    std::vector<std::string> partitions;
    std::string output_dir;
    // Where zip inputs are staged; empty for $TMPDIR.
    std::string staging_dir;
    unsigned worker_count = kDefaultWorkerCount;
    bool verify_blob_hashes = true;
    bool verify_source_hashes = true;
    bool verify_partition_hashes = true;

    const std::atomic_bool* cancel = nullptr;
    IProgress* progress = nullptr;
};

struct PartitionListing {
    std::string name;
    std::uint64_t size = 0;
};

// Partitions in manifest order. Touches no files.
std::vector<PartitionListing> ListPartitions(const Manifest& manifest);

// Opens |options.payload_path| and extracts the selected partitions.
std::expected<ExtractionReport, Result> Extract(const ExtractOptions& options);

// Same, for a payload the caller already opened. |options.payload_path| and
// |options.staging_dir| are ignored.
std::expected<ExtractionReport, Result> Extract(const PayloadFile& payload,
                                                const ExtractOptions& options);

} // namespace otadump
