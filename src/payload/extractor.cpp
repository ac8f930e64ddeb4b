#include "payload/extractor.hpp"

#include "io/file_reader.hpp"
#include "util/logger.hpp"

#include <cerrno>
#include <filesystem>
#include <system_error>
#include <unordered_set>
#include <utility>
#include <variant>

namespace otadump {

namespace fs = std::filesystem;

namespace {

std::expected<std::vector<const PartitionUpdate*>, Result> SelectPartitions(
    const Manifest& manifest, const std::vector<std::string>& names) {
    std::vector<const PartitionUpdate*> out;
    if (names.empty()) {
        for (const auto& p : manifest.partitions) out.push_back(&p);
        return out;
    }

    std::unordered_set<std::string> wanted;
    for (const auto& n : names) {
        if (!manifest.FindPartition(n)) {
            return std::unexpected(Result::Fail(ErrorKind::Config, "Partition not in payload: " + n));
        }
        wanted.insert(n);
    }
    // Manifest order, duplicates folded.
    for (const auto& p : manifest.partitions) {
        if (wanted.count(p.name)) out.push_back(&p);
    }
    return out;
}

bool NeedsSource(const PartitionUpdate& p) {
    for (const auto& op : p.operations) {
        if (std::holds_alternative<SourceCopyOp>(op) || std::holds_alternative<DiffOp>(op))
            return true;
    }
    return false;
}

} // namespace

std::vector<PartitionListing> ListPartitions(const Manifest& manifest) {
    std::vector<PartitionListing> out;
    out.reserve(manifest.partitions.size());
    for (const auto& p : manifest.partitions) {
        out.push_back({.name = p.name, .size = p.new_size});
    }
    return out;
}

std::expected<ExtractionReport, Result> Extract(const ExtractOptions& options) {
    PayloadFile payload;
    auto r = PayloadFile::Open(options.payload_path, options.staging_dir, payload);
    if (!r.ok) return std::unexpected(r);
    return Extract(payload, options);
}

std::expected<ExtractionReport, Result> Extract(const PayloadFile& payload,
                                                const ExtractOptions& options) {
    if (options.worker_count == 0) {
        return std::unexpected(Result::Fail(ErrorKind::Config, "Worker count must be positive"));
    }

    const Manifest& manifest = payload.GetManifest();
    auto selected = SelectPartitions(manifest, options.partitions);
    if (!selected) return std::unexpected(selected.error());

    std::error_code ec;
    if (options.output_dir.empty() || !fs::is_directory(options.output_dir, ec)) {
        return std::unexpected(Result::Fail(
            ec ? ec.value() : ENOTDIR, "Output directory is not usable: " + options.output_dir));
    }

    bool source_is_dir = false;
    PositionalFileReader shared_source;
    if (options.source_path) {
        if (fs::is_directory(*options.source_path, ec)) {
            source_is_dir = true;
        } else {
            Result r = PositionalFileReader::Open(*options.source_path, shared_source);
            if (!r.ok) return std::unexpected(r);
        }
    } else {
        for (const PartitionUpdate* p : *selected) {
            if (NeedsSource(*p)) {
                return std::unexpected(Result::Fail(
                    ErrorKind::Config,
                    "Incremental payload: partition " + p->name + " needs a source image (--source)"));
            }
        }
    }

    std::vector<PartitionJob> jobs;
    jobs.reserve(selected->size());
    for (const PartitionUpdate* p : *selected) {
        PartitionJob job;
        job.partition = p;
        job.output_path = (fs::path(options.output_dir) / (p->name + ".img")).string();
        if (source_is_dir && NeedsSource(*p)) {
            job.source_path = (fs::path(*options.source_path) / (p->name + ".img")).string();
        }
        jobs.push_back(std::move(job));
    }

    SchedulerOptions sched;
    sched.worker_count = options.worker_count;
    sched.verify_blob_hashes = options.verify_blob_hashes;
    sched.verify_source_hashes = options.verify_source_hashes;
    sched.verify_partition_hashes = options.verify_partition_hashes;
    sched.cancel = options.cancel;
    sched.progress_sink = options.progress;

    const BlobReader blobs = payload.Blobs();
    ExtractionScheduler scheduler(manifest, blobs, shared_source.IsOpen() ? &shared_source : nullptr, sched);
    ExtractionReport report = scheduler.Run(jobs);

    if (report.AllCompleted()) {
        LogInfo("Extracted %zu partition(s) to %s", report.partitions.size(), options.output_dir.c_str());
    } else {
        LogError("%zu of %zu partition(s) failed", report.FailedCount(), report.partitions.size());
    }
    return report;
}

} // namespace otadump
