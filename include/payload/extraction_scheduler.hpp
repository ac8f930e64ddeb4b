#pragma once

#include "io/io.hpp"
#include "payload/blob_reader.hpp"
#include "payload/manifest.hpp"
#include "payload/progress.hpp"
#include "util/result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace otadump {

enum class PartitionState : int { Pending, Running, Completed, Failed };

const char* PartitionStateName(PartitionState state);

struct PartitionJob {
    const PartitionUpdate* partition = nullptr;
    std::string output_path;
    // Base image for this partition alone. Empty means use the shared source.
    std::string source_path;
};

struct PartitionResult {
    std::string name;
    std::string output_path;
    PartitionState state = PartitionState::Pending;
    Result error;
    std::uint64_t operations_done = 0;
};

struct ExtractionReport {
    std::vector<PartitionResult> partitions;

    bool AllCompleted() const;
    std::size_t FailedCount() const;
    const PartitionResult* Find(const std::string& name) const;
};

struct SchedulerOptions {
    unsigned worker_count = 4;
    bool verify_blob_hashes = true;
    bool verify_source_hashes = true;
    bool verify_partition_hashes = true;
    const std::atomic_bool* cancel = nullptr;
    IProgress* progress_sink = nullptr;
    std::chrono::milliseconds progress_interval{200};
};

// Replays partitions on a fixed pool of worker threads. Operations of one
// partition run in manifest order on one worker; partitions are independent
// and a failure in one never stops the others.
class ExtractionScheduler {
public:
    ExtractionScheduler(const Manifest& manifest,
                        const BlobReader& blobs,
                        const IReadAt* shared_source,
                        SchedulerOptions options);

    ExtractionScheduler(const ExtractionScheduler&) = delete;
    ExtractionScheduler& operator=(const ExtractionScheduler&) = delete;

    // Blocks until every job is Completed or Failed. The calling thread feeds
    // the progress sink while it waits.
    ExtractionReport Run(const std::vector<PartitionJob>& jobs);

    // Safe to call from any thread while Run() is in progress.
    const ExtractionProgress& Progress() const { return progress_; }
    PartitionState StateOf(std::size_t job_index) const;

private:
    void WorkerLoop(const std::vector<PartitionJob>& jobs, ExtractionReport& report);
    Result ExtractPartition(const PartitionJob& job, PartitionResult& result);
    void PublishProgress();

    const Manifest& manifest_;
    const BlobReader& blobs_;
    const IReadAt* shared_source_;
    SchedulerOptions options_;

    ExtractionProgress progress_;
    std::unique_ptr<std::atomic<PartitionState>[]> states_;
    std::size_t state_count_ = 0;
    std::atomic<std::size_t> next_job_{0};
    std::atomic<const PartitionUpdate*> current_{nullptr};

    std::mutex mu_;
    std::condition_variable done_cv_;
    std::size_t workers_running_ = 0;
};

} // namespace otadump
