#include "payload/extraction_scheduler.hpp"

#include "io/file_reader.hpp"
#include "io/partition_writer.hpp"
#include "payload/extent_utils.hpp"
#include "payload/hash_verifier.hpp"
#include "payload/operation_executor.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <exception>
#include <thread>

namespace otadump {

const char* PartitionStateName(PartitionState state) {
    switch (state) {
        case PartitionState::Pending:   return "Pending";
        case PartitionState::Running:   return "Running";
        case PartitionState::Completed: return "Completed";
        case PartitionState::Failed:    return "Failed";
    }
    return "Unknown";
}

bool ExtractionReport::AllCompleted() const {
    return std::all_of(partitions.begin(), partitions.end(), [](const PartitionResult& p) {
        return p.state == PartitionState::Completed;
    });
}

std::size_t ExtractionReport::FailedCount() const {
    return static_cast<std::size_t>(
        std::count_if(partitions.begin(), partitions.end(), [](const PartitionResult& p) {
            return p.state == PartitionState::Failed;
        }));
}

const PartitionResult* ExtractionReport::Find(const std::string& name) const {
    for (const auto& p : partitions) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

ExtractionScheduler::ExtractionScheduler(const Manifest& manifest,
                                         const BlobReader& blobs,
                                         const IReadAt* shared_source,
                                         SchedulerOptions options)
    : manifest_(manifest), blobs_(blobs), shared_source_(shared_source), options_(options) {}

PartitionState ExtractionScheduler::StateOf(std::size_t job_index) const {
    if (job_index >= state_count_) return PartitionState::Pending;
    return states_[job_index].load(std::memory_order_acquire);
}

ExtractionReport ExtractionScheduler::Run(const std::vector<PartitionJob>& jobs) {
    ExtractionReport report;
    report.partitions.resize(jobs.size());

    states_ = std::make_unique<std::atomic<PartitionState>[]>(jobs.size());
    state_count_ = jobs.size();
    next_job_.store(0);

    std::uint64_t ops_total = 0;
    std::uint64_t bytes_total = 0;
    for (std::size_t i = 0; i < jobs.size(); ++i) {
        states_[i].store(PartitionState::Pending);
        report.partitions[i].name = jobs[i].partition->name;
        report.partitions[i].output_path = jobs[i].output_path;
        ops_total += jobs[i].partition->operations.size();
        for (const auto& op : jobs[i].partition->operations) {
            auto len = ExtentsByteLength(DstExtentsOf(op), manifest_.block_size);
            if (len) bytes_total += *len;
        }
    }
    progress_.partitions_total.store(jobs.size());
    progress_.operations_total.store(ops_total);
    progress_.bytes_total.store(bytes_total);

    if (jobs.empty()) return report;

    const unsigned workers = static_cast<unsigned>(
        std::clamp<std::size_t>(options_.worker_count, 1, jobs.size()));
    LogInfo("Extracting %zu partition(s) with %u worker(s)", jobs.size(), workers);

    {
        std::lock_guard<std::mutex> lk(mu_);
        workers_running_ = workers;
    }
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
        pool.emplace_back([this, &jobs, &report] { WorkerLoop(jobs, report); });
    }

    {
        std::unique_lock<std::mutex> lk(mu_);
        while (workers_running_ > 0) {
            done_cv_.wait_for(lk, options_.progress_interval);
            lk.unlock();
            PublishProgress();
            lk.lock();
        }
    }
    for (auto& t : pool) t.join();
    PublishProgress();

    return report;
}

void ExtractionScheduler::PublishProgress() {
    if (!options_.progress_sink) return;
    ProgressEvent e = progress_.Snapshot();
    const PartitionUpdate* cur = current_.load(std::memory_order_relaxed);
    if (cur) e.current = cur->name;
    options_.progress_sink->OnProgress(e);
}

void ExtractionScheduler::WorkerLoop(const std::vector<PartitionJob>& jobs, ExtractionReport& report) {
    while (true) {
        const std::size_t i = next_job_.fetch_add(1);
        if (i >= jobs.size()) break;

        // Each job index is owned by exactly one worker, so its report slot
        // needs no locking.
        PartitionResult& result = report.partitions[i];
        states_[i].store(PartitionState::Running, std::memory_order_release);
        current_.store(jobs[i].partition, std::memory_order_relaxed);

        Result r;
        try {
            r = ExtractPartition(jobs[i], result);
        } catch (const std::exception& e) {
            r = Result::Fail(ErrorKind::Io, result.name + ": " + e.what());
        }

        result.error = r;
        result.state = r.ok ? PartitionState::Completed : PartitionState::Failed;
        states_[i].store(result.state, std::memory_order_release);
        progress_.partitions_done.fetch_add(1, std::memory_order_relaxed);

        if (r.ok) {
            LogInfo("Partition %s done", result.name.c_str());
        } else {
            LogError("Partition %s failed [%s]: %s",
                     result.name.c_str(), ErrorKindName(r.kind), r.msg.c_str());
        }
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (--workers_running_ == 0) done_cv_.notify_all();
}

Result ExtractionScheduler::ExtractPartition(const PartitionJob& job, PartitionResult& result) {
    const PartitionUpdate& p = *job.partition;
    LogInfo("Extracting %s: %llu bytes, %zu operation(s) -> %s",
            p.name.c_str(), (unsigned long long)p.new_size, p.operations.size(),
            job.output_path.c_str());

    PartitionWriter target;
    auto r = PartitionWriter::Create(job.output_path, p.new_size, target);
    if (!r.ok) return r;

    PositionalFileReader own_source;
    const IReadAt* source = shared_source_;
    if (!job.source_path.empty()) {
        r = PositionalFileReader::Open(job.source_path, own_source);
        if (!r.ok) return r;
        source = &own_source;
        LogDebug("%s: source image %s", p.name.c_str(), job.source_path.c_str());
    }

    OperationContext ctx;
    ctx.partition = p.name;
    ctx.block_size = manifest_.block_size;
    ctx.image_size = p.new_size;
    ctx.blobs = &blobs_;
    ctx.source = source;
    ctx.target = &target;
    ctx.verify_blob_hashes = options_.verify_blob_hashes;
    ctx.verify_source_hashes = options_.verify_source_hashes;
    OperationExecutor executor(ctx);

    for (std::size_t i = 0; i < p.operations.size(); ++i) {
        if (options_.cancel && options_.cancel->load(std::memory_order_relaxed)) {
            return Result::Fail(ErrorKind::Cancelled,
                                p.name + ": cancelled after " + std::to_string(i) + " operation(s)");
        }
        std::uint64_t written = 0;
        r = executor.Execute(p.operations[i], i, &written);
        if (!r.ok) return r;

        ++result.operations_done;
        progress_.operations_done.fetch_add(1, std::memory_order_relaxed);
        progress_.bytes_done.fetch_add(written, std::memory_order_relaxed);
    }

    r = target.FsyncNow();
    if (!r.ok) return r;

    if (options_.verify_partition_hashes && p.new_hash) {
        PositionalFileReader image;
        r = PositionalFileReader::Open(job.output_path, image);
        if (!r.ok) return r;
        r = VerifySha256(image, p.new_size, p.new_hash, p.name + " image");
        if (!r.ok) return r;
        LogDebug("%s: image hash verified", p.name.c_str());
    }

    return Result::Ok();
}

} // namespace otadump
