#pragma once
#include <atomic>
#include <cstdint>
#include <string_view>

namespace otadump {

struct ProgressEvent {
    std::string_view current;  // a partition that is running, if any

    std::uint64_t partitions_done = 0;
    std::uint64_t partitions_total = 0;

    std::uint64_t operations_done = 0;
    std::uint64_t operations_total = 0;

    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
};

class IProgress {
  public:
    virtual ~IProgress() = default;
    virtual void OnProgress(const ProgressEvent& e) = 0;
};

// Counters bumped by workers and read by whoever renders progress. Values are
// approximate snapshots and never drive control flow.
struct ExtractionProgress {
    std::atomic<std::uint64_t> partitions_done{0};
    std::atomic<std::uint64_t> partitions_total{0};
    std::atomic<std::uint64_t> operations_done{0};
    std::atomic<std::uint64_t> operations_total{0};
    std::atomic<std::uint64_t> bytes_done{0};
    std::atomic<std::uint64_t> bytes_total{0};

    ProgressEvent Snapshot() const {
        ProgressEvent e;
        e.partitions_done = partitions_done.load(std::memory_order_relaxed);
        e.partitions_total = partitions_total.load(std::memory_order_relaxed);
        e.operations_done = operations_done.load(std::memory_order_relaxed);
        e.operations_total = operations_total.load(std::memory_order_relaxed);
        e.bytes_done = bytes_done.load(std::memory_order_relaxed);
        e.bytes_total = bytes_total.load(std::memory_order_relaxed);
        return e;
    }
};

} // namespace otadump
