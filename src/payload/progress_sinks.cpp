#include "payload/progress_sinks.hpp"

#include <atomic>
#include <cstdio>

namespace otadump {

namespace {
std::atomic_bool g_progress_line_active{false};

int Percent(std::uint64_t done, std::uint64_t total) {
    if (total == 0) return 0;
    const int pct = static_cast<int>((done * 100ULL) / total);
    return pct > 100 ? 100 : pct;
}
} // namespace

void ConsoleProgressSink::OnProgress(const ProgressEvent& e) {
    if (finished_) return;

    const int bytes_pct = Percent(e.bytes_done, e.bytes_total);
    std::fprintf(stderr,
                 "\r[%3d%%] partitions %llu/%llu | ops %llu/%llu | %llu MiB",
                 bytes_pct,
                 (unsigned long long)e.partitions_done,
                 (unsigned long long)e.partitions_total,
                 (unsigned long long)e.operations_done,
                 (unsigned long long)e.operations_total,
                 (unsigned long long)(e.bytes_done >> 20));
    if (!e.current.empty()) {
        std::fprintf(stderr, " [%.*s]   ", (int)e.current.size(), e.current.data());
    }
    std::fflush(stderr);
    g_progress_line_active.store(true, std::memory_order_relaxed);

    if (e.partitions_total > 0 && e.partitions_done >= e.partitions_total) {
        std::fprintf(stderr, "\n");
        g_progress_line_active.store(false, std::memory_order_relaxed);
        finished_ = true;
    }
}

bool IsProgressLineActive() { return g_progress_line_active.load(std::memory_order_relaxed); }

void ClearProgressLine() {
    if (g_progress_line_active.exchange(false, std::memory_order_relaxed)) {
        std::fprintf(stderr, "\n");
    }
}

} // namespace otadump
