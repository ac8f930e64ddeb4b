#include "payload/extractor.hpp"
#include "payload/payload_file.hpp"
#include "payload/progress_sinks.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

enum LongOnly : int {
    kOptNoVerify = 1000,
};

void PrintUsage(const char* argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] <payload.bin|ota.zip>\n"
        "\n"
        "Options:\n"
        "  -l, --list               List partitions and exit\n"
        "  -p, --partitions a,b     Extract only these partitions\n"
        "  -o, --output DIR         Output directory (default: extracted_<unix time> next to the payload)\n"
        "  -s, --source PATH        Base images for incremental payloads: a directory of <name>.img\n"
        "                           files, or one image file\n"
        "  -j, --workers N          Partitions extracted in parallel (default %u)\n"
        "  -c, --config FILE        JSON config file\n"
        "  -q, --quiet              Errors only, no progress line\n"
        "  -v, --verbose            Debug logging\n"
        "      --no-verify          Skip every SHA-256 check\n"
        "  -h, --help               Show this help\n",
        argv0, otadump::kDefaultWorkerCount);
}

bool ParseWorkers(const char* s, unsigned& out) {
    char* end = nullptr;
    const unsigned long v = std::strtoul(s, &end, 10);
    if (!end || *end != '\0' || end == s || v == 0 || v > 1024)
        return false;
    out = static_cast<unsigned>(v);
    return true;
}

std::string DefaultOutputDir(const std::string& payload_path) {
    namespace fs = std::filesystem;
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path base = fs::path(payload_path).parent_path();
    return (base / ("extracted_" + std::to_string(secs))).string();
}

void PrintListing(const otadump::PayloadFile& payload) {
    const auto& m = payload.GetManifest();
    const auto& h = payload.Header();
    std::printf("Payload version: %llu\n", (unsigned long long)h.major_version);
    std::printf("Manifest: %llu bytes, %zu signature(s)\n",
                (unsigned long long)h.manifest_size, payload.SignatureCount());
    std::printf("Block size: %u, minor version: %u%s\n",
                m.block_size, m.minor_version, m.IsIncremental() ? " (incremental)" : "");
    if (!m.security_patch_level.empty())
        std::printf("Security patch level: %s\n", m.security_patch_level.c_str());
    std::printf("Partitions: %zu\n\n", m.partitions.size());

    for (const auto& p : otadump::ListPartitions(m)) {
        std::printf("%-24s %14llu  (%s)\n",
                    p.name.c_str(), (unsigned long long)p.size, otadump::HumanSize(p.size).c_str());
    }
}

} // namespace

int main(int argc, char** argv) {
    otadump::InstallSignalHandlers();

    bool list_only = false;
    bool quiet = false;
    bool verbose = false;
    bool no_verify = false;
    std::optional<std::string> output_cli;
    std::optional<std::string> source_cli;
    std::optional<unsigned> workers_cli;
    std::string config_path;
    std::vector<std::string> partitions;

    static option long_opts[] = {
        {"list", no_argument, nullptr, 'l'},
        {"partitions", required_argument, nullptr, 'p'},
        {"output", required_argument, nullptr, 'o'},
        {"source", required_argument, nullptr, 's'},
        {"workers", required_argument, nullptr, 'j'},
        {"config", required_argument, nullptr, 'c'},
        {"quiet", no_argument, nullptr, 'q'},
        {"verbose", no_argument, nullptr, 'v'},
        {"no-verify", no_argument, nullptr, kOptNoVerify},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hlp:o:s:j:c:qv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;

            case 'l':
                list_only = true;
                break;

            case 'p':
                for (auto& name : otadump::SplitList(optarg))
                    partitions.push_back(std::move(name));
                break;

            case 'o':
                output_cli = optarg;
                break;

            case 's':
                source_cli = optarg;
                break;

            case 'j': {
                unsigned v = 0;
                if (!ParseWorkers(optarg, v)) {
                    std::fprintf(stderr, "Invalid --workers: %s\n", optarg);
                    return kExitUsage;
                }
                workers_cli = v;
                break;
            }

            case 'c':
                config_path = optarg;
                break;

            case 'q':
                quiet = true;
                break;

            case 'v':
                verbose = true;
                break;

            case kOptNoVerify:
                no_verify = true;
                break;

            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind + 1 != argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }
    const std::string payload_path = argv[optind];

    otadump::config::ExtractorConfig cfg;
    if (!config_path.empty()) {
        if (auto r = cfg.LoadFile(config_path); !r.ok) {
            std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
            return kExitUsage;
        }
    }

    auto& log = otadump::Logger::Instance();
    if (cfg.log_level) log.SetLevel(*cfg.log_level);
    if (verbose) log.SetLevel(otadump::LogLevel::Debug);
    if (quiet) log.SetLevel(otadump::LogLevel::Error);

    otadump::ExtractOptions opt;
    opt.payload_path = payload_path;
    opt.source_path = source_cli;
    opt.partitions = partitions;
    opt.worker_count = workers_cli.value_or(cfg.workers.value_or(otadump::kDefaultWorkerCount));
    opt.verify_blob_hashes = cfg.verify_blob_hashes.value_or(true);
    opt.verify_source_hashes = cfg.verify_source_hashes.value_or(true);
    opt.verify_partition_hashes = cfg.verify_partition_hashes.value_or(true);
    if (no_verify) {
        opt.verify_blob_hashes = false;
        opt.verify_source_hashes = false;
        opt.verify_partition_hashes = false;
    }
    opt.cancel = &otadump::g_cancel;

    otadump::PayloadFile payload;
    if (auto r = otadump::PayloadFile::Open(payload_path, "", payload); !r.ok) {
        LogError("%s: [%s] %s", payload_path.c_str(), otadump::ErrorKindName(r.kind), r.msg.c_str());
        return kExitFailure;
    }

    if (list_only) {
        PrintListing(payload);
        return kExitOk;
    }

    opt.output_dir = output_cli.value_or(cfg.output_dir.value_or(DefaultOutputDir(payload_path)));
    std::error_code ec;
    std::filesystem::create_directories(opt.output_dir, ec);
    if (ec) {
        LogError("Cannot create output directory %s: %s", opt.output_dir.c_str(), ec.message().c_str());
        return kExitFailure;
    }

    otadump::ConsoleProgressSink progress;
    if (!quiet && cfg.progress.value_or(true))
        opt.progress = &progress;

    auto report = otadump::Extract(payload, opt);
    if (!report) {
        const auto& r = report.error();
        LogError("[%s] %s", otadump::ErrorKindName(r.kind), r.msg.c_str());
        return kExitFailure;
    }
    otadump::ClearProgressLine();

    for (const auto& p : report->partitions) {
        if (p.state == otadump::PartitionState::Completed) {
            if (!quiet) std::printf("%-24s OK      %s\n", p.name.c_str(), p.output_path.c_str());
        } else {
            std::printf("%-24s FAILED  %s: %s\n",
                        p.name.c_str(),
                        otadump::ErrorCategoryName(p.error.category()),
                        p.error.msg.c_str());
        }
    }

    if (otadump::g_cancel.load())
        LogWarn("Interrupted");

    return report->AllCompleted() ? kExitOk : kExitFailure;
}
