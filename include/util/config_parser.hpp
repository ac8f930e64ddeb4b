#pragma once

#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace otadump::config {

// Values read from an optional JSON config file. Unset fields leave the
// built-in defaults (or command-line flags) alone.
class ExtractorConfig {
public:
    std::optional<unsigned> workers;
    std::optional<bool> verify_blob_hashes;
    std::optional<bool> verify_source_hashes;
    std::optional<bool> verify_partition_hashes;
    std::optional<std::string> output_dir;
    std::optional<LogLevel> log_level;
    std::optional<bool> progress;

    Result LoadFile(const std::string& path);
    Result LoadString(const std::string& text, const std::string& origin = "<string>");

    void Reset();
};

} // namespace otadump::config
