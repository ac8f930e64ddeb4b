#include "util/config_json_utils.hpp"

#include <fstream>
#include <limits>
#include <optional>
#include <string>

namespace otadump::config::detail {

namespace {

// Each getter returns false only for a key that is present with the wrong
// type. Absent keys leave |out| untouched.
bool GetStringIfPresent(const nlohmann::json& j, const char* key,
                        std::optional<std::string>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetPositiveIfPresent(const nlohmann::json& j, const char* key,
                          std::optional<unsigned>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!(it->is_number_unsigned() || it->is_number_integer())) {
        err = std::string(key) + " must be an integer";
        return false;
    }
    auto v = it->get<long long>();
    if (v <= 0 || v > static_cast<long long>(std::numeric_limits<unsigned>::max())) {
        err = std::string(key) + " must be a positive integer";
        return false;
    }
    out = static_cast<unsigned>(v);
    return true;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key,
                      std::optional<bool>& out, std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be true or false";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool ParseJsonObject(const std::string& text, const std::string& origin, nlohmann::json& out, std::string& err) {
    try {
        out = nlohmann::json::parse(text);
    } catch (const nlohmann::json::exception& e) {
        err = "invalid JSON in " + origin + ": " + e.what();
        return false;
    }
    if (!out.is_object()) {
        err = "root must be JSON object: " + origin;
        return false;
    }
    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, ExtractorConfig& cfg, std::string& err) {
    if (!GetPositiveIfPresent(j, "Workers", cfg.workers, err))
        return false;
    if (!GetBoolIfPresent(j, "VerifyBlobHashes", cfg.verify_blob_hashes, err))
        return false;
    if (!GetBoolIfPresent(j, "VerifySourceHashes", cfg.verify_source_hashes, err))
        return false;
    if (!GetBoolIfPresent(j, "VerifyPartitionHashes", cfg.verify_partition_hashes, err))
        return false;
    if (!GetStringIfPresent(j, "OutputDir", cfg.output_dir, err))
        return false;
    if (!GetBoolIfPresent(j, "Progress", cfg.progress, err))
        return false;

    {
        std::optional<std::string> level;
        if (!GetStringIfPresent(j, "LogLevel", level, err))
            return false;
        if (level) {
            LogLevel lvl{};
            if (!ParseLogLevel(*level, lvl)) {
                err = "unknown LogLevel \"" + *level + "\"";
                return false;
            }
            cfg.log_level = lvl;
        }
    }

    return true;
}

} // namespace otadump::config::detail
