#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

namespace otadump::config {

void ExtractorConfig::Reset() {
    workers.reset();
    verify_blob_hashes.reset();
    verify_source_hashes.reset();
    verify_partition_hashes.reset();
    output_dir.reset();
    log_level.reset();
    progress.reset();
}

Result ExtractorConfig::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorKind::Config, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

Result ExtractorConfig::LoadString(const std::string& text, const std::string& origin) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::ParseJsonObject(text, origin, json, err)) {
        return Result::Fail(ErrorKind::Config, "Config: " + err);
    }
    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorKind::Config, "Config: " + err + " in " + origin);
    }
    return Result::Ok();
}

} // namespace otadump::config
