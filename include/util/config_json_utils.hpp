#pragma once

#include "util/config_parser.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace otadump::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);
bool ParseJsonObject(const std::string& text, const std::string& origin, nlohmann::json& out, std::string& err);
bool FillConfigFromJson(const nlohmann::json& j, ExtractorConfig& cfg, std::string& err);

} // namespace otadump::config::detail
