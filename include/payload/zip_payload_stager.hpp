#pragma once

#include "io/io.hpp"
#include "io/temp_file.hpp"
#include "util/result.hpp"

#include <string>

namespace otadump {

inline constexpr const char* kPayloadEntryName = "payload.bin";

// True when the file starts with a local zip header ("PK\3\4").
bool LooksLikeZip(const IReadAt& in);

// Copies the payload.bin member of an OTA zip into a temporary file under
// |staging_dir|. The file lives as long as |out|.
Result StagePayloadFromZip(const std::string& zip_path,
                           const std::string& staging_dir,
                           TempFile& out);

} // namespace otadump
