#include "payload/blob_reader.hpp"

#include <string>

namespace otadump {

std::expected<std::vector<std::uint8_t>, Result> BlobReader::Read(std::uint64_t data_offset,
                                                                  std::uint64_t data_length) const {
    std::uint64_t begin = 0;
    std::uint64_t end = 0;
    if (__builtin_add_overflow(data_region_offset_, data_offset, &begin) ||
        __builtin_add_overflow(begin, data_length, &end) || end > payload_.Size()) {
        return std::unexpected(Result::Fail(ErrorKind::TruncatedBlob,
                                            "Blob at data offset " + std::to_string(data_offset) +
                                                " length " + std::to_string(data_length) +
                                                " runs past end of payload (" +
                                                std::to_string(payload_.Size()) + " bytes)"));
    }

    std::vector<std::uint8_t> blob(static_cast<size_t>(data_length));
    auto r = payload_.ReadAt(begin, blob);
    if (!r.ok) return std::unexpected(r);
    return blob;
}

} // namespace otadump
