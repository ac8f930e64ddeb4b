#pragma once

#include "io/file_reader.hpp"
#include "io/temp_file.hpp"
#include "payload/blob_reader.hpp"
#include "payload/manifest.hpp"
#include "payload/payload_header.hpp"
#include "util/result.hpp"

#include <cstddef>
#include <string>

namespace otadump {

// An opened payload: parsed header, decoded manifest, and a reader over the
// data region. Accepts payload.bin or an OTA zip containing one.
class PayloadFile {
public:
    // Zip inputs are staged into |staging_dir| (empty for $TMPDIR).
    static Result Open(const std::string& path, const std::string& staging_dir, PayloadFile& out);

    PayloadFile() = default;
    PayloadFile(const PayloadFile&) = delete;
    PayloadFile& operator=(const PayloadFile&) = delete;
    PayloadFile(PayloadFile&&) = default;
    PayloadFile& operator=(PayloadFile&&) = default;

    const std::string& Path() const { return path_; }
    const PayloadHeader& Header() const { return header_; }
    const Manifest& GetManifest() const { return manifest_; }
    std::size_t SignatureCount() const { return signature_count_; }
    bool FromZip() const { return staged_.Valid(); }

    const PositionalFileReader& Reader() const { return reader_; }
    BlobReader Blobs() const { return BlobReader(reader_, header_.DataOffset()); }

private:
    Result Load();

    std::string path_;
    TempFile staged_;
    PositionalFileReader reader_;
    PayloadHeader header_{};
    Manifest manifest_;
    std::size_t signature_count_ = 0;
};

} // namespace otadump
