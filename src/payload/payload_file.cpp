#include "payload/payload_file.hpp"

#include "payload/manifest_decoder.hpp"
#include "payload/zip_payload_stager.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace otadump {

Result PayloadFile::Open(const std::string& path, const std::string& staging_dir, PayloadFile& out) {
    PayloadFile pf;
    pf.path_ = path;

    auto r = PositionalFileReader::Open(path, pf.reader_);
    if (!r.ok) return r;

    if (LooksLikeZip(pf.reader_)) {
        r = StagePayloadFromZip(path, staging_dir, pf.staged_);
        if (!r.ok) return r;
        pf.reader_ = PositionalFileReader();
        r = PositionalFileReader::Open(pf.staged_.Path(), pf.reader_);
        if (!r.ok) return r;
    }

    r = pf.Load();
    if (!r.ok) return r;

    out = std::move(pf);
    return Result::Ok();
}

Result PayloadFile::Load() {
    auto header = ReadPayloadHeader(reader_);
    if (!header) return header.error();
    header_ = *header;

    // Bounds first so a corrupt length never turns into a huge allocation.
    if (header_.DataOffset() > reader_.Size()) {
        return Result::Fail(ErrorKind::TruncatedBlob,
                            "Manifest and signature (" + std::to_string(header_.DataOffset()) +
                                " bytes with header) run past end of payload (" +
                                std::to_string(reader_.Size()) + " bytes)");
    }

    std::vector<std::uint8_t> manifest_bytes(header_.manifest_size);
    auto r = reader_.ReadAt(header_.ManifestOffset(), manifest_bytes);
    if (!r.ok) return r;

    auto manifest = DecodeManifest(manifest_bytes);
    if (!manifest) return manifest.error();
    manifest_ = std::move(*manifest);

    signature_count_ = 0;
    if (header_.manifest_signature_size > 0) {
        std::vector<std::uint8_t> sig_bytes(header_.manifest_signature_size);
        r = reader_.ReadAt(header_.SignatureOffset(), sig_bytes);
        if (!r.ok) return r;
        auto count = CountManifestSignatures(sig_bytes);
        if (count) {
            signature_count_ = *count;
        } else {
            LogWarn("Ignoring undecodable manifest signature blob: %s", count.error().msg.c_str());
        }
    }

    LogDebug("Payload %s: version %llu, manifest %llu bytes, signature %u bytes, data at %llu",
             path_.c_str(),
             (unsigned long long)header_.major_version,
             (unsigned long long)header_.manifest_size,
             header_.manifest_signature_size,
             (unsigned long long)header_.DataOffset());
    return Result::Ok();
}

} // namespace otadump
