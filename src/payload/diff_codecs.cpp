#include "payload/codecs.hpp"

#ifndef OTADUMP_USE_BSDIFF
#define OTADUMP_USE_BSDIFF 0
#endif
#ifndef OTADUMP_USE_PUFFIN
#define OTADUMP_USE_PUFFIN 0
#endif

#if OTADUMP_USE_BSDIFF
#include <bsdiff/bspatch.h>
#endif  // OTADUMP_USE_BSDIFF
#if OTADUMP_USE_PUFFIN
#include <puffin/puffpatch.h>
#include <puffin/stream.h>
#endif  // OTADUMP_USE_PUFFIN

#include <cstring>
#include <memory>
#include <string>

namespace otadump {

namespace {

#if OTADUMP_USE_BSDIFF
// SOURCE_BSDIFF carries a classic BSDIFF40 patch and BROTLI_BSDIFF a BSDF2
// patch; bspatch detects the variant from the patch magic.
std::expected<std::vector<std::uint8_t>, Result> ApplyBsdiff(std::span<const std::uint8_t> source,
                                                             std::span<const std::uint8_t> patch,
                                                             std::uint64_t expected_size) {
    std::vector<std::uint8_t> out(static_cast<size_t>(expected_size));
    size_t out_pos = 0;
    bool overflow = false;

    auto sink = [&](const std::uint8_t* data, size_t length) -> size_t {
        if (length > out.size() - out_pos) {
            overflow = true;
            return 0;
        }
        std::memcpy(out.data() + out_pos, data, length);
        out_pos += length;
        return length;
    };

    const int rc = bsdiff::bspatch(source.data(), source.size(), patch.data(), patch.size(), sink);
    if (overflow) {
        return std::unexpected(Result::Fail(ErrorKind::SizeMismatch,
                                            "bspatch output exceeds the " +
                                                std::to_string(expected_size) +
                                                " bytes of its destination extents"));
    }
    if (rc != 0) {
        return std::unexpected(Result::Fail(ErrorKind::CorruptData,
                                            "bspatch failed, result: " + std::to_string(rc)));
    }
    if (out_pos != expected_size) {
        return std::unexpected(Result::Fail(ErrorKind::SizeMismatch,
                                            "bspatch produced " + std::to_string(out_pos) +
                                                " bytes, destination extents hold " +
                                                std::to_string(expected_size)));
    }
    return out;
}
#endif  // OTADUMP_USE_BSDIFF

#if OTADUMP_USE_PUFFIN
class PuffInputStream final : public puffin::StreamInterface {
  public:
    explicit PuffInputStream(std::span<const std::uint8_t> data) : data_(data) {}

    bool GetSize(uint64_t* size) const override {
        *size = data_.size();
        return true;
    }
    bool GetOffset(uint64_t* offset) const override {
        *offset = pos_;
        return true;
    }
    bool Seek(uint64_t offset) override {
        if (offset > data_.size()) return false;
        pos_ = static_cast<size_t>(offset);
        return true;
    }
    bool Read(void* buffer, size_t length) override {
        if (data_.size() - pos_ < length) return false;
        std::memcpy(buffer, data_.data() + pos_, length);
        pos_ += length;
        return true;
    }
    bool Write(const void*, size_t) override { return false; }
    bool Close() override { return true; }

  private:
    std::span<const std::uint8_t> data_;
    size_t pos_ = 0;
};

// Writes into a preallocated buffer and refuses to grow past it.
class PuffOutputStream final : public puffin::StreamInterface {
  public:
    PuffOutputStream(std::vector<std::uint8_t>& out, size_t* high_water, bool* overflow)
        : out_(out), high_water_(high_water), overflow_(overflow) {}

    bool GetSize(uint64_t* size) const override {
        *size = out_.size();
        return true;
    }
    bool GetOffset(uint64_t* offset) const override {
        *offset = pos_;
        return true;
    }
    bool Seek(uint64_t offset) override {
        if (offset > out_.size()) return false;
        pos_ = static_cast<size_t>(offset);
        return true;
    }
    bool Read(void* buffer, size_t length) override {
        if (out_.size() - pos_ < length) return false;
        std::memcpy(buffer, out_.data() + pos_, length);
        pos_ += length;
        return true;
    }
    bool Write(const void* buffer, size_t length) override {
        if (out_.size() - pos_ < length) {
            *overflow_ = true;
            return false;
        }
        std::memcpy(out_.data() + pos_, buffer, length);
        pos_ += length;
        if (pos_ > *high_water_) *high_water_ = pos_;
        return true;
    }
    bool Close() override { return true; }

  private:
    std::vector<std::uint8_t>& out_;
    size_t pos_ = 0;
    size_t* high_water_;
    bool* overflow_;
};

std::expected<std::vector<std::uint8_t>, Result> ApplyPuffdiff(std::span<const std::uint8_t> source,
                                                               std::span<const std::uint8_t> patch,
                                                               std::uint64_t expected_size) {
    constexpr size_t kMaxCacheSize = 5 * 1024 * 1024;  // Total 5MB cache.

    std::vector<std::uint8_t> out(static_cast<size_t>(expected_size));
    size_t written = 0;
    bool overflow = false;

    puffin::UniqueStreamPtr src(new PuffInputStream(source));
    puffin::UniqueStreamPtr dst(new PuffOutputStream(out, &written, &overflow));
    const bool ok = puffin::PuffPatch(std::move(src), std::move(dst), patch.data(), patch.size(),
                                      kMaxCacheSize);
    if (overflow) {
        return std::unexpected(Result::Fail(ErrorKind::SizeMismatch,
                                            "puffpatch output exceeds the " +
                                                std::to_string(expected_size) +
                                                " bytes of its destination extents"));
    }
    if (!ok) {
        return std::unexpected(Result::Fail(ErrorKind::CorruptData, "puffpatch failed to apply"));
    }
    if (written != expected_size) {
        return std::unexpected(Result::Fail(ErrorKind::SizeMismatch,
                                            "puffpatch produced " + std::to_string(written) +
                                                " bytes, destination extents hold " +
                                                std::to_string(expected_size)));
    }
    return out;
}
#endif  // OTADUMP_USE_PUFFIN

} // namespace

const char* DiffFormatName(DiffFormat format) {
    switch (format) {
        case DiffFormat::Bsdiff:       return "bsdiff";
        case DiffFormat::BrotliBsdiff: return "brotli-bsdiff";
        case DiffFormat::Puffdiff:     return "puffdiff";
    }
    return "unknown";
}

bool DiffFormatAvailable(DiffFormat format) {
    switch (format) {
        case DiffFormat::Bsdiff:
        case DiffFormat::BrotliBsdiff:
            return OTADUMP_USE_BSDIFF != 0;
        case DiffFormat::Puffdiff:
            return OTADUMP_USE_PUFFIN != 0;
    }
    return false;
}

std::expected<std::vector<std::uint8_t>, Result> ApplyDiffPatch(DiffFormat format,
                                                                std::span<const std::uint8_t> source,
                                                                std::span<const std::uint8_t> patch,
                                                                std::uint64_t expected_size) {
    switch (format) {
        case DiffFormat::Bsdiff:
        case DiffFormat::BrotliBsdiff:
#if OTADUMP_USE_BSDIFF
            return ApplyBsdiff(source, patch, expected_size);
#else
            // No support for bspatch compiled.
            break;
#endif  // OTADUMP_USE_BSDIFF
        case DiffFormat::Puffdiff:
#if OTADUMP_USE_PUFFIN
            return ApplyPuffdiff(source, patch, expected_size);
#else
            // No support for puffpatch compiled.
            break;
#endif  // OTADUMP_USE_PUFFIN
    }
    (void)source;
    (void)patch;
    (void)expected_size;
    return std::unexpected(Result::Fail(ErrorKind::UnsupportedOperation,
                                        std::string("Patch format ") + DiffFormatName(format) +
                                            " is not supported by this build"));
}

} // namespace otadump
