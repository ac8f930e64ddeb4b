#include "payload/codecs.hpp"

#ifndef OTADUMP_USE_ZSTD
#define OTADUMP_USE_ZSTD 0
#endif

#include <bzlib.h>
#include <lzma.h>
#if OTADUMP_USE_ZSTD
#include <zstd.h>
#endif  // OTADUMP_USE_ZSTD

#include <algorithm>
#include <climits>
#include <memory>
#include <string>

namespace otadump {

namespace {

// bz_stream counts in unsigned int.
constexpr size_t kBzChunk = 1u << 30;

Result Overproduced(const char* codec, std::uint64_t expected_size) {
    return Result::Fail(ErrorKind::SizeMismatch,
                        std::string(codec) + " stream decodes to more than the " +
                            std::to_string(expected_size) + " bytes of its destination extents");
}

Result Underproduced(const char* codec, std::uint64_t got, std::uint64_t expected_size) {
    return Result::Fail(ErrorKind::SizeMismatch,
                        std::string(codec) + " stream decoded to " + std::to_string(got) +
                            " bytes, destination extents hold " + std::to_string(expected_size));
}

class BzStream final {
public:
    BzStream() = default;
    BzStream(const BzStream&) = delete;
    BzStream& operator=(const BzStream&) = delete;
    ~BzStream() { End(); }

    bool Begin() {
        strm_ = bz_stream{};
        active_ = BZ2_bzDecompressInit(&strm_, 0, 0) == BZ_OK;
        return active_;
    }
    void End() {
        if (active_) BZ2_bzDecompressEnd(&strm_);
        active_ = false;
    }

    bool active() const { return active_; }
    bz_stream* get() { return &strm_; }

private:
    bz_stream strm_{};
    bool active_ = false;
};

class LzmaStream final {
public:
    LzmaStream() = default;
    LzmaStream(const LzmaStream&) = delete;
    LzmaStream& operator=(const LzmaStream&) = delete;
    ~LzmaStream() { lzma_end(&strm_); }

    lzma_stream* get() { return &strm_; }

private:
    lzma_stream strm_ = LZMA_STREAM_INIT;
};

// Handles concatenated bzip2 streams, as written by parallel compressors.
std::expected<std::vector<std::uint8_t>, Result> DecodeBzip2(std::span<const std::uint8_t> in,
                                                             std::uint64_t expected_size) {
    std::vector<std::uint8_t> out(static_cast<size_t>(expected_size) + 1);
    size_t in_pos = 0;
    size_t out_pos = 0;
    BzStream bz;

    while (true) {
        if (!bz.active()) {
            if (in_pos == in.size()) break;
            if (!bz.Begin()) {
                return std::unexpected(Result::Fail(ErrorKind::Io, "BZ2_bzDecompressInit failed"));
            }
        }

        const size_t in_chunk = std::min(in.size() - in_pos, kBzChunk);
        const size_t out_chunk = std::min(out.size() - out_pos, kBzChunk);
        bz_stream* s = bz.get();
        s->next_in = const_cast<char*>(reinterpret_cast<const char*>(in.data() + in_pos));
        s->avail_in = static_cast<unsigned int>(in_chunk);
        s->next_out = reinterpret_cast<char*>(out.data() + out_pos);
        s->avail_out = static_cast<unsigned int>(out_chunk);

        const int rc = BZ2_bzDecompress(s);
        const size_t consumed = in_chunk - s->avail_in;
        const size_t produced = out_chunk - s->avail_out;
        in_pos += consumed;
        out_pos += produced;

        if (out_pos > expected_size) return std::unexpected(Overproduced("bzip2", expected_size));
        if (rc == BZ_STREAM_END) {
            bz.End();
            continue;
        }
        if (rc != BZ_OK) {
            return std::unexpected(Result::Fail(ErrorKind::CorruptData,
                                                "bzip2 decode error " + std::to_string(rc)));
        }
        if (consumed == 0 && produced == 0) {
            return std::unexpected(Result::Fail(ErrorKind::CorruptData, "Truncated bzip2 stream"));
        }
    }

    if (out_pos != expected_size) {
        return std::unexpected(Underproduced("bzip2", out_pos, expected_size));
    }
    out.resize(out_pos);
    return out;
}

std::expected<std::vector<std::uint8_t>, Result> DecodeXz(std::span<const std::uint8_t> in,
                                                          std::uint64_t expected_size) {
    LzmaStream xz;
    lzma_stream* s = xz.get();
    if (lzma_stream_decoder(s, UINT64_MAX, LZMA_CONCATENATED) != LZMA_OK) {
        return std::unexpected(Result::Fail(ErrorKind::Io, "lzma_stream_decoder failed"));
    }

    std::vector<std::uint8_t> out(static_cast<size_t>(expected_size) + 1);
    s->next_in = in.data();
    s->avail_in = in.size();
    s->next_out = out.data();
    s->avail_out = out.size();

    while (true) {
        const lzma_ret ret = lzma_code(s, s->avail_in == 0 ? LZMA_FINISH : LZMA_RUN);
        const size_t produced = out.size() - s->avail_out;
        if (produced > expected_size) return std::unexpected(Overproduced("xz", expected_size));
        if (ret == LZMA_STREAM_END) break;
        if (ret == LZMA_OK) continue;
        if (ret == LZMA_BUF_ERROR) {
            return std::unexpected(Result::Fail(ErrorKind::CorruptData, "Truncated xz stream"));
        }
        return std::unexpected(Result::Fail(ErrorKind::CorruptData,
                                            "xz decode error " + std::to_string(static_cast<int>(ret))));
    }

    const size_t produced = out.size() - s->avail_out;
    if (produced != expected_size) {
        return std::unexpected(Underproduced("xz", produced, expected_size));
    }
    out.resize(produced);
    return out;
}

#if OTADUMP_USE_ZSTD
std::expected<std::vector<std::uint8_t>, Result> DecodeZstd(std::span<const std::uint8_t> in,
                                                            std::uint64_t expected_size) {
    std::unique_ptr<ZSTD_DCtx, decltype(&ZSTD_freeDCtx)> dctx(ZSTD_createDCtx(), &ZSTD_freeDCtx);
    if (!dctx) return std::unexpected(Result::Fail(ErrorKind::Io, "ZSTD_createDCtx failed"));

    std::vector<std::uint8_t> out(static_cast<size_t>(expected_size) + 1);
    ZSTD_inBuffer inb{in.data(), in.size(), 0};
    ZSTD_outBuffer outb{out.data(), out.size(), 0};
    size_t hint = 1;

    while (inb.pos < inb.size || hint != 0) {
        const size_t in_before = inb.pos;
        const size_t out_before = outb.pos;
        hint = ZSTD_decompressStream(dctx.get(), &outb, &inb);
        if (ZSTD_isError(hint)) {
            return std::unexpected(Result::Fail(ErrorKind::CorruptData,
                                                std::string("zstd decode error: ") +
                                                    ZSTD_getErrorName(hint)));
        }
        if (outb.pos > expected_size) return std::unexpected(Overproduced("zstd", expected_size));
        if (inb.pos == in_before && outb.pos == out_before && hint != 0) {
            return std::unexpected(Result::Fail(ErrorKind::CorruptData, "Truncated zstd stream"));
        }
    }

    if (outb.pos != expected_size) {
        return std::unexpected(Underproduced("zstd", outb.pos, expected_size));
    }
    out.resize(outb.pos);
    return out;
}
#endif  // OTADUMP_USE_ZSTD

} // namespace

const char* ReplaceCodecName(ReplaceCodec codec) {
    switch (codec) {
        case ReplaceCodec::None:  return "raw";
        case ReplaceCodec::Bzip2: return "bzip2";
        case ReplaceCodec::Xz:    return "xz";
        case ReplaceCodec::Zstd:  return "zstd";
    }
    return "unknown";
}

bool ReplaceCodecAvailable(ReplaceCodec codec) {
    switch (codec) {
        case ReplaceCodec::None:
        case ReplaceCodec::Bzip2:
        case ReplaceCodec::Xz:
            return true;
        case ReplaceCodec::Zstd:
            return OTADUMP_USE_ZSTD != 0;
    }
    return false;
}

std::expected<std::vector<std::uint8_t>, Result> DecodeReplaceBlob(ReplaceCodec codec,
                                                                   std::vector<std::uint8_t> blob,
                                                                   std::uint64_t expected_size) {
    switch (codec) {
        case ReplaceCodec::None:
            if (blob.size() != expected_size) {
                return std::unexpected(Underproduced("raw", blob.size(), expected_size));
            }
            return blob;
        case ReplaceCodec::Bzip2:
            return DecodeBzip2(blob, expected_size);
        case ReplaceCodec::Xz:
            return DecodeXz(blob, expected_size);
        case ReplaceCodec::Zstd:
#if OTADUMP_USE_ZSTD
            return DecodeZstd(blob, expected_size);
#else
            // No support for zstd compiled.
            break;
#endif  // OTADUMP_USE_ZSTD
    }
    return std::unexpected(Result::Fail(ErrorKind::UnsupportedOperation,
                                        std::string("Codec ") + ReplaceCodecName(codec) +
                                            " is not supported by this build"));
}

} // namespace otadump
