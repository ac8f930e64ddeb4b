#include "payload/codecs.hpp"
#include "payload/operation_executor.hpp"
#include "testing.hpp"

#include <bzlib.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <utility>

namespace {

using namespace otadump;

constexpr std::uint32_t kBlock = 64;

// Payload data region and target image held in memory.
class OperationExecutorTest : public ::testing::Test {
  protected:
    std::vector<std::uint8_t> data_region;
    std::unique_ptr<testutil::MemoryReadAt> payload;
    std::unique_ptr<BlobReader> blobs;
    std::unique_ptr<testutil::MemoryReadAt> source;
    testutil::MemoryWriteAt target{8 * kBlock, 0xCC};

    BlobRef AddBlob(const std::vector<std::uint8_t>& blob, bool with_hash = true) {
        BlobRef ref{.offset = data_region.size(), .length = blob.size(), .sha256 = std::nullopt};
        if (with_hash) ref.sha256 = testutil::Digest(blob);
        data_region.insert(data_region.end(), blob.begin(), blob.end());
        return ref;
    }

    void SetSource(std::vector<std::uint8_t> image) {
        source = std::make_unique<testutil::MemoryReadAt>(std::move(image));
    }

    Result Run(const InstallOperation& op, std::uint64_t* written = nullptr, bool verify = true) {
        payload = std::make_unique<testutil::MemoryReadAt>(data_region);
        blobs = std::make_unique<BlobReader>(*payload, 0);

        OperationContext ctx;
        ctx.partition = "system";
        ctx.block_size = kBlock;
        ctx.image_size = target.Data().size();
        ctx.blobs = blobs.get();
        ctx.source = source.get();
        ctx.target = &target;
        ctx.verify_blob_hashes = verify;
        ctx.verify_source_hashes = verify;
        OperationExecutor exec(ctx);
        return exec.Execute(op, 7, written);
    }

    std::vector<std::uint8_t> Block(std::size_t i) const {
        const auto& d = target.Data();
        return std::vector<std::uint8_t>(d.begin() + i * kBlock, d.begin() + (i + 1) * kBlock);
    }
};

TEST_F(OperationExecutorTest, ReplaceWritesBlobAcrossExtents) {
    const auto blob = testutil::Pattern(2 * kBlock);
    ReplaceOp op{.codec = ReplaceCodec::None, .blob = AddBlob(blob), .dst_extents = {{5, 1}, {1, 1}}};

    std::uint64_t written = 0;
    auto r = Run(op, &written);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(written, 2 * kBlock);
    EXPECT_EQ(Block(5), std::vector<std::uint8_t>(blob.begin(), blob.begin() + kBlock));
    EXPECT_EQ(Block(1), std::vector<std::uint8_t>(blob.begin() + kBlock, blob.end()));
    EXPECT_EQ(Block(0), testutil::Filled(kBlock, 0xCC));
}

TEST_F(OperationExecutorTest, ReplaceBzip2) {
    const auto image = testutil::Filled(3 * kBlock, 0x42);
    std::vector<std::uint8_t> packed(1024);
    unsigned int packed_len = static_cast<unsigned int>(packed.size());
    ASSERT_EQ(BZ2_bzBuffToBuffCompress(reinterpret_cast<char*>(packed.data()), &packed_len,
                                       const_cast<char*>(reinterpret_cast<const char*>(image.data())),
                                       static_cast<unsigned int>(image.size()), 9, 0, 0),
              BZ_OK);
    packed.resize(packed_len);

    ReplaceOp op{.codec = ReplaceCodec::Bzip2, .blob = AddBlob(packed), .dst_extents = {{2, 3}}};
    auto r = Run(op);
    ASSERT_TRUE(r.ok) << r.msg;
    for (std::size_t i = 2; i < 5; ++i) EXPECT_EQ(Block(i), testutil::Filled(kBlock, 0x42));
}

TEST_F(OperationExecutorTest, BlobHashMismatchNamesOperation) {
    auto blob = testutil::Pattern(kBlock);
    BlobRef ref = AddBlob(blob);
    data_region[3] ^= 0xFF;

    ReplaceOp op{.codec = ReplaceCodec::None, .blob = ref, .dst_extents = {{0, 1}}};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::HashMismatch);
    EXPECT_EQ(r.msg.rfind("system operation 7 (REPLACE): data sha256 mismatch", 0), 0u) << r.msg;
    EXPECT_EQ(r.msg.find("system operation 7", 1), std::string::npos) << r.msg;
    EXPECT_EQ(Block(0), testutil::Filled(kBlock, 0xCC));
}

TEST_F(OperationExecutorTest, BlobHashCheckCanBeDisabled) {
    BlobRef ref = AddBlob(testutil::Pattern(kBlock));
    data_region[0] ^= 0xFF;

    ReplaceOp op{.codec = ReplaceCodec::None, .blob = ref, .dst_extents = {{0, 1}}};
    auto r = Run(op, nullptr, false);
    EXPECT_TRUE(r.ok) << r.msg;
}

TEST_F(OperationExecutorTest, BlobWithoutDigestIsAccepted) {
    const auto blob = testutil::Pattern(kBlock);
    ReplaceOp op{.codec = ReplaceCodec::None, .blob = AddBlob(blob, false), .dst_extents = {{0, 1}}};
    auto r = Run(op);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(Block(0), blob);
}

TEST_F(OperationExecutorTest, ReplaceSizeMismatch) {
    ReplaceOp op{.codec = ReplaceCodec::None, .blob = AddBlob(testutil::Pattern(kBlock + 1)), .dst_extents = {{0, 1}}};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::SizeMismatch);
}

TEST_F(OperationExecutorTest, BlobPastEndIsTruncated) {
    BlobRef ref{.offset = 0, .length = kBlock, .sha256 = std::nullopt};
    ReplaceOp op{.codec = ReplaceCodec::None, .blob = ref, .dst_extents = {{0, 1}}};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::TruncatedBlob);
}

TEST_F(OperationExecutorTest, ZeroAndDiscardFillZeros) {
    std::uint64_t written = 0;
    auto r = Run(ZeroOp{.discard = false, .dst_extents = {{0, 2}}}, &written);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(written, 2 * kBlock);
    r = Run(ZeroOp{.discard = true, .dst_extents = {{6, 1}}});
    ASSERT_TRUE(r.ok) << r.msg;

    EXPECT_EQ(Block(0), testutil::Filled(kBlock, 0));
    EXPECT_EQ(Block(1), testutil::Filled(kBlock, 0));
    EXPECT_EQ(Block(2), testutil::Filled(kBlock, 0xCC));
    EXPECT_EQ(Block(6), testutil::Filled(kBlock, 0));
}

TEST_F(OperationExecutorTest, SourceCopyIsByteIdentical) {
    const auto src = testutil::Pattern(8 * kBlock, 21);
    SetSource(src);

    const std::vector<std::uint8_t> expected(src.begin() + 3 * kBlock, src.begin() + 5 * kBlock);
    SourceCopyOp op{.src_extents = {{3, 2}}, .dst_extents = {{0, 1}, {7, 1}}, .src_sha256 = testutil::Digest(expected)};
    auto r = Run(op);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(Block(0), std::vector<std::uint8_t>(expected.begin(), expected.begin() + kBlock));
    EXPECT_EQ(Block(7), std::vector<std::uint8_t>(expected.begin() + kBlock, expected.end()));
}

TEST_F(OperationExecutorTest, SourceCopyWithoutSourceFails) {
    SourceCopyOp op{.src_extents = {{0, 1}}, .dst_extents = {{0, 1}}, .src_sha256 = std::nullopt};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::Io);
}

TEST_F(OperationExecutorTest, SourceHashMismatch) {
    SetSource(testutil::Pattern(8 * kBlock, 22));
    SourceCopyOp op{.src_extents = {{0, 1}}, .dst_extents = {{0, 1}}, .src_sha256 = testutil::Digest(testutil::Filled(kBlock, 0))};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::HashMismatch);
    EXPECT_NE(r.msg.find("(SOURCE_COPY): source sha256 mismatch"), std::string::npos) << r.msg;
    EXPECT_EQ(Block(0), testutil::Filled(kBlock, 0xCC));
}

TEST_F(OperationExecutorTest, SourceCopyLengthMismatch) {
    SetSource(testutil::Pattern(8 * kBlock, 23));
    SourceCopyOp op{.src_extents = {{0, 2}}, .dst_extents = {{0, 1}}, .src_sha256 = std::nullopt};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::SizeMismatch);
}

TEST_F(OperationExecutorTest, UnsupportedTypeFails) {
    auto r = Run(UnsupportedOp{.type = 2, .dst_extents = {{0, 1}}});
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::UnsupportedOperation);
    EXPECT_NE(r.msg.find("MOVE"), std::string::npos);
    EXPECT_EQ(Block(0), testutil::Filled(kBlock, 0xCC));
}

TEST_F(OperationExecutorTest, DstExtentPastImageEndFails) {
    auto r = Run(ZeroOp{.discard = false, .dst_extents = {{0, 1}, {7, 2}}});
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::SizeMismatch);
    EXPECT_NE(r.msg.find("past image size 512"), std::string::npos) << r.msg;
    // Rejected before any extent is written.
    EXPECT_EQ(Block(0), testutil::Filled(kBlock, 0xCC));
}

TEST_F(OperationExecutorTest, DiffFormatMissingFromBuildIsUnsupported) {
    if (DiffFormatAvailable(DiffFormat::Puffdiff)) GTEST_SKIP() << "puffpatch is linked";
    SetSource(testutil::Pattern(8 * kBlock));
    DiffOp op{.format = DiffFormat::Puffdiff,
              .blob = AddBlob(testutil::Bytes("PUF1")),
              .src_extents = {{0, 1}},
              .dst_extents = {{0, 1}},
              .src_sha256 = std::nullopt};
    auto r = Run(op);
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, ErrorKind::UnsupportedOperation);
}

#if OTADUMP_TEST_BSDIFF_ENCODER
TEST_F(OperationExecutorTest, SourceBsdiffPatchesGatheredSource) {
    const auto image = testutil::Pattern(8 * kBlock, 41);
    SetSource(image);

    // Source blocks 5 and 2, in that order; the new content lands in blocks 0-1.
    std::vector<std::uint8_t> gathered(image.begin() + 5 * kBlock, image.begin() + 6 * kBlock);
    gathered.insert(gathered.end(), image.begin() + 2 * kBlock, image.begin() + 3 * kBlock);
    auto wanted = gathered;
    for (std::size_t i = 10; i < 40; ++i) wanted[i] = 0x7E;

    const auto patch = testutil::MakeBsdiffPatch(gathered, wanted);
    DiffOp op{.format = DiffFormat::Bsdiff,
              .blob = AddBlob(patch),
              .src_extents = {{5, 1}, {2, 1}},
              .dst_extents = {{0, 2}},
              .src_sha256 = testutil::Digest(gathered)};
    std::uint64_t written = 0;
    auto r = Run(op, &written);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(written, 2 * kBlock);
    EXPECT_EQ(Block(0), std::vector<std::uint8_t>(wanted.begin(), wanted.begin() + kBlock));
    EXPECT_EQ(Block(1), std::vector<std::uint8_t>(wanted.begin() + kBlock, wanted.end()));
}
#endif

} // namespace
