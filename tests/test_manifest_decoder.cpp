#include "payload/manifest_decoder.hpp"
#include "payload/payload_header.hpp"
#include "testing.hpp"

#include <gtest/gtest.h>
#include <string>
#include <variant>

namespace {

namespace pb = otadump::update_metadata;

std::vector<std::uint8_t> Serialize(const google::protobuf::MessageLite& m) {
    std::string s;
    EXPECT_TRUE(m.SerializeToString(&s));
    return testutil::Bytes(s);
}

pb::DeltaArchiveManifest MinimalManifest() {
    pb::DeltaArchiveManifest m;
    m.set_block_size(4096);
    auto* p = m.add_partitions();
    p->set_partition_name("boot");
    p->mutable_new_partition_info()->set_size(8192);
    return m;
}

TEST(ManifestDecoderTest, DecodesPartitionsAndOperations) {
    const auto image = testutil::Pattern(8192);
    const auto blob = testutil::Pattern(4096, 2);

    pb::DeltaArchiveManifest m;
    m.set_block_size(4096);
    m.set_minor_version(0);
    m.set_max_timestamp(1700000000);
    m.set_security_patch_level("2024-05-01");

    auto* boot = m.add_partitions();
    boot->set_partition_name("boot");
    boot->mutable_new_partition_info()->set_size(8192);
    boot->mutable_new_partition_info()->set_hash(testutil::RawDigest(image));
    boot->set_version("1.0");

    auto* replace = boot->add_operations();
    replace->set_type(pb::InstallOperation::REPLACE_XZ);
    replace->set_data_offset(100);
    replace->set_data_length(200);
    replace->set_data_sha256_hash(testutil::RawDigest(blob));
    testutil::AddExtent(replace->mutable_dst_extents(), 0, 1);

    auto* zero = boot->add_operations();
    zero->set_type(pb::InstallOperation::DISCARD);
    testutil::AddExtent(zero->mutable_dst_extents(), 1, 1);

    auto* system = m.add_partitions();
    system->set_partition_name("system");
    system->mutable_new_partition_info()->set_size(4096);

    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().msg;

    EXPECT_EQ(decoded->block_size, 4096u);
    EXPECT_EQ(decoded->max_timestamp, 1700000000);
    EXPECT_EQ(decoded->security_patch_level, "2024-05-01");
    EXPECT_FALSE(decoded->IsIncremental());
    ASSERT_EQ(decoded->partitions.size(), 2u);
    EXPECT_EQ(decoded->partitions[0].name, "boot");
    EXPECT_EQ(decoded->partitions[1].name, "system");

    const auto& p = decoded->partitions[0];
    EXPECT_EQ(p.new_size, 8192u);
    ASSERT_TRUE(p.new_hash.has_value());
    EXPECT_EQ(*p.new_hash, testutil::Digest(image));
    EXPECT_EQ(p.version, "1.0");
    EXPECT_FALSE(decoded->partitions[1].new_hash.has_value());

    ASSERT_EQ(p.operations.size(), 2u);
    const auto* r = std::get_if<otadump::ReplaceOp>(&p.operations[0]);
    ASSERT_NE(r, nullptr);
    EXPECT_EQ(r->codec, otadump::ReplaceCodec::Xz);
    EXPECT_EQ(r->blob.offset, 100u);
    EXPECT_EQ(r->blob.length, 200u);
    ASSERT_TRUE(r->blob.sha256.has_value());
    EXPECT_EQ(*r->blob.sha256, testutil::Digest(blob));
    ASSERT_EQ(r->dst_extents.size(), 1u);
    EXPECT_EQ(r->dst_extents[0].start_block, 0u);
    EXPECT_EQ(r->dst_extents[0].num_blocks, 1u);

    const auto* z = std::get_if<otadump::ZeroOp>(&p.operations[1]);
    ASSERT_NE(z, nullptr);
    EXPECT_TRUE(z->discard);
    EXPECT_EQ(otadump::OperationTypeName(otadump::OperationTypeOf(p.operations[1])), "DISCARD");
}

TEST(ManifestDecoderTest, DecodesIncrementalOperations) {
    auto m = MinimalManifest();
    auto* p = m.mutable_partitions(0);
    p->mutable_old_partition_info()->set_size(4096);

    auto* copy = p->add_operations();
    copy->set_type(pb::InstallOperation::SOURCE_COPY);
    testutil::AddExtent(copy->mutable_src_extents(), 3, 1);
    testutil::AddExtent(copy->mutable_dst_extents(), 0, 1);
    copy->set_src_sha256_hash(std::string(32, 'x'));

    auto* diff = p->add_operations();
    diff->set_type(pb::InstallOperation::BROTLI_BSDIFF);
    diff->set_data_length(10);
    testutil::AddExtent(diff->mutable_src_extents(), 0, 1);
    testutil::AddExtent(diff->mutable_dst_extents(), 1, 1);

    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().msg;
    EXPECT_TRUE(decoded->IsIncremental());

    const auto& ops = decoded->partitions[0].operations;
    ASSERT_EQ(ops.size(), 2u);
    const auto* c = std::get_if<otadump::SourceCopyOp>(&ops[0]);
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(c->src_extents[0].start_block, 3u);
    EXPECT_TRUE(c->src_sha256.has_value());

    const auto* d = std::get_if<otadump::DiffOp>(&ops[1]);
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->format, otadump::DiffFormat::BrotliBsdiff);
    EXPECT_FALSE(d->src_sha256.has_value());
}

TEST(ManifestDecoderTest, LegacyAndUnknownTypesBecomeUnsupported) {
    auto m = MinimalManifest();
    auto* p = m.mutable_partitions(0);
    p->add_operations()->set_type(pb::InstallOperation::MOVE);
    p->add_operations()->set_type(pb::InstallOperation::ZUCCHINI);
    p->add_operations()->set_type(99);

    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().msg;

    const auto& ops = decoded->partitions[0].operations;
    ASSERT_EQ(ops.size(), 3u);
    for (const auto& op : ops) {
        EXPECT_TRUE(std::holds_alternative<otadump::UnsupportedOp>(op));
    }
    EXPECT_EQ(otadump::OperationTypeName(otadump::OperationTypeOf(ops[0])), "MOVE");
    EXPECT_EQ(otadump::OperationTypeName(otadump::OperationTypeOf(ops[2])), "TYPE_99");
}

TEST(ManifestDecoderTest, MissingBlockSize) {
    auto m = MinimalManifest();
    m.clear_block_size();
    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::MissingField);

    m.set_block_size(0);
    decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::MissingField);
}

TEST(ManifestDecoderTest, NoPartitions) {
    pb::DeltaArchiveManifest m;
    m.set_block_size(4096);
    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::MissingField);
}

TEST(ManifestDecoderTest, PartitionWithoutNewSize) {
    auto m = MinimalManifest();
    m.mutable_partitions(0)->clear_new_partition_info();
    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::MissingField);
    EXPECT_NE(decoded.error().msg.find("boot"), std::string::npos);
}

TEST(ManifestDecoderTest, DuplicatePartitionNames) {
    auto m = MinimalManifest();
    *m.add_partitions() = m.partitions(0);
    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::ManifestDecodeError);
}

TEST(ManifestDecoderTest, WrongDigestLength) {
    auto m = MinimalManifest();
    m.mutable_partitions(0)->mutable_new_partition_info()->set_hash("short");
    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::ManifestDecodeError);
}

TEST(ManifestDecoderTest, GarbageIsDecodeError) {
    const auto junk = testutil::Filled(64, 0xFF);
    auto decoded = otadump::DecodeManifest(junk);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::ManifestDecodeError);
}

TEST(ManifestDecoderTest, FindPartition) {
    auto decoded = otadump::DecodeManifest(Serialize(MinimalManifest()));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_NE(decoded->FindPartition("boot"), nullptr);
    EXPECT_EQ(decoded->FindPartition("vendor"), nullptr);
}

TEST(ManifestDecoderTest, CountsSignatures) {
    pb::Signatures sigs;
    sigs.add_signatures()->set_data("a");
    sigs.add_signatures()->set_data("b");
    auto n = otadump::CountManifestSignatures(Serialize(sigs));
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(*n, 2u);

    auto none = otadump::CountManifestSignatures({});
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(*none, 0u);
}

TEST(ManifestDecoderTest, PartitionWithoutName) {
    auto m = MinimalManifest();
    m.mutable_partitions(0)->clear_partition_name();
    auto decoded = otadump::DecodeManifest(Serialize(m));
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::MissingField);
}

TEST(ManifestDecoderTest, PartitionNamesMustBePlainFileNames) {
    const std::string bad_names[] = {
        "/tmp/escaped", "../sibling", "a/b", ".", "..", "dir\\name", std::string("bo\0ot", 5),
    };
    for (const auto& name : bad_names) {
        auto m = MinimalManifest();
        m.mutable_partitions(0)->set_partition_name(name);
        auto decoded = otadump::DecodeManifest(Serialize(m));
        ASSERT_FALSE(decoded.has_value()) << name;
        EXPECT_EQ(decoded.error().kind, otadump::ErrorKind::ManifestDecodeError) << name;
    }

    auto m = MinimalManifest();
    m.mutable_partitions(0)->set_partition_name("vendor_dlkm.a-1");
    EXPECT_TRUE(otadump::DecodeManifest(Serialize(m)).has_value());
}

TEST(ManifestDecoderTest, ManifestBytesSitBetweenHeaderAndDataRegion) {
    const auto image = testutil::Filled(4096, 0x5A);
    testutil::PayloadBuilder builder;
    auto* boot = builder.AddPartition("boot", 4096, image);
    auto* op = builder.AddBlobOperation(boot, pb::InstallOperation::REPLACE, image);
    testutil::AddExtent(op->mutable_dst_extents(), 0, 1);

    pb::Signatures sigs;
    sigs.add_signatures()->set_data("signature");
    std::string sig_blob;
    ASSERT_TRUE(sigs.SerializeToString(&sig_blob));
    const auto payload = builder.Build(sig_blob);

    auto header = otadump::ParsePayloadHeader(payload);
    ASSERT_TRUE(header.has_value()) << header.error().msg;
    EXPECT_EQ(header->DataOffset(),
              otadump::PayloadHeader::kSize + header->manifest_size + sig_blob.size());
    EXPECT_EQ(payload.size() - header->DataOffset(), image.size());

    const std::span<const std::uint8_t> manifest_bytes(payload.data() + header->ManifestOffset(),
                                                       header->manifest_size);
    auto decoded = otadump::DecodeManifest(manifest_bytes);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().msg;
    ASSERT_EQ(decoded->partitions.size(), 1u);
    EXPECT_EQ(decoded->partitions[0].name, "boot");

    // Re-encoding the parsed message gives back the same bytes.
    pb::DeltaArchiveManifest reparsed;
    ASSERT_TRUE(reparsed.ParseFromArray(manifest_bytes.data(), static_cast<int>(manifest_bytes.size())));
    std::string reencoded;
    ASSERT_TRUE(reparsed.SerializeToString(&reencoded));
    EXPECT_EQ(testutil::Bytes(reencoded),
              std::vector<std::uint8_t>(manifest_bytes.begin(), manifest_bytes.end()));
}

} // namespace
