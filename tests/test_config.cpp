#include "testing.hpp"
#include "util/config_parser.hpp"

#include <gtest/gtest.h>
#include <string>

namespace {

using otadump::config::ExtractorConfig;

TEST(ConfigTest, LoadsEveryKey) {
    testutil::TemporaryDirectory tmp;
    const std::string path = tmp.File("otadump.json");
    testutil::WriteFile(path, R"({
        "Workers": 8,
        "VerifyBlobHashes": false,
        "VerifySourceHashes": true,
        "VerifyPartitionHashes": false,
        "OutputDir": "/tmp/out",
        "LogLevel": "debug",
        "Progress": false
    })");

    ExtractorConfig cfg;
    auto r = cfg.LoadFile(path);
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.workers, 8u);
    EXPECT_EQ(cfg.verify_blob_hashes, false);
    EXPECT_EQ(cfg.verify_source_hashes, true);
    EXPECT_EQ(cfg.verify_partition_hashes, false);
    EXPECT_EQ(cfg.output_dir, "/tmp/out");
    EXPECT_EQ(cfg.log_level, otadump::LogLevel::Debug);
    EXPECT_EQ(cfg.progress, false);
}

TEST(ConfigTest, AbsentKeysStayUnset) {
    ExtractorConfig cfg;
    auto r = cfg.LoadString(R"({"Workers": 2, "SomethingElse": [1, 2]})");
    ASSERT_TRUE(r.ok) << r.msg;
    EXPECT_EQ(cfg.workers, 2u);
    EXPECT_FALSE(cfg.verify_blob_hashes.has_value());
    EXPECT_FALSE(cfg.output_dir.has_value());
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(ConfigTest, WrongTypeIsConfigError) {
    ExtractorConfig cfg;
    auto r = cfg.LoadString(R"({"VerifyBlobHashes": "yes"})");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, otadump::ErrorKind::Config);
    EXPECT_NE(r.msg.find("VerifyBlobHashes"), std::string::npos);
    EXPECT_FALSE(cfg.verify_blob_hashes.has_value());
}

TEST(ConfigTest, NonPositiveWorkersRejected) {
    ExtractorConfig cfg;
    EXPECT_FALSE(cfg.LoadString(R"({"Workers": 0})").ok);
    EXPECT_FALSE(cfg.LoadString(R"({"Workers": -3})").ok);
    EXPECT_FALSE(cfg.LoadString(R"({"Workers": 1.5})").ok);
}

TEST(ConfigTest, UnknownLogLevelRejected) {
    ExtractorConfig cfg;
    auto r = cfg.LoadString(R"({"LogLevel": "chatty"})");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, otadump::ErrorKind::Config);
}

TEST(ConfigTest, InvalidJsonAndNonObjectRoot) {
    ExtractorConfig cfg;
    EXPECT_EQ(cfg.LoadString("{not json").kind, otadump::ErrorKind::Config);
    EXPECT_EQ(cfg.LoadString("[1, 2, 3]").kind, otadump::ErrorKind::Config);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    ExtractorConfig cfg;
    auto r = cfg.LoadFile("/nonexistent/otadump.json");
    ASSERT_FALSE(r.ok);
    EXPECT_EQ(r.kind, otadump::ErrorKind::Config);
}

} // namespace
