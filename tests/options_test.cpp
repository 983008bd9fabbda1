#include "streamdl/options.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <stdexcept>

using namespace streamdl;
using streamdl::test::TempDir;
using streamdl::test::write_file;

TEST(OptionsTest, Defaults) {
    DownloadOptions opts;
    EXPECT_EQ(opts.chunk_size, 8192u);
    EXPECT_FALSE(opts.resume_from_offset);
    EXPECT_FALSE(opts.file_pointer.has_value());
}

TEST(OptionsTest, ReadsRecognizedKeys) {
    auto j = nlohmann::json::parse(R"({"chunkSize": 4, "resumeFromOffset": true, "filePointer": 5})");
    DownloadOptions opts = DownloadOptions::fromJson(j);
    EXPECT_EQ(opts.chunk_size, 4u);
    EXPECT_TRUE(opts.resume_from_offset);
    ASSERT_TRUE(opts.file_pointer.has_value());
    EXPECT_EQ(*opts.file_pointer, 5u);
}

TEST(OptionsTest, ZeroChunkSizeFallsBackToDefault) {
    DownloadOptions opts = DownloadOptions::fromJson({{"chunkSize", 0}});
    EXPECT_EQ(opts.chunk_size, DEFAULT_CHUNK_SIZE);
}

TEST(OptionsTest, UnknownKeysAreIgnored) {
    DownloadOptions opts = DownloadOptions::fromJson({{"retries", 3}, {"chunkSize", 16}});
    EXPECT_EQ(opts.chunk_size, 16u);
}

TEST(OptionsTest, RejectsWrongTypes) {
    EXPECT_THROW(DownloadOptions::fromJson({{"chunkSize", "big"}}), std::runtime_error);
    EXPECT_THROW(DownloadOptions::fromJson({{"chunkSize", -1}}), std::runtime_error);
    EXPECT_THROW(DownloadOptions::fromJson({{"resumeFromOffset", 1}}), std::runtime_error);
    EXPECT_THROW(DownloadOptions::fromJson({{"filePointer", 1.5}}), std::runtime_error);
    EXPECT_THROW(DownloadOptions::fromJson(nlohmann::json::array()), std::runtime_error);
}

TEST(OptionsTest, ErrorMessageCarriesCode) {
    try {
        DownloadOptions::fromJson({{"resumeFromOffset", "yes"}});
        FAIL() << "expected invalid_config";
    } catch (const std::runtime_error &e) {
        EXPECT_EQ(std::string(e.what()).rfind("invalid_config:", 0), 0u) << e.what();
    }
}

TEST(OptionsTest, ToJsonOmitsUnsetFilePointer) {
    DownloadOptions opts;
    nlohmann::json j = opts.toJson();
    EXPECT_EQ(j["chunkSize"], 8192);
    EXPECT_EQ(j["resumeFromOffset"], false);
    EXPECT_FALSE(j.contains("filePointer"));

    opts.file_pointer = 10;
    EXPECT_EQ(opts.toJson()["filePointer"], 10);
}

TEST(OptionsTest, LoadsFromFile) {
    TempDir dir;
    write_file(dir.path("opts.json"), R"({"chunkSize": 1024, "resumeFromOffset": true})");

    DownloadOptions opts = DownloadOptions::load(dir.path("opts.json").string());
    EXPECT_EQ(opts.chunk_size, 1024u);
    EXPECT_TRUE(opts.resume_from_offset);
}

TEST(OptionsTest, LoadReportsMissingAndMalformedFiles) {
    TempDir dir;
    EXPECT_THROW(DownloadOptions::load(dir.path("missing.json").string()), std::runtime_error);

    write_file(dir.path("broken.json"), "{ chunkSize: ");
    try {
        DownloadOptions::load(dir.path("broken.json").string());
        FAIL() << "expected invalid_config";
    } catch (const std::runtime_error &e) {
        EXPECT_NE(std::string(e.what()).find("invalid_config"), std::string::npos);
    }
}
