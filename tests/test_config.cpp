#include <gtest/gtest.h>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "test_utils.hpp"

using ftool::infra::Config;
using ftool::infra::load_config_from;
using ftool::test::TempDir;
using ftool::test::write_file;

TEST(ConfigTest, DefaultsWithoutFile)
{
    Config config;
    EXPECT_EQ(config.chunk_size(), ftool::infra::kDefaultChunkSize);
    EXPECT_EQ(config.large_file_threshold, ftool::infra::kLargeFileThreshold);
    EXPECT_EQ(config.multi_entry_threshold, 5u);
    EXPECT_TRUE(config.preserve_metadata);
    EXPECT_TRUE(config.progress);
    EXPECT_FALSE(config.verify);
    EXPECT_FALSE(config.language);
}

TEST(ConfigTest, LoadsAllKeys)
{
    TempDir dir;
    write_file(dir / "ftool.yaml",
               "buffer_size: 4096\n"
               "large_file_threshold: 1000\n"
               "multi_entry_threshold: 3\n"
               "verify: true\n"
               "preserve_metadata: false\n"
               "progress: false\n"
               "quiet: true\n"
               "language: zh_CN\n"
               "trash_dir: /tmp/trash\n");

    auto config = load_config_from(dir / "ftool.yaml");
    ASSERT_TRUE(config) << config.error();
    EXPECT_EQ(config->chunk_size(), 4096u);
    EXPECT_EQ(config->large_file_threshold, 1000u);
    EXPECT_EQ(config->multi_entry_threshold, 3u);
    EXPECT_TRUE(config->verify);
    EXPECT_FALSE(config->preserve_metadata);
    EXPECT_FALSE(config->progress);
    EXPECT_TRUE(config->quiet);
    EXPECT_EQ(config->language, "zh_CN");
    EXPECT_EQ(config->trash_dir, std::filesystem::path("/tmp/trash"));
}

TEST(ConfigTest, RejectsZeroBuffer)
{
    TempDir dir;
    write_file(dir / "ftool.yaml", "buffer_size: 0\n");
    auto config = load_config_from(dir / "ftool.yaml");
    ASSERT_FALSE(config);
    EXPECT_NE(config.error().find("buffer_size"), std::string::npos);
}

TEST(ConfigTest, ReportsBadYamlAndMissingFile)
{
    TempDir dir;
    write_file(dir / "broken.yaml", "verify: [unclosed\n");
    EXPECT_FALSE(load_config_from(dir / "broken.yaml"));
    EXPECT_FALSE(load_config_from(dir / "absent.yaml"));
}

TEST(ConfigTest, CliOverridesFile)
{
    Config file_config;
    file_config.buffer_size = 8192;

    ftool::args_parser::CLIArgs args;
    args.verify = true;
    args.quiet = true;

    file_config.merge_with(ftool::infra::config_from_cli(args));
    EXPECT_EQ(file_config.chunk_size(), 8192u);
    EXPECT_TRUE(file_config.verify);
    EXPECT_TRUE(file_config.quiet);
    EXPECT_FALSE(file_config.progress);
}
