#include <gtest/gtest.h>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "support/temp_dir.hpp"

using fxfer::infra::Config;
using fxfer::testing::TempDir;

TEST(ConfigTest, LoadsEveryKey)
{
    TempDir tmp;
    fxfer::testing::write_file(tmp / "config.yaml",
        "threads: 6\n"
        "chunk_size: 1048576\n"
        "registry: /var/lib/fxfer/jobs.yaml\n"
        "verify: true\n"
        "resume: false\n"
        "progress: true\n"
        "log_level: debug\n"
        "retry:\n"
        "  max_attempts: 5\n"
        "  initial_delay_ms: 20\n"
        "  backoff_factor: 1.5\n");

    auto cfg = fxfer::infra::load_config_from_file(tmp / "config.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->effective_threads(), 6u);
    EXPECT_EQ(cfg->effective_chunk_size(), 1048576u);
    EXPECT_EQ(cfg->registry_path(), "/var/lib/fxfer/jobs.yaml");
    EXPECT_TRUE(cfg->verify);
    EXPECT_FALSE(cfg->resume);
    EXPECT_TRUE(cfg->progress);
    EXPECT_EQ(cfg->log_level, "debug");
    EXPECT_EQ(cfg->retry.max_attempts, 5);
    EXPECT_EQ(cfg->retry.initial_delay.count(), 20);
    EXPECT_DOUBLE_EQ(cfg->retry.backoff_factor, 1.5);
}

TEST(ConfigTest, DefaultsWhenKeysAbsent)
{
    TempDir tmp;
    fxfer::testing::write_file(tmp / "config.yaml", "quiet: true\n");

    auto cfg = fxfer::infra::load_config_from_file(tmp / "config.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_TRUE(cfg->quiet);
    EXPECT_FALSE(cfg->threads.has_value());
    EXPECT_EQ(cfg->effective_chunk_size(), fxfer::infra::kDefaultChunkSize);
    EXPECT_GE(cfg->effective_threads(), 1u);
    EXPECT_TRUE(cfg->resume);
}

TEST(ConfigTest, RejectsZeroChunkSize)
{
    TempDir tmp;
    fxfer::testing::write_file(tmp / "config.yaml", "chunk_size: 0\n");
    EXPECT_FALSE(fxfer::infra::load_config_from_file(tmp / "config.yaml").has_value());
}

TEST(ConfigTest, RejectsMalformedYaml)
{
    TempDir tmp;
    fxfer::testing::write_file(tmp / "config.yaml", "threads: [1, 2\n");
    EXPECT_FALSE(fxfer::infra::load_config_from_file(tmp / "config.yaml").has_value());
}

TEST(ConfigTest, CliValuesOverrideFile)
{
    Config file_cfg;
    file_cfg.threads = 2;
    file_cfg.chunk_size = 4096;
    file_cfg.log_level = "warn";

    fxfer::args_parser::CLIArgs args;
    args.threads = 8;
    args.no_resume = true;
    args.registry = "/tmp/jobs.yaml";

    file_cfg.merge_with(fxfer::infra::config_from_cli(args));
    EXPECT_EQ(file_cfg.effective_threads(), 8u);
    EXPECT_EQ(file_cfg.effective_chunk_size(), 4096u);
    EXPECT_FALSE(file_cfg.resume);
    EXPECT_EQ(file_cfg.log_level, "warn");
    EXPECT_EQ(file_cfg.registry_path(), "/tmp/jobs.yaml");
}

TEST(ArgsParserTest, DownloadCommand)
{
    TempDir tmp;
    const auto root = tmp.str();
    const char* argv[] = {"fxfer", "--registry", "/tmp/r.yaml", "download",
                          "data/*/*.csv", "/tmp/out", "--store-root", root.c_str(),
                          "-t", "4", "-c", "1024", "--verify"};
    auto args = fxfer::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, fxfer::args_parser::Command::Download);
    EXPECT_EQ(args->source, "data/*/*.csv");
    EXPECT_EQ(args->destination, "/tmp/out");
    EXPECT_EQ(args->store_root, root);
    EXPECT_EQ(args->threads, 4u);
    EXPECT_EQ(args->chunk_size, 1024u);
    EXPECT_TRUE(args->verify);
    EXPECT_EQ(args->registry, "/tmp/r.yaml");
}

TEST(ArgsParserTest, ForgetCommand)
{
    const char* argv[] = {"fxfer", "forget", "0123456789abcdef"};
    auto args = fxfer::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->command, fxfer::args_parser::Command::Forget);
    EXPECT_EQ(args->job_hash, "0123456789abcdef");
}

TEST(ArgsParserTest, MissingSubcommandFails)
{
    const char* argv[] = {"fxfer"};
    EXPECT_FALSE(fxfer::args_parser::parse_args(1, argv).has_value());
}
