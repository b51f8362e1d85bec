#include <gtest/gtest.h>

#include <string>

#include "core/Config.hpp"
#include "test_utils.hpp"
#include "utils/ArgParser.hpp"
#include "utils/Logger.hpp"

using namespace CentiPrep;
using namespace CentiPrep::Testing;

TEST(ConfigTest, DefaultsMatchPipelineDefaults) {
    Config config;
    EXPECT_DOUBLE_EQ(config.log10p_threshold, 4.0);
    EXPECT_EQ(config.flank_size, 100);
    EXPECT_EQ(config.min_mapq, 0);
    EXPECT_EQ(config.threads, 1);
}

TEST(ConfigTest, ValidationSuccess) {
    TempDir tmp;
    Config config;
    config.bam_path = tmp.file("reads.bam");
    config.motif_path = tmp.file("fimo.tsv");
    write_bam(config.bam_path, {sam_record("f", "chr1", 95, false)});
    write_text_file(config.motif_path, fimo_header());

    // Missing index only warns
    EXPECT_TRUE(config.validate());
}

TEST(ConfigTest, ValidationFailureInvalidBam) {
    TempDir tmp;
    Config config;
    config.bam_path = tmp.file("reads.bam");
    config.motif_path = tmp.file("fimo.tsv");
    write_text_file(config.bam_path, "dummy content");
    write_text_file(config.motif_path, fimo_header());

    // Not a valid BAM file, htslib should fail
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, ValidationFailureMissingFiles) {
    Config config;
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, ValidationFailureInvalidValues) {
    TempDir tmp;
    Config config;
    config.bam_path = tmp.file("reads.bam");
    config.motif_path = tmp.file("fimo.tsv");
    write_bam(config.bam_path, {sam_record("f", "chr1", 95, false)});
    write_text_file(config.motif_path, fimo_header());

    config.flank_size = -1;
    EXPECT_FALSE(config.validate());
    config.flank_size = 100;

    config.log10p_threshold = -2.0;
    EXPECT_FALSE(config.validate());
    config.log10p_threshold = 4.0;

    config.threads = 0;
    EXPECT_FALSE(config.validate());
}

TEST(ConfigTest, OutputPrefixDefaultsToMotifStem) {
    Config config;
    config.motif_path = "/data/runs/CTCF_fimo.txt";
    EXPECT_EQ(config.get_output_prefix(), "CTCF_fimo");
    config.output_prefix = "custom";
    EXPECT_EQ(config.get_output_prefix(), "custom");
}

TEST(ArgParserTest, ParseArgumentsShortOptions) {
    TempDir tmp;
    std::string bam = tmp.file("t.bam");
    std::string fimo = tmp.file("m.tsv");
    // Create files BEFORE parsing because CLI::ExistingFile checks for them
    write_text_file(bam, "x");
    write_text_file(fimo, "x");

    const char* argv[] = {"centiprep", "-b", bam.c_str(), "-m", fimo.c_str(), "-l", "6", "-f", "50", "-j", "4"};
    int argc = 11;

    Config config;
    bool result = Utils::ArgParser::parse(argc, const_cast<char**>(argv), config);

    EXPECT_TRUE(result);
    EXPECT_EQ(config.bam_path, bam);
    EXPECT_EQ(config.motif_path, fimo);
    EXPECT_DOUBLE_EQ(config.log10p_threshold, 6.0);
    EXPECT_EQ(config.flank_size, 50);
    EXPECT_EQ(config.threads, 4);
}

TEST(ArgParserTest, ParseLongOptions) {
    TempDir tmp;
    std::string bam = tmp.file("t.bam");
    std::string fimo = tmp.file("m.tsv");
    write_text_file(bam, "x");
    write_text_file(fimo, "x");

    const char* argv[] = {"centiprep", "--bam", bam.c_str(), "--motifs", fimo.c_str(), "--motif-id", "CTCF",
                          "--min-mapq", "30", "--skip-duplicates", "--log-level", "DEBUG"};
    int argc = 12;

    Config config;
    ASSERT_TRUE(Utils::ArgParser::parse(argc, const_cast<char**>(argv), config));
    EXPECT_EQ(config.motif_id, "CTCF");
    EXPECT_EQ(config.min_mapq, 30);
    EXPECT_TRUE(config.skip_duplicates);
    EXPECT_FALSE(config.skip_secondary);
    EXPECT_EQ(config.log_level, LogLevel::LOG_DEBUG);
}

TEST(ArgParserTest, MissingRequiredOptionFails) {
    const char* argv[] = {"centiprep", "-f", "10"};
    Config config;
    EXPECT_FALSE(Utils::ArgParser::parse(3, const_cast<char**>(argv), config));
}

TEST(LoggerTest, ParsesLevelNames) {
    LogLevel level = LogLevel::LOG_INFO;
    EXPECT_TRUE(Utils::Logger::parse_level("Warn", level));
    EXPECT_EQ(level, LogLevel::LOG_WARN);
    EXPECT_FALSE(Utils::Logger::parse_level("verbose", level));
    EXPECT_EQ(level, LogLevel::LOG_WARN);
}
