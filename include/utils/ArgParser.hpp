#pragma once

#include <CLI/CLI.hpp>

#include <iostream>
#include <string>

#include "core/Config.hpp"
#include "utils/Logger.hpp"

namespace CentiPrep {
namespace Utils {

/**
 * @brief Command-line argument parser wrapper around CLI11.
 */
class ArgParser {
public:
    /**
     * @brief Parses command line arguments and populates the Config object.
     * 
     * Uses CLI11 to handle argument parsing, type conversion, and basic validation
     * (e.g., file existence, numeric ranges).
     * 
     * @param argc Argument count.
     * @param argv Argument values.
     * @param config Reference to Config object to populate.
     * @return true if parsing was successful and execution should continue.
     * @return false if parsing failed or help was requested (execution should stop).
     */
    static bool parse(int argc, char** argv, Config& config) {
        CLI::App app{"CentiPrep - Read-start matrices around motif sites for footprinting"};

        // Input/Output
        app.add_option("-b,--bam", config.bam_path, "Path to aligned reads BAM (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-m,--motifs", config.motif_path, "Path to FIMO match table (Required)")
            ->required()
            ->check(CLI::ExistingFile);

        app.add_option("-o,--output-dir", config.output_dir, "Output Directory (Default: output)");

        app.add_option("-p,--prefix", config.output_prefix, "Output file prefix (Default: motif file stem)");

        app.add_option("--motif-id", config.motif_id, "Only use rows of this motif_id/motif_alt_id");

        // Parameters
        app.add_option("-l,--log10p", config.log10p_threshold,
            "Keep matches with -log10(p-value) greater than this (Default: 4)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("-f,--flank-size", config.flank_size, "Bases added on each side of a motif (Default: 100)")
            ->check(CLI::NonNegativeNumber);

        app.add_option("-j,--threads", config.threads, "Number of threads (Default: 1)")
            ->check(CLI::PositiveNumber);

        // Filter parameters
        app.add_option("--min-mapq", config.min_mapq, "Minimum mapping quality (Default: 0)")
            ->check(CLI::Range(0, 255));

        app.add_flag("--skip-duplicates", config.skip_duplicates, "Ignore reads flagged as PCR/optical duplicates");

        app.add_flag("--skip-secondary", config.skip_secondary, "Ignore secondary and supplementary alignments");

        app.add_flag("--skip-qcfail", config.skip_qcfail, "Ignore reads failing vendor QC");

        // Logging
        std::string log_level_str = "info";
        app.add_option("--log-level", log_level_str, 
            "Logging level: error, warn, info, debug (Default: info)")
            ->check(CLI::IsMember({"error", "warn", "info", "debug"}, CLI::ignore_case));

        app.add_option("--log-file", config.log_file, "Also append log messages to this file");

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // If help is requested (ret=0) or error occurs (ret>0), we print message and return false.
            app.exit(e);
            return false;
        }

        if (!Logger::parse_level(log_level_str, config.log_level)) {
            std::cerr << "Error: unknown log level '" << log_level_str << "'" << std::endl;
            return false;
        }

        return true;
    }
};

} // namespace Utils
} // namespace CentiPrep
