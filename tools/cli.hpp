#pragma once

#include "gvmi/core/type.hpp"
#include "gvmi/kernel/discretize.hpp"

#include <cstdint>
#include <string>
#include <vector>

// =============================================================================
// FILE: tools/cli.hpp
// BRIEF: Argument parsing and subcommands of the gvmi command-line tool
//
// Parsers read argv[2..argc) (argv[1] is the subcommand) and throw
// ValueError on malformed input. Subcommands return the process exit code.
// =============================================================================

namespace gvmi::cli {

constexpr Size DEFAULT_TOP_PAIRS = 10;

struct ComputeArgs {
    std::string input;
    std::string output;
    Size max_genes = 0;
    Size threads = 0;
    Index bins = kernel::mi::config::DEFAULT_N_BINS;
    Size top = DEFAULT_TOP_PAIRS;
    bool quiet = false;
};

struct InspectArgs {
    std::string path;
    Size top = DEFAULT_TOP_PAIRS;
    bool show_genes = false;
    bool detailed = false;
};

struct BenchmarkSize {
    Size genes = 0;
    Size samples = 0;
};

struct BenchmarkArgs {
    std::vector<BenchmarkSize> sizes;   // empty selects the default ladder
    Size threads = 0;
    Index bins = kernel::mi::config::DEFAULT_N_BINS;
    std::uint64_t seed = 42;
};

struct BenchmarkResult {
    BenchmarkSize size;
    Size n_pairs = 0;
    double seconds = 0.0;
    double input_mb = 0.0;
};

// 10x100, 50x200, 100x500 (genes x samples)
std::vector<BenchmarkSize> default_benchmark_sizes();

void print_help(const char* prog_name);

ComputeArgs parse_compute(int argc, char* argv[]);
InspectArgs parse_inspect(int argc, char* argv[]);
BenchmarkArgs parse_benchmark(int argc, char* argv[]);

// Standard-normal genes x samples matrix, deterministic in seed
BenchmarkResult run_benchmark_case(const BenchmarkSize& size, Index n_bins, std::uint64_t seed);

int run_compute(const ComputeArgs& args);
int run_inspect(const InspectArgs& args);
int run_benchmark(const BenchmarkArgs& args);

// Dispatches on argv[1]; prints "Error: <message>" and returns 1 on failure
int run(int argc, char* argv[]);

} // namespace gvmi::cli
