// =============================================================================
// FILE: tools/cli.cpp
// BRIEF: Command-line subcommands: compute, inspect and benchmark
// =============================================================================

#include "cli.hpp"

#include "gvmi/core/error.hpp"
#include "gvmi/core/progress.hpp"
#include "gvmi/io/h5ad.hpp"
#include "gvmi/io/mi_store.hpp"
#include "gvmi/kernel/mi_summary.hpp"
#include "gvmi/kernel/mi_table.hpp"
#include "gvmi/kernel/pairwise.hpp"
#include "gvmi/threading/scheduler.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <random>

namespace gvmi::cli {

namespace mi = gvmi::kernel::mi;

namespace {

constexpr Size GENE_PREVIEW = 5;

Size parse_count(const char* option, const char* text) {
    char* end = nullptr;
    const long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0' || value < 0) {
        throw ValueError(std::string("Invalid value for ") + option + ": " + text);
    }
    return static_cast<Size>(value);
}

// "<genes>x<samples>", both positive
BenchmarkSize parse_size(const char* text) {
    char* end = nullptr;
    const long long genes = std::strtoll(text, &end, 10);
    if (end == text || *end != 'x' || genes <= 0) {
        throw ValueError(std::string("Invalid size, expected <genes>x<samples>: ") + text);
    }
    const char* rest = end + 1;
    const long long samples = std::strtoll(rest, &end, 10);
    if (end == rest || *end != '\0' || samples <= 0) {
        throw ValueError(std::string("Invalid size, expected <genes>x<samples>: ") + text);
    }
    return {static_cast<Size>(genes), static_cast<Size>(samples)};
}

const char* require_value(int& i, int argc, char* argv[]) {
    if (i + 1 >= argc) {
        throw ValueError(std::string("Missing value for ") + argv[i]);
    }
    return argv[++i];
}

// =============================================================================
// Reports (stdout)
// =============================================================================

void print_stats(const char* title, const mi::ScoreStats& s) {
    std::printf("%s:\n", title);
    if (s.count > 0) {
        std::printf("  Mean: %.4f\n", s.mean);
        std::printf("  Min:  %.4f\n", s.min);
        std::printf("  Max:  %.4f\n", s.max);
    }
    std::printf("\n");
}

void print_top_pairs(const mi::MITable& table, Size k) {
    const auto pairs = mi::top_pairs(table, k);
    if (pairs.empty()) return;

    std::printf("Top %zu mutual information pairs:\n", pairs.size());
    for (Size r = 0; r < pairs.size(); ++r) {
        const auto& p = pairs[r];
        std::printf("  %2zu. %s - %s: %.6f\n", r + 1,
                    table.label(p.i).c_str(), table.label(p.j).c_str(), p.score);
    }
    std::printf("\n");
}

void print_summary(const mi::MITable& table, Size top) {
    const mi::MISummary summary = mi::summarize(table);
    print_stats("Self-mutual information (diagonal) statistics", summary.diagonal);
    print_stats("Cross-gene mutual information statistics", summary.off_diagonal);
    print_top_pairs(table, top);
}

std::string benchmark_gene_name(Size i) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "GENE_%04zu", i);
    return buf;
}

} // anonymous namespace

// =============================================================================
// Arguments
// =============================================================================

std::vector<BenchmarkSize> default_benchmark_sizes() {
    return {{10, 100}, {50, 200}, {100, 500}};
}

void print_help(const char* prog_name) {
    std::printf(R"(
gvmi - pairwise gene mutual information

Usage:
  %s compute <input.h5ad> -o <output.h5> [options]
  %s inspect <result.h5> [options]
  %s benchmark [options]

Compute options:
  -o, --output <file>   Result file (HDF5), required
  --max-genes <n>       Use only the first n genes (default: all)
  --threads <n>         Worker threads (default: all cores)
  --bins <n>            Quantile bins per gene (default: 10)
  --top <k>             Top pairs to report (default: 10, 0 to skip)
  --quiet, -q           No progress bar

Inspect options:
  --top <k>             Top pairs to show (default: 10, 0 to skip)
  --show-genes          List all genes
  --detailed            Show stored metadata

Benchmark options:
  --size <g>x<s>        Synthetic matrix size, repeatable
                        (default: 10x100, 50x200, 100x500)
  --threads <n>         Worker threads (default: all cores)
  --bins <n>            Quantile bins per gene (default: 10)
  --seed <n>            Random seed (default: 42)

General:
  --help, -h            Show this help message
  --version             Show version information

)", prog_name, prog_name, prog_name);
}

ComputeArgs parse_compute(int argc, char* argv[]) {
    ComputeArgs args;
    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "-o") == 0 || std::strcmp(arg, "--output") == 0) {
            args.output = require_value(i, argc, argv);
        }
        else if (std::strcmp(arg, "--max-genes") == 0) {
            args.max_genes = parse_count(arg, require_value(i, argc, argv));
        }
        else if (std::strcmp(arg, "--threads") == 0) {
            args.threads = parse_count(arg, require_value(i, argc, argv));
        }
        else if (std::strcmp(arg, "--bins") == 0) {
            args.bins = static_cast<Index>(parse_count(arg, require_value(i, argc, argv)));
        }
        else if (std::strcmp(arg, "--top") == 0) {
            args.top = parse_count(arg, require_value(i, argc, argv));
        }
        else if (std::strcmp(arg, "--quiet") == 0 || std::strcmp(arg, "-q") == 0) {
            args.quiet = true;
        }
        else if (arg[0] == '-') {
            throw ValueError(std::string("Unknown option: ") + arg);
        }
        else if (args.input.empty()) {
            args.input = arg;
        }
        else {
            throw ValueError(std::string("Unexpected argument: ") + arg);
        }
    }

    GVMI_CHECK_ARG(!args.input.empty(), "compute: missing input .h5ad file");
    GVMI_CHECK_ARG(!args.output.empty(), "compute: missing -o <output.h5>");
    mi::check_n_bins(args.bins);
    return args;
}

InspectArgs parse_inspect(int argc, char* argv[]) {
    InspectArgs args;
    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--top") == 0) {
            args.top = parse_count(arg, require_value(i, argc, argv));
        }
        else if (std::strcmp(arg, "--show-genes") == 0) {
            args.show_genes = true;
        }
        else if (std::strcmp(arg, "--detailed") == 0) {
            args.detailed = true;
        }
        else if (arg[0] == '-') {
            throw ValueError(std::string("Unknown option: ") + arg);
        }
        else if (args.path.empty()) {
            args.path = arg;
        }
        else {
            throw ValueError(std::string("Unexpected argument: ") + arg);
        }
    }

    GVMI_CHECK_ARG(!args.path.empty(), "inspect: missing result file");
    return args;
}

BenchmarkArgs parse_benchmark(int argc, char* argv[]) {
    BenchmarkArgs args;
    for (int i = 2; i < argc; ++i) {
        const char* arg = argv[i];

        if (std::strcmp(arg, "--size") == 0) {
            args.sizes.push_back(parse_size(require_value(i, argc, argv)));
        }
        else if (std::strcmp(arg, "--threads") == 0) {
            args.threads = parse_count(arg, require_value(i, argc, argv));
        }
        else if (std::strcmp(arg, "--bins") == 0) {
            args.bins = static_cast<Index>(parse_count(arg, require_value(i, argc, argv)));
        }
        else if (std::strcmp(arg, "--seed") == 0) {
            args.seed = static_cast<std::uint64_t>(parse_count(arg, require_value(i, argc, argv)));
        }
        else {
            throw ValueError(std::string("Unknown option: ") + arg);
        }
    }

    if (args.sizes.empty()) {
        args.sizes = default_benchmark_sizes();
    }
    mi::check_n_bins(args.bins);
    return args;
}

// =============================================================================
// Subcommands
// =============================================================================

int run_compute(const ComputeArgs& args) {
    std::fprintf(stderr, "Loading AnnData from: %s\n", args.input.c_str());
    const auto load_start = std::chrono::steady_clock::now();
    io::ExpressionData data = io::load_h5ad(args.input, args.max_genes);
    const double load_secs = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - load_start).count();

    std::fprintf(stderr, "  Loaded in %.3f seconds\n", load_secs);
    std::fprintf(stderr, "  Final shape: %zu x %zu (genes x samples)\n",
                 data.n_genes(), data.n_samples);
    if (!data.genes.empty()) {
        std::fprintf(stderr, "  Gene names:");
        for (Size g = 0; g < data.genes.size() && g < GENE_PREVIEW; ++g) {
            std::fprintf(stderr, " %s", data.genes[g].c_str());
        }
        std::fprintf(stderr, "%s\n", data.genes.size() > GENE_PREVIEW ? " ..." : "");
    }

    if (args.threads > 0) {
        threading::Scheduler::set_num_threads(args.threads);
    }

    mi::PairwiseOptions options;
    options.n_bins = args.bins;

    progress::TerminalProgressBar bar(stderr);
    progress::ProgressSink* sink = args.quiet ? nullptr : &bar;

    const auto start = std::chrono::steady_clock::now();
    mi::MITable table = mi::compute_pairwise(data.matrix(), data.genes, options, sink);
    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    if (table.has_duplicate_labels()) {
        std::fprintf(stderr, "Warning: duplicate gene names; lookups by name use the last occurrence\n");
    }

    const Size n_pairs = mi::pair_count(table.size());
    std::fprintf(stderr, "Computed %zu mutual information pairs in %.3f seconds using %zu threads\n",
                 n_pairs, elapsed, threading::Scheduler::get_num_threads());
    if (elapsed > 0.0) {
        std::fprintf(stderr, "Rate: %.1f pairs/second\n", static_cast<double>(n_pairs) / elapsed);
    }

    io::ResultMetadata meta;
    meta.computation_time = elapsed;
    meta.timestamp = io::current_timestamp();
    meta.source = args.input;
    meta.n_bins = args.bins;
    io::save_mi_table(args.output, table, meta);
    std::fprintf(stderr, "Saved results to: %s\n", args.output.c_str());

    print_summary(table, args.top);
    return 0;
}

int run_inspect(const InspectArgs& args) {
    const io::StoredResult stored = io::load_mi_table(args.path);
    const mi::MITable& table = stored.table;

    std::string rule(60, '=');
    std::printf("%s\n", rule.c_str());
    std::printf("Result File Inspection: %s\n", args.path.c_str());
    std::printf("%s\n", rule.c_str());

    std::printf("Number of genes: %zu\n", table.size());
    std::printf("Number of gene pairs: %zu\n", stored.n_pairs);
    std::printf("Computation time: %.2f seconds\n", stored.metadata.computation_time);
    std::printf("Created: %s\n", stored.metadata.timestamp.c_str());
    std::printf("\n");

    const double size_mb = static_cast<double>(std::filesystem::file_size(args.path)) / 1024.0 / 1024.0;
    std::printf("File size: %.2f MB\n\n", size_mb);

    if (args.show_genes) {
        std::printf("Genes:\n");
        for (Size i = 0; i < table.size(); ++i) {
            std::printf("  %3zu. %s\n", i + 1, table.label(i).c_str());
        }
        std::printf("\n");
    }

    print_summary(table, args.top);

    if (args.detailed) {
        std::printf("Detailed metadata:\n");
        std::printf("  source: %s\n", stored.metadata.source.c_str());
        std::printf("  n_bins: %lld\n", static_cast<long long>(stored.metadata.n_bins));
        std::printf("  duplicate_genes: %s\n", table.has_duplicate_labels() ? "yes" : "no");
        std::printf("\n");
    }
    return 0;
}

BenchmarkResult run_benchmark_case(const BenchmarkSize& size, Index n_bins, std::uint64_t seed) {
    std::mt19937_64 rng(seed);
    std::normal_distribution<double> normal(0.0, 1.0);

    std::vector<Real> values(size.genes * size.samples);
    for (auto& v : values) {
        v = static_cast<Real>(normal(rng));
    }
    std::vector<std::string> genes;
    genes.reserve(size.genes);
    for (Size i = 0; i < size.genes; ++i) {
        genes.push_back(benchmark_gene_name(i));
    }

    mi::PairwiseOptions options;
    options.n_bins = n_bins;

    DenseArray<const Real> matrix(values.data(), static_cast<Index>(size.genes),
                                  static_cast<Index>(size.samples));
    const auto start = std::chrono::steady_clock::now();
    mi::MITable table = mi::compute_pairwise(matrix, genes, options);
    const double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    BenchmarkResult result;
    result.size = size;
    result.n_pairs = mi::pair_count(table.size());
    result.seconds = elapsed;
    result.input_mb = static_cast<double>(values.size() * sizeof(Real)) / 1024.0 / 1024.0;
    return result;
}

int run_benchmark(const BenchmarkArgs& args) {
    if (args.threads > 0) {
        threading::Scheduler::set_num_threads(args.threads);
    }

    std::printf("Gene Mutual Information Performance Benchmark\n");
    std::printf("%s\n\n", std::string(50, '=').c_str());

    double total_seconds = 0.0;
    Size total_pairs = 0;
    for (const BenchmarkSize& size : args.sizes) {
        std::printf("Benchmarking with %zu genes and %zu samples...\n", size.genes, size.samples);
        const BenchmarkResult r = run_benchmark_case(size, args.bins, args.seed);
        std::printf("  Computed %zu mutual information pairs in %.3f seconds\n",
                    r.n_pairs, r.seconds);
        if (r.seconds > 0.0) {
            std::printf("  Rate: %.1f pairs/second\n", static_cast<double>(r.n_pairs) / r.seconds);
        }
        std::printf("  Memory footprint: ~%.1f MB for input matrix\n\n", r.input_mb);
        total_seconds += r.seconds;
        total_pairs += r.n_pairs;
    }

    if (total_seconds > 0.0) {
        std::printf("Overall performance: %.1f pairs/second using %zu threads\n",
                    static_cast<double>(total_pairs) / total_seconds,
                    threading::Scheduler::get_num_threads());
    }
    return 0;
}

int run(int argc, char* argv[]) {
    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    const char* command = argv[1];
    if (std::strcmp(command, "--help") == 0 || std::strcmp(command, "-h") == 0) {
        print_help(argv[0]);
        return 0;
    }
    if (std::strcmp(command, "--version") == 0) {
        std::printf("gvmi 1.0.0 (%s, %s)\n", DTYPE_NAME, INDEX_DTYPE_NAME);
        return 0;
    }

    try {
        if (std::strcmp(command, "compute") == 0) {
            return run_compute(parse_compute(argc, argv));
        }
        if (std::strcmp(command, "inspect") == 0) {
            return run_inspect(parse_inspect(argc, argv));
        }
        if (std::strcmp(command, "benchmark") == 0) {
            return run_benchmark(parse_benchmark(argc, argv));
        }
        std::fprintf(stderr, "Error: Unknown command: %s\n", command);
        std::fprintf(stderr, "Use --help for usage information\n");
        return 1;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
}

} // namespace gvmi::cli
