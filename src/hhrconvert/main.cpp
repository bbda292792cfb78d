#include "core/version.hpp"
#include "hhr/hhr_reader.hpp"
#include "hhr/parse_error.hpp"
#include "io/alignment_writer.hpp"
#include "io/sam_writer.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <exception>
#include <numeric>
#include <string>
#include <vector>

#include <tbb/parallel_for_each.h>
#include <tbb/task_arena.h>

using namespace hhrkit;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -i <path>                Input hhr report (- for stdin); may be repeated\n"
        "\n"
        "Options:\n"
        "  -o <path>                Output file (default: stdout)\n"
        "  -outfmt <tab|json|sam|bam>  Output format (default: tab)\n"
        "  -threads <int>           Files parsed in parallel (default: all cores)\n"
        "  -v, --verbose            Verbose logging\n"
        "  --version                Print version and exit\n"
        "  -h, --help               Show this help\n",
        prog);
}

// Outcome of parsing one input file.
struct ConvertJob {
    std::string path;
    HhrFile report;
    std::string error;
};

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (check_version(cli, "hhrconvert")) return 0;

    Logger logger = make_logger(cli, "hhrconvert");
    if (!check_known_options(cli, {"-i", "-o", "-outfmt", "-threads", "-v",
                                   "--verbose", "--version", "-h", "--help"},
                             logger)) {
        print_usage(argv[0]);
        return 1;
    }

    auto inputs = cli.get_strings("-i");
    if (inputs.empty()) {
        print_usage(argv[0]);
        return 1;
    }
    if (!check_single_stdin(inputs, logger)) return 1;

    OutputFormat outfmt = OutputFormat::kTab;
    std::string error_msg;
    if (!parse_output_format(cli.get_string("-outfmt", "tab"), outfmt, error_msg)) {
        logger.error("%s", error_msg.c_str());
        return 1;
    }

    std::string output_path = cli.get_string("-o");
    if (outfmt == OutputFormat::kBam && (output_path.empty() || output_path == "-")) {
        logger.error("-outfmt bam requires -o <path>");
        return 1;
    }

    int num_threads = resolve_threads(cli);
    logger.info("Converting %zu report(s), threads=%d", inputs.size(), num_threads);

    std::vector<ConvertJob> jobs(inputs.size());
    for (size_t i = 0; i < inputs.size(); i++) {
        jobs[i].path = inputs[i];
    }

    // Each report has its own reader; only the job list is shared.
    tbb::task_arena arena(num_threads);
    arena.execute([&] {
        tbb::parallel_for_each(jobs.begin(), jobs.end(), [&](ConvertJob& job) {
            try {
                job.report = read_hhr(job.path);
            } catch (const ParseError& e) {
                job.error = std::string(ParseError::kind_name(e.kind())) +
                            " error: " + e.what();
            } catch (const std::exception& e) {
                job.error = e.what();
            }
        });
    });

    bool failed = false;
    std::vector<HhrFile> reports;
    reports.reserve(jobs.size());
    for (auto& job : jobs) {
        if (!job.error.empty()) {
            logger.error("%s: %s", job.path.c_str(), job.error.c_str());
            failed = true;
            continue;
        }
        logger.debug("%s: query '%s', %zu alignment(s)",
                     job.path.c_str(), job.report.metadata.query_name.c_str(),
                     job.report.alignments.size());
        reports.push_back(std::move(job.report));
    }
    if (failed) return 1;

    if (!write_all_alignments(output_path, reports, outfmt)) {
        logger.error("failed to write output");
        return 1;
    }

    size_t total = std::accumulate(reports.begin(), reports.end(), size_t(0),
        [](size_t n, const HhrFile& r) { return n + r.alignments.size(); });
    logger.info("Done. %zu alignment(s) written.", total);
    return 0;
}
