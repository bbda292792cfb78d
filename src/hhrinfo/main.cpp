#include "core/version.hpp"
#include "hhr/hhr_reader.hpp"
#include "hhr/parse_error.hpp"
#include "util/cli_parser.hpp"
#include "util/common_init.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

using namespace hhrkit;

static void print_usage(const char* prog) {
    std::fprintf(stderr,
        "Usage: %s [options]\n"
        "\n"
        "Required:\n"
        "  -i <path>                Input hhr report (- for stdin)\n"
        "\n"
        "Options:\n"
        "  -v, --verbose            Also print the hit table rows\n"
        "  --version                Print version and exit\n"
        "  -h, --help               Show this help\n",
        prog);
}

static void print_metadata(const RunMetadata& meta) {
    std::printf("Query:          %s\n", meta.query_name.c_str());
    if (meta.match_columns)
        std::printf("Match columns:  %d\n", *meta.match_columns);
    if (meta.no_of_seqs)
        std::printf("Sequences:      %d out of %d\n",
                    meta.no_of_seqs->first, meta.no_of_seqs->second);
    if (meta.neff)
        std::printf("Neff:           %g\n", *meta.neff);
    if (meta.template_neff)
        std::printf("Template Neff:  %g\n", *meta.template_neff);
    if (meta.searched_hmms)
        std::printf("Searched HMMs:  %d\n", *meta.searched_hmms);
    if (meta.rundate)
        std::printf("Run date:       %s\n", meta.rundate->c_str());
    if (meta.command_line)
        std::printf("Command line:   %s\n", meta.command_line->c_str());
}

int main(int argc, char* argv[]) {
    CliParser cli(argc, argv);

    if (cli.has("-h") || cli.has("--help")) {
        print_usage(argv[0]);
        return 0;
    }
    if (check_version(cli, "hhrinfo")) return 0;

    Logger logger = make_logger(cli, "hhrinfo");
    if (!check_known_options(cli, {"-i", "-v", "--verbose", "--version", "-h", "--help"},
                             logger)) {
        print_usage(argv[0]);
        return 1;
    }
    if (!cli.has("-i")) {
        print_usage(argv[0]);
        return 1;
    }

    std::string path = cli.get_string("-i");
    std::unique_ptr<std::ifstream> file;
    std::istream* in = &std::cin;
    if (path != "-") {
        file = std::make_unique<std::ifstream>(path);
        if (!file->is_open()) {
            logger.error("cannot open %s", path.c_str());
            return 1;
        }
        in = file.get();
    }

    try {
        // Only the preamble is read; hit blocks are not parsed.
        HhrReader reader(*in, logger);
        print_metadata(reader.metadata());
        std::printf("Hits:           %zu\n", reader.hit_count());
        if (logger.verbose()) {
            for (const auto& row : reader.summary_rows()) {
                std::printf("  %s\n", row.c_str());
            }
        }
    } catch (const ParseError& e) {
        logger.error("%s: %s error: %s", path.c_str(),
                     ParseError::kind_name(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        logger.error("%s: %s", path.c_str(), e.what());
        return 1;
    }
    return 0;
}
