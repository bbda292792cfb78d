#include "test_util.hpp"
#include "hhr_test_fixture.hpp"
#include "hhr/header_reader.hpp"
#include "hhr/parse_error.hpp"
#include "io/line_reader.hpp"

#include <sstream>
#include <string>

using namespace hhrkit;

static RunMetadata parse(const std::string& text) {
    std::istringstream in(text);
    LineReader lines(in);
    return read_header(lines);
}

static void test_typed_values() {
    std::fprintf(stderr, "-- test_typed_values\n");

    RunMetadata meta = parse(hhr_fixture::header_text());
    CHECK_STR_EQ(meta.query_name, "query1 test protein");
    CHECK(meta.match_columns.has_value());
    CHECK_EQ(*meta.match_columns, 12);
    CHECK(meta.no_of_seqs.has_value());
    CHECK_EQ(meta.no_of_seqs->first, 25);
    CHECK_EQ(meta.no_of_seqs->second, 130);
    CHECK(meta.neff.has_value());
    CHECK_NEAR(*meta.neff, 2.4, 1e-9);
    CHECK(!meta.template_neff.has_value());
    CHECK(meta.searched_hmms.has_value());
    CHECK_EQ(*meta.searched_hmms, 3456);
    CHECK(meta.rundate.has_value());
    CHECK_STR_EQ(*meta.rundate, "Mon Oct 19 10:00:00 2026");
    CHECK(meta.command_line.has_value());
    CHECK_STR_EQ(*meta.command_line, "hhsearch -i query1.a3m -d testdb");
}

static void test_stops_at_blank_line() {
    std::fprintf(stderr, "-- test_stops_at_blank_line\n");

    std::istringstream in(hhr_fixture::header_text() + "next line\n");
    LineReader lines(in);
    read_header(lines);
    std::string line;
    CHECK(lines.next(line));
    CHECK_STR_EQ(line, "next line");
}

static void test_template_neff() {
    std::fprintf(stderr, "-- test_template_neff\n");

    RunMetadata meta = parse("Query         q\nTemplate_Neff 1.75\n\n");
    CHECK(meta.template_neff.has_value());
    CHECK_NEAR(*meta.template_neff, 1.75, 1e-9);
    CHECK(!meta.match_columns.has_value());
}

static void test_unknown_key() {
    std::fprintf(stderr, "-- test_unknown_key\n");

    std::string text = hhr_fixture::replace_once(hhr_fixture::header_text(),
                                                 "Searched_HMMs", "Searched_Models");
    CHECK_THROWS_AS(parse(text), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
        CHECK_EQ(e.line_number(), 5u);
        CHECK(std::string(e.what()).find("Searched_Models") != std::string::npos);
    });
}

static void test_truncated_header() {
    std::fprintf(stderr, "-- test_truncated_header\n");

    CHECK_THROWS_AS(parse("Query         q\nMatch_columns 12\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kTruncation);
    });
    CHECK_THROWS_AS(parse(""), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kTruncation);
    });
}

static void test_malformed_values() {
    std::fprintf(stderr, "-- test_malformed_values\n");

    CHECK_THROWS_AS(parse("Query q\nMatch_columns twelve\n\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
    CHECK_THROWS_AS(parse("Query q\nNo_of_seqs    25 of 130\n\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
    CHECK_THROWS_AS(parse("Query q\nNeff 2.4x\n\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
    CHECK_THROWS_AS(parse("Query q\nDate\n\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
}

static void test_missing_query() {
    std::fprintf(stderr, "-- test_missing_query\n");

    CHECK_THROWS_AS(parse("Match_columns 12\n\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
}

static void test_out_of_range_values() {
    std::fprintf(stderr, "-- test_out_of_range_values\n");

    // 2^32 + 12 must not wrap around to 12
    std::string text = hhr_fixture::replace_once(hhr_fixture::header_text(),
                                                 "Match_columns 12",
                                                 "Match_columns 4294967308");
    CHECK_THROWS_AS(parse(text), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
        CHECK_EQ(e.line_number(), 2u);
        CHECK(std::string(e.what()).find("Match_columns") != std::string::npos);
    });

    CHECK_THROWS_AS(parse("Query         q\nSearched_HMMs -2147483649\n\n"), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
    CHECK_THROWS_AS(parse("Query         q\nNo_of_seqs    1 out of 99999999999\n\n"),
                    ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
    // Beyond the range of long altogether
    CHECK_THROWS_AS(parse("Query         q\nMatch_columns 99999999999999999999999\n\n"),
                    ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });

    RunMetadata meta = parse("Query         q\nMatch_columns 2147483647\n\n");
    CHECK(meta.match_columns.has_value());
    CHECK_EQ(*meta.match_columns, 2147483647);
}

int main() {
    test_typed_values();
    test_stops_at_blank_line();
    test_template_neff();
    test_unknown_key();
    test_truncated_header();
    test_malformed_values();
    test_missing_query();
    test_out_of_range_values();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
