#include "test_util.hpp"
#include "hhr_test_fixture.hpp"
#include "hhr/parse_error.hpp"
#include "hhr/summary_reader.hpp"
#include "io/line_reader.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace hhrkit;

static std::vector<std::string> parse(const std::string& text) {
    std::istringstream in(text);
    LineReader lines(in);
    return read_summary_table(lines);
}

static void test_row_count() {
    std::fprintf(stderr, "-- test_row_count\n");

    auto rows = parse(hhr_fixture::table_text());
    CHECK_EQ(rows.size(), 2u);
    CHECK(rows[0].rfind("1 tgt1_A", 0) == 0);
    CHECK(rows[1].rfind("2 tgt2_B", 0) == 0);
}

static void test_stops_at_blank_line() {
    std::fprintf(stderr, "-- test_stops_at_blank_line\n");

    std::istringstream in(hhr_fixture::table_text() + "No 1\n");
    LineReader lines(in);
    auto rows = read_summary_table(lines);
    CHECK_EQ(rows.size(), 2u);
    std::string line;
    CHECK(lines.next(line));
    CHECK_STR_EQ(line, "No 1");
}

static void test_empty_table() {
    std::fprintf(stderr, "-- test_empty_table\n");

    CHECK_EQ(parse(hhr_fixture::table_header_text() + "\n").size(), 0u);
    // End of stream also ends the table
    CHECK_EQ(parse(hhr_fixture::table_header_text()).size(), 0u);
}

static void test_wrong_header() {
    std::fprintf(stderr, "-- test_wrong_header\n");

    std::string text = hhr_fixture::replace_once(hhr_fixture::table_text(),
                                                 "P-value", "Q-value");
    CHECK_THROWS_AS(parse(text), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
        CHECK_EQ(e.line_number(), 1u);
    });
}

static void test_non_contiguous_rows() {
    std::fprintf(stderr, "-- test_non_contiguous_rows\n");

    std::string text = hhr_fixture::replace_once(hhr_fixture::table_text(),
                                                 "  2 tgt2_B", "  3 tgt2_B");
    CHECK_THROWS_AS(parse(text), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kConsistency);
        CHECK_EQ(e.line_number(), 3u);
        std::string msg = e.what();
        CHECK(msg.find("numbered 3") != std::string::npos);
        CHECK(msg.find("expected 2") != std::string::npos);
    });
}

static void test_non_numeric_row() {
    std::fprintf(stderr, "-- test_non_numeric_row\n");

    std::string text = hhr_fixture::table_header_text() + "  x tgt1_A\n\n";
    CHECK_THROWS_AS(parse(text), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kStructural);
    });
}

static void test_truncated() {
    std::fprintf(stderr, "-- test_truncated\n");

    CHECK_THROWS_AS(parse(""), ParseError, {
        CHECK_EQ(e.kind(), ParseError::kTruncation);
    });
}

int main() {
    test_row_count();
    test_stops_at_blank_line();
    test_empty_table();
    test_wrong_header();
    test_non_contiguous_rows();
    test_non_numeric_row();
    test_truncated();

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
