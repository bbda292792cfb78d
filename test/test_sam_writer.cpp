#include "test_util.hpp"
#include "hhr_test_fixture.hpp"

#include "io/sam_writer.hpp"
#include "hhr/hhr_reader.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include <htslib/sam.h>
#include <htslib/hts.h>

using namespace hhrkit;

static std::string g_test_dir;

static std::vector<HhrFile> make_reports() {
    std::istringstream in(hhr_fixture::two_hit_report());
    std::vector<HhrFile> reports;
    reports.push_back(read_hhr(in));
    return reports;
}

static std::string cigar_text(const std::vector<uint32_t>& cigar) {
    std::string s;
    for (uint32_t c : cigar) {
        s += std::to_string(bam_cigar_oplen(c));
        s += bam_cigar_opchr(c);
    }
    return s;
}

static void test_sam_name() {
    std::fprintf(stderr, "-- test_sam_name\n");

    CHECK_STR_EQ(sam_name("query1 test protein"), "query1");
    CHECK_STR_EQ(sam_name("tgt1_A"), "tgt1_A");
    CHECK_STR_EQ(sam_name("  padded\tname"), "padded");
    CHECK_STR_EQ(sam_name(""), "*");
}

static void test_htslib_cigar() {
    std::fprintf(stderr, "-- test_htslib_cigar\n");

    auto reports = make_reports();
    const auto& alns = reports[0].alignments;
    CHECK_EQ(alns.size(), 2u);
    if (alns.size() != 2) return;

    // Query residues 1-7 of 12: trailing hard clip only
    CHECK_STR_EQ(cigar_text(alignment_to_htslib_cigar(alns[0])), "3M1D1M1I2M5H");
    // Query residues 3-9 of 12: clips on both sides
    CHECK_STR_EQ(cigar_text(alignment_to_htslib_cigar(alns[1])), "2H2M1I3M1D1M3H");
}

static void test_sam_basic() {
    std::fprintf(stderr, "-- test_sam_basic\n");

    auto reports = make_reports();
    std::string sam_path = g_test_dir + "/test_output.sam";

    CHECK(write_alignments_sam(sam_path, reports));

    std::ifstream in(sam_path);
    CHECK(in.is_open());

    std::string line;
    bool has_hd = false, has_pg = false;
    int sq_count = 0;
    int record_count = 0;

    while (std::getline(in, line)) {
        if (line.substr(0, 3) == "@HD") has_hd = true;
        if (line.substr(0, 3) == "@SQ") sq_count++;
        if (line.substr(0, 3) == "@PG") {
            has_pg = true;
            CHECK(line.find("PN:hhrconvert") != std::string::npos);
        }
        if (!line.empty() && line[0] != '@') record_count++;
    }

    CHECK(has_hd);
    CHECK(has_pg);
    CHECK(sq_count == 2);
    CHECK(record_count == 2);
}

static void test_sam_records() {
    std::fprintf(stderr, "-- test_sam_records\n");

    auto reports = make_reports();
    std::string sam_path = g_test_dir + "/test_records.sam";
    CHECK(write_alignments_sam(sam_path, reports));

    samFile* fp = sam_open(sam_path.c_str(), "r");
    CHECK(fp != nullptr);
    if (!fp) return;

    sam_hdr_t* hdr = sam_hdr_read(fp);
    CHECK(hdr != nullptr);
    if (!hdr) {
        sam_close(fp);
        return;
    }
    CHECK(sam_hdr_nref(hdr) == 2);
    CHECK(sam_hdr_tid2len(hdr, 0) == 20);
    CHECK(sam_hdr_tid2len(hdr, 1) == 8);

    bam1_t* b = bam_init1();
    int rec = 0;
    while (sam_read1(fp, hdr, b) >= 0) {
        CHECK_STR_EQ(bam_get_qname(b), "query1");
        CHECK(b->core.l_qseq == 7);

        // NM counts mismatches, insertions and deletions
        uint8_t* nm = bam_aux_get(b, "NM");
        CHECK(nm != nullptr);
        if (nm) CHECK_EQ(bam_aux2i(nm), rec == 0 ? 3 : 4);

        if (rec == 0) {
            CHECK_STR_EQ(sam_hdr_tid2name(hdr, b->core.tid), "tgt1_A");
            CHECK(b->core.pos == 2);
            uint8_t* pr = bam_aux_get(b, "PR");
            CHECK(pr != nullptr);
            if (pr) CHECK_NEAR(bam_aux2f(pr), 99.5, 1e-4);
            uint8_t* sc = bam_aux_get(b, "SC");
            CHECK(sc != nullptr);
            if (sc) CHECK_NEAR(bam_aux2f(sc), 55.3, 1e-4);
        } else if (rec == 1) {
            CHECK_STR_EQ(sam_hdr_tid2name(hdr, b->core.tid), "tgt2_B");
            CHECK(b->core.pos == 0);
            CHECK(b->core.n_cigar == 7);
            uint8_t* ev = bam_aux_get(b, "EV");
            CHECK(ev != nullptr);
            if (ev) CHECK_NEAR(bam_aux2f(ev), 0.031, 1e-6);
        }
        rec++;
    }
    CHECK(rec == 2);

    bam_destroy1(b);
    sam_hdr_destroy(hdr);
    sam_close(fp);
}

static void test_bam_roundtrip() {
    std::fprintf(stderr, "-- test_bam_roundtrip\n");

    auto reports = make_reports();
    std::string bam_path = g_test_dir + "/test_roundtrip.bam";

    CHECK(write_alignments_bam(bam_path, reports));

    samFile* fp = sam_open(bam_path.c_str(), "r");
    CHECK(fp != nullptr);
    if (!fp) return;

    sam_hdr_t* hdr = sam_hdr_read(fp);
    CHECK(hdr != nullptr);
    if (!hdr) {
        sam_close(fp);
        return;
    }

    bam1_t* b = bam_init1();
    int rec_count = 0;
    while (sam_read1(fp, hdr, b) >= 0) {
        rec_count++;
        CHECK(bam_aux_get(b, "PR") != nullptr);
        CHECK(bam_aux_get(b, "EV") != nullptr);
    }
    CHECK(rec_count == 2);

    bam_destroy1(b);
    sam_hdr_destroy(hdr);
    sam_close(fp);
}

static void test_shared_target_single_sq() {
    std::fprintf(stderr, "-- test_shared_target_single_sq\n");

    // The same report twice: every target appears in two reports
    auto reports = make_reports();
    reports.push_back(reports[0]);
    std::string sam_path = g_test_dir + "/test_shared.sam";
    CHECK(write_alignments_sam(sam_path, reports));

    std::ifstream in(sam_path);
    std::string line;
    int sq_count = 0;
    int record_count = 0;
    while (std::getline(in, line)) {
        if (line.substr(0, 3) == "@SQ") sq_count++;
        if (!line.empty() && line[0] != '@') record_count++;
    }
    CHECK(sq_count == 2);
    CHECK(record_count == 4);
}

static void test_dispatch_text_formats() {
    std::fprintf(stderr, "-- test_dispatch_text_formats\n");

    auto reports = make_reports();
    std::string tab_path = g_test_dir + "/test_dispatch.tsv";
    CHECK(write_all_alignments(tab_path, reports, OutputFormat::kTab));

    std::ifstream in(tab_path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) lines++;
    CHECK(lines == 3);

    CHECK(!write_all_alignments(g_test_dir + "/no_such_dir/out.tsv", reports,
                                OutputFormat::kTab));
}

int main() {
    g_test_dir = "/tmp/hhrkit_test_sam_writer";
    std::filesystem::create_directories(g_test_dir);

    test_sam_name();
    test_htslib_cigar();
    test_sam_basic();
    test_sam_records();
    test_bam_roundtrip();
    test_shared_target_single_sq();
    test_dispatch_text_formats();

    std::filesystem::remove_all(g_test_dir);

    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
