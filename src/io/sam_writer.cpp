#include "io/sam_writer.hpp"
#include "core/version.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <htslib/sam.h>
#include <htslib/hts.h>

namespace hhrkit {

std::string sam_name(const std::string& id) {
    size_t start = 0;
    while (start < id.size() && (id[start] == ' ' || id[start] == '\t')) start++;
    size_t end = start;
    while (end < id.size() && id[end] != ' ' && id[end] != '\t') end++;
    if (end == start) return "*";
    return id.substr(start, end - start);
}

std::vector<uint32_t> alignment_to_htslib_cigar(const PairwiseAlignment& aln) {
    std::vector<uint32_t> cigar;
    uint32_t left_clip = aln.query.start;
    uint32_t right_clip = aln.query.length > aln.query.end()
                        ? aln.query.length - aln.query.end() : 0;

    if (left_clip > 0) cigar.push_back(bam_cigar_gen(left_clip, BAM_CHARD_CLIP));
    for (const auto& e : cigar_ops(aln)) {
        int op;
        switch (e.op) {
            case 'I': op = BAM_CINS;   break;
            case 'D': op = BAM_CDEL;   break;
            default:  op = BAM_CMATCH; break;
        }
        cigar.push_back(bam_cigar_gen(e.len, op));
    }
    if (right_clip > 0) cigar.push_back(bam_cigar_gen(right_clip, BAM_CHARD_CLIP));
    return cigar;
}

static int append_float_tag(bam1_t* b, const char tag[2], const PairwiseAlignment& aln,
                            const char* key) {
    auto it = aln.annotations.find(key);
    if (it == aln.annotations.end()) return 0;
    float v = static_cast<float>(it->second);
    return bam_aux_append(b, tag, 'f', sizeof(float),
                          reinterpret_cast<const uint8_t*>(&v));
}

static bool write_record(samFile* fp, sam_hdr_t* hdr, bam1_t* b,
                         const PairwiseAlignment& aln) {
    std::string qname = sam_name(aln.query.id);
    std::string rname = sam_name(aln.target.id);
    int32_t tid = sam_hdr_name2tid(hdr, rname.c_str());
    if (tid < 0) return false;

    auto cigar = alignment_to_htslib_cigar(aln);
    const std::string& seq = aln.query.residues;

    if (bam_set1(b,
                 qname.size(), qname.c_str(),
                 0, tid, static_cast<hts_pos_t>(aln.target.start), 255,
                 cigar.size(), cigar.data(),
                 -1, -1, 0,
                 seq.size(), seq.c_str(), nullptr,
                 0) < 0) {
        return false;
    }

    // NM:i: edit distance over aligned, inserted and deleted columns
    ColumnCounts counts = count_columns(aln);
    int32_t nm = static_cast<int32_t>(counts.mismatches + counts.insertions +
                                      counts.deletions);
    if (bam_aux_append(b, "NM", 'i', sizeof(int32_t),
                       reinterpret_cast<const uint8_t*>(&nm)) < 0) {
        return false;
    }
    if (append_float_tag(b, "PR", aln, "Probab") < 0) return false;
    if (append_float_tag(b, "EV", aln, "E-value") < 0) return false;
    if (append_float_tag(b, "SC", aln, "Score") < 0) return false;

    return sam_write1(fp, hdr, b) >= 0;
}

static bool write_sam_bam_impl(const std::string& output_path,
                               const std::vector<HhrFile>& reports,
                               bool is_bam) {
    const char* mode = is_bam ? "wb" : "w";
    const char* path = output_path.c_str();
    if (!is_bam && (output_path.empty() || output_path == "-")) {
        path = "-";
    }

    samFile* fp = sam_open(path, mode);
    if (!fp) {
        std::fprintf(stderr, "sam_writer: cannot open %s\n", path);
        return false;
    }

    sam_hdr_t* hdr = sam_hdr_init();
    if (!hdr) {
        sam_close(fp);
        return false;
    }

    // @HD
    bool ok = sam_hdr_add_line(hdr, "HD", "VN", "1.6", "SO", "unsorted", NULL) == 0;

    // @SQ: one per target, ordered by first appearance
    std::set<std::string> seen;
    for (const auto& report : reports) {
        for (const auto& aln : report.alignments) {
            std::string name = sam_name(aln.target.id);
            if (!seen.insert(name).second) continue;
            std::string len_str = std::to_string(aln.target.length);
            if (sam_hdr_add_line(hdr, "SQ", "SN", name.c_str(), "LN", len_str.c_str(), NULL) != 0)
                ok = false;
        }
    }

    // @PG
    if (sam_hdr_add_line(hdr, "PG", "ID", "hhrconvert", "PN", "hhrconvert",
                         "VN", HHRKIT_VERSION, NULL) != 0)
        ok = false;

    if (ok) ok = sam_hdr_write(fp, hdr) >= 0;

    bam1_t* b = bam_init1();
    for (const auto& report : reports) {
        for (const auto& aln : report.alignments) {
            if (!ok) break;
            ok = write_record(fp, hdr, b, aln);
        }
    }
    if (!ok) {
        std::fprintf(stderr, "sam_writer: failed writing %s\n", path);
    }

    bam_destroy1(b);
    sam_hdr_destroy(hdr);
    if (sam_close(fp) < 0) ok = false;
    return ok;
}

bool write_alignments_sam(const std::string& output_path,
                          const std::vector<HhrFile>& reports) {
    return write_sam_bam_impl(output_path, reports, false);
}

bool write_alignments_bam(const std::string& output_path,
                          const std::vector<HhrFile>& reports) {
    return write_sam_bam_impl(output_path, reports, true);
}

bool write_all_alignments(const std::string& output_path,
                          const std::vector<HhrFile>& reports,
                          OutputFormat fmt) {
    if (fmt == OutputFormat::kSam) {
        return write_alignments_sam(output_path.empty() ? "-" : output_path, reports);
    }
    if (fmt == OutputFormat::kBam) {
        return write_alignments_bam(output_path, reports);
    }

    auto write_text = [&](std::ostream& out) {
        if (fmt == OutputFormat::kJson) {
            write_alignments_json(out, reports);
        } else {
            write_alignments_tab(out, reports);
        }
        out.flush();
        return static_cast<bool>(out);
    };

    if (output_path.empty() || output_path == "-") {
        return write_text(std::cout);
    }
    std::ofstream out(output_path);
    if (!out.is_open()) {
        std::fprintf(stderr, "Error: cannot open output file %s\n",
                     output_path.c_str());
        return false;
    }
    return write_text(out);
}

} // namespace hhrkit
