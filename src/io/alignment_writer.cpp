#include "io/alignment_writer.hpp"

#include <memory>

namespace hhrkit {

bool parse_output_format(const std::string& str, OutputFormat& out,
                         std::string& error_msg) {
    if (str == "tab") {
        out = OutputFormat::kTab;
    } else if (str == "json") {
        out = OutputFormat::kJson;
    } else if (str == "sam") {
        out = OutputFormat::kSam;
    } else if (str == "bam") {
        out = OutputFormat::kBam;
    } else {
        error_msg = "unknown output format '" + str + "' (expected tab, json, sam or bam)";
        return false;
    }
    return true;
}

static void write_score(std::ostream& out, const PairwiseAlignment& aln,
                        const char* key) {
    auto it = aln.annotations.find(key);
    if (it == aln.annotations.end()) {
        out << "NA";
    } else {
        out << it->second;
    }
}

void write_alignment_row(std::ostream& out, const PairwiseAlignment& aln) {
    ColumnCounts counts = count_columns(aln);
    out << aln.query.id << '\t'
        << aln.target.id << '\t';
    write_score(out, aln, "Probab");
    out << '\t';
    write_score(out, aln, "E-value");
    out << '\t';
    write_score(out, aln, "P-value");
    out << '\t';
    write_score(out, aln, "Score");
    out << '\t'
        << aln.query.start + 1 << '\t'
        << aln.query.end() << '\t'
        << aln.query.length << '\t'
        << aln.target.start + 1 << '\t'
        << aln.target.end() << '\t'
        << aln.target.length << '\t'
        << counts.identities << '\t'
        << counts.mismatches << '\t'
        << cigar_string(aln) << '\n';
}

void write_alignments_tab(std::ostream& out, const std::vector<HhrFile>& reports) {
    out << "# query\ttarget\tprob\tevalue\tpvalue\tscore\t"
           "qstart\tqend\tqlen\ttstart\ttend\ttlen\tnident\tmismatch\tcigar\n";
    for (const auto& report : reports) {
        for (const auto& aln : report.alignments) {
            write_alignment_row(out, aln);
        }
    }
}

Json::Value metadata_to_json(const RunMetadata& meta) {
    Json::Value obj(Json::objectValue);
    obj["query"] = meta.query_name;
    if (meta.match_columns) obj["match_columns"] = *meta.match_columns;
    if (meta.no_of_seqs) {
        Json::Value pair(Json::arrayValue);
        pair.append(meta.no_of_seqs->first);
        pair.append(meta.no_of_seqs->second);
        obj["no_of_seqs"] = pair;
    }
    if (meta.neff) obj["neff"] = *meta.neff;
    if (meta.template_neff) obj["template_neff"] = *meta.template_neff;
    if (meta.searched_hmms) obj["searched_hmms"] = *meta.searched_hmms;
    if (meta.rundate) obj["rundate"] = *meta.rundate;
    if (meta.command_line) obj["command_line"] = *meta.command_line;
    return obj;
}

static Json::Value sequence_to_json(const LabeledSequence& seq) {
    Json::Value obj(Json::objectValue);
    obj["id"] = seq.id;
    obj["length"] = static_cast<Json::UInt>(seq.length);
    obj["start"] = static_cast<Json::UInt>(seq.start);
    obj["residues"] = seq.residues;

    Json::Value letters(Json::objectValue);
    for (const auto& kv : seq.letter_annotations) {
        letters[kv.first] = kv.second;
    }
    obj["letter_annotations"] = letters;

    if (!seq.annotations.empty()) {
        Json::Value ann(Json::objectValue);
        for (const auto& kv : seq.annotations) {
            ann[kv.first] = kv.second;
        }
        obj["annotations"] = ann;
    }
    return obj;
}

Json::Value alignment_to_json(const PairwiseAlignment& aln) {
    Json::Value obj(Json::objectValue);
    obj["target"] = sequence_to_json(aln.target);
    obj["query"] = sequence_to_json(aln.query);

    Json::Value coords(Json::arrayValue);
    for (const auto& bp : aln.coordinates) {
        Json::Value point(Json::arrayValue);
        point.append(static_cast<Json::UInt>(bp.target));
        point.append(static_cast<Json::UInt>(bp.query));
        coords.append(point);
    }
    obj["coordinates"] = coords;

    Json::Value ann(Json::objectValue);
    for (const auto& kv : aln.annotations) {
        ann[kv.first] = kv.second;
    }
    obj["annotations"] = ann;

    Json::Value cols(Json::objectValue);
    for (const auto& kv : aln.column_annotations) {
        cols[kv.first] = kv.second;
    }
    obj["column_annotations"] = cols;

    obj["cigar"] = cigar_string(aln);
    return obj;
}

void write_alignments_json(std::ostream& out, const std::vector<HhrFile>& reports) {
    Json::Value root(Json::objectValue);
    Json::Value reports_arr(Json::arrayValue);
    for (const auto& report : reports) {
        Json::Value robj(Json::objectValue);
        robj["metadata"] = metadata_to_json(report.metadata);
        robj["hit_count"] = static_cast<Json::UInt64>(report.summary_rows.size());
        Json::Value alns(Json::arrayValue);
        for (const auto& aln : report.alignments) {
            alns.append(alignment_to_json(aln));
        }
        robj["alignments"] = alns;
        reports_arr.append(robj);
    }
    root["reports"] = reports_arr;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(root, &out);
    out << '\n';
}

} // namespace hhrkit
