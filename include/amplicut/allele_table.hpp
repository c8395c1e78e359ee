#pragma once
#include "amplicut_headers.h"

enum class read_status {
    UNMODIFIED,
    MODIFIED
};

// ref_positions value for a read base that has no reference coordinate (insertion)
constexpr int INSERTED_POSITION = -1;

/**
 * @brief One read's alignment against its amplicon, as handed over by the aligner stage.
 * @param aligned_sequence read with gaps ('-') where the reference has bases the read lacks
 * @param reference_sequence reference with gaps where the read has inserted bases; same length as aligned_sequence
 * @param ref_positions for each aligned column, the reference coordinate, or INSERTED_POSITION
 */
struct AlignedReadRecord {
    std::string reference_name;
    std::string aligned_sequence;
    std::string reference_sequence;
    std::vector<int> ref_positions;
    read_status status = read_status::MODIFIED;
    int n_deleted = 0;
    int n_inserted = 0;
    int n_mutated = 0;
    int64_t read_count = 0;
    double read_pct = 0.0;
};

/**
 * @brief The slice of an aligned read around one cut point. Rows are unique on everything except the read totals.
 * aligned_sequence / reference_sequence carry the full alignment and are only kept by the full-sequence table.
 */
struct AlleleWindowRow {
    std::string aligned_window;
    std::string reference_window;
    bool is_unedited;
    int n_deleted;
    int n_inserted;
    int n_mutated;
    int64_t read_count;
    double read_pct;
    std::string aligned_sequence;
    std::string reference_sequence;
};

// Multi-index container tags
struct allele_key_tag {};       // Tag for grouping identical windowed alleles
struct allele_pct_tag {};       // Tag for report order (descending %reads)

typedef boost::multi_index::composite_key<
    AlleleWindowRow,
    boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::aligned_window>,
    boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::reference_window>,
    boost::multi_index::member<AlleleWindowRow, bool, &AlleleWindowRow::is_unedited>,
    boost::multi_index::member<AlleleWindowRow, int, &AlleleWindowRow::n_deleted>,
    boost::multi_index::member<AlleleWindowRow, int, &AlleleWindowRow::n_inserted>,
    boost::multi_index::member<AlleleWindowRow, int, &AlleleWindowRow::n_mutated>,
    boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::aligned_sequence>,
    boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::reference_sequence>
> allele_key;

/**
 * @brief Multi-index container for windowed alleles. The percent index breaks ties on the allele key, so iteration
 * order is fully determined by the contents.
 */
typedef boost::multi_index::multi_index_container<
    AlleleWindowRow,
    boost::multi_index::indexed_by<
        boost::multi_index::ordered_unique<
            boost::multi_index::tag<allele_key_tag>,
            allele_key
        >,
        boost::multi_index::ordered_non_unique<
            boost::multi_index::tag<allele_pct_tag>,
            boost::multi_index::composite_key<
                AlleleWindowRow,
                boost::multi_index::member<AlleleWindowRow, double, &AlleleWindowRow::read_pct>,
                boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::aligned_window>,
                boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::reference_window>,
                boost::multi_index::member<AlleleWindowRow, bool, &AlleleWindowRow::is_unedited>,
                boost::multi_index::member<AlleleWindowRow, int, &AlleleWindowRow::n_deleted>,
                boost::multi_index::member<AlleleWindowRow, int, &AlleleWindowRow::n_inserted>,
                boost::multi_index::member<AlleleWindowRow, int, &AlleleWindowRow::n_mutated>,
                boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::aligned_sequence>,
                boost::multi_index::member<AlleleWindowRow, std::string, &AlleleWindowRow::reference_sequence>
            >,
            boost::multi_index::composite_key_compare<
                std::greater<double>,
                std::less<std::string>,
                std::less<std::string>,
                std::less<bool>,
                std::less<int>,
                std::less<int>,
                std::less<int>,
                std::less<std::string>,
                std::less<std::string>
            >
        >
    >
> Allele_Struct;

namespace allele_tools {

    // coordinate of every aligned column: reference bases count up from 0, gap columns get INSERTED_POSITION
    inline std::vector<int> ref_positions_from_alignment(const std::string &reference_sequence) {
        std::vector<int> positions;
        positions.reserve(reference_sequence.size());
        int idx = 0;
        for (char c : reference_sequence) {
            if (c == '-') {
                positions.push_back(INSERTED_POSITION);
            } else {
                positions.push_back(idx++);
            }
        }
        return positions;
    }

    inline read_status parse_status(const std::string &field) {
        std::string s = seq_utils::to_upper(seq_utils::trim(field));
        if (s == "UNMODIFIED") return read_status::UNMODIFIED;
        if (s == "MODIFIED") return read_status::MODIFIED;
        throw std::runtime_error("Unknown Read_Status '" + field + "' (expected UNMODIFIED or MODIFIED)");
    }

    inline std::vector<int> parse_positions(const std::string &field) {
        std::vector<int> positions;
        for (const auto &tok : seq_utils::split_list(field)) {
            positions.push_back(config_utils::parse_int(tok, "ref_positions"));
        }
        return positions;
    }

    /**
     * @brief Windowed view of one record around a cut point.
     * @throws precondition_violation if the cut point is negative or the record's alignment never reaches it
     */
    inline AlleleWindowRow row_around_cut(const AlignedReadRecord &rec, int cut_point, int offset) {
        // negative values in ref_positions mark inserted bases, never a reference coordinate
        if (cut_point < 0) {
            throw precondition_violation("Cut point " + std::to_string(cut_point) + " lies before the reference start");
        }
        if (rec.ref_positions.size() != rec.aligned_sequence.size() ||
            rec.reference_sequence.size() != rec.aligned_sequence.size()) {
            throw precondition_violation("Aligned record has mismatched lengths: aligned " +
                                         std::to_string(rec.aligned_sequence.size()) + ", reference " +
                                         std::to_string(rec.reference_sequence.size()) + ", ref_positions " +
                                         std::to_string(rec.ref_positions.size()));
        }
        auto hit = std::find(rec.ref_positions.begin(), rec.ref_positions.end(), cut_point);
        if (hit == rec.ref_positions.end()) {
            throw precondition_violation("Cut point " + std::to_string(cut_point) +
                                         " is not covered by the alignment of read " + rec.aligned_sequence);
        }
        const int cut_idx = static_cast<int>(hit - rec.ref_positions.begin());
        const int len = static_cast<int>(rec.aligned_sequence.size());
        const int st = std::clamp(cut_idx - offset + 1, 0, len);
        const int en = std::clamp(cut_idx + offset + 1, st, len);

        return AlleleWindowRow{
            rec.aligned_sequence.substr(st, en - st),
            rec.reference_sequence.substr(st, en - st),
            rec.status == read_status::UNMODIFIED,
            rec.n_deleted,
            rec.n_inserted,
            rec.n_mutated,
            rec.read_count,
            rec.read_pct,
            rec.aligned_sequence,
            rec.reference_sequence
        };
    }

    /**
     * @brief Reads the allele table written by the aligner stage (tab separated, header row).
     * Required columns: Aligned_Sequence, Reference_Sequence, Read_Status, n_deleted, n_inserted, n_mutated, #Reads, %Reads.
     * Optional: Reference_Name, ref_positions (comma separated; derived from Reference_Sequence when missing).
     */
    inline std::vector<AlignedReadRecord> import_aligned_records(const std::string &path, bool verbose) {
        using namespace csv;
        CSVFormat fmt;
        fmt.delimiter('\t').quote('"').header_row(0)
            .variable_columns(VariableColumnPolicy::THROW);
        CSVReader reader(path, fmt);

        const auto cols = reader.get_col_names();
        auto has_col = [&](const std::string &name) {
            return std::find(cols.begin(), cols.end(), name) != cols.end();
        };
        for (const char *required : {"Aligned_Sequence", "Reference_Sequence", "Read_Status",
                                     "n_deleted", "n_inserted", "n_mutated", "#Reads", "%Reads"}) {
            if (!has_col(required))
                throw std::runtime_error(std::string("Missing column '") + required + "' in " + path);
        }
        const bool with_names = has_col("Reference_Name");
        const bool with_positions = has_col("ref_positions");

        std::vector<AlignedReadRecord> records;
        for (auto &row : reader) {
            AlignedReadRecord rec;
            if (with_names) rec.reference_name = row["Reference_Name"].get<std::string>();
            rec.aligned_sequence = seq_utils::to_upper(row["Aligned_Sequence"].get<std::string>());
            rec.reference_sequence = seq_utils::to_upper(row["Reference_Sequence"].get<std::string>());
            rec.status = parse_status(row["Read_Status"].get<std::string>());
            rec.n_deleted = config_utils::parse_int(row["n_deleted"].get<std::string>(), "n_deleted");
            rec.n_inserted = config_utils::parse_int(row["n_inserted"].get<std::string>(), "n_inserted");
            rec.n_mutated = config_utils::parse_int(row["n_mutated"].get<std::string>(), "n_mutated");
            rec.read_count = config_utils::parse_int64(row["#Reads"].get<std::string>(), "#Reads");
            rec.read_pct = config_utils::parse_double(row["%Reads"].get<std::string>(), "%Reads");
            if (with_positions && !row["ref_positions"].is_null()) {
                rec.ref_positions = parse_positions(row["ref_positions"].get<std::string>());
            } else {
                rec.ref_positions = ref_positions_from_alignment(rec.reference_sequence);
            }
            records.push_back(std::move(rec));
        }
        if (verbose) {
            std::cout << "[import_aligned_records] " << records.size() << " records from " << path << "\n";
        }
        return records;
    }

};

/**
 * @brief Alleles around a single cut point, collapsed on (window, reference window, unedited, indel/mutation counts).
 * With full_sequences set, rows also stay apart when their full alignments differ outside the window.
 */
class AlleleTable {
    Allele_Struct alleles;
    bool full_sequences = false;

public:
    explicit AlleleTable(bool full_sequences = false) : full_sequences(full_sequences) {}

    bool keeps_full_sequences() const { return full_sequences; }

    auto& by_key() { return alleles.get<allele_key_tag>(); }
    auto& by_read_pct() { return alleles.get<allele_pct_tag>(); }
    const auto& by_key() const { return alleles.get<allele_key_tag>(); }
    const auto& by_read_pct() const { return alleles.get<allele_pct_tag>(); }

    size_t size() const { return alleles.size(); }
    bool empty() const { return alleles.empty(); }

    // merges a row into its group; the group reports unedited if any contributing row was
    void add_row(AlleleWindowRow row) {
        if (!full_sequences) {
            row.aligned_sequence.clear();
            row.reference_sequence.clear();
        }
        auto &idx = by_key();
        auto it = idx.find(boost::make_tuple(row.aligned_window, row.reference_window, row.is_unedited,
                                             row.n_deleted, row.n_inserted, row.n_mutated,
                                             row.aligned_sequence, row.reference_sequence));
        if (it == idx.end()) {
            idx.insert(row);
            return;
        }
        idx.modify(it, [&row](AlleleWindowRow &group) {
            group.read_count += row.read_count;
            group.read_pct += row.read_pct;
            group.is_unedited = group.is_unedited || row.is_unedited;
        });
    }

    // descending %reads; equal percentages fall back to the allele key
    std::vector<AlleleWindowRow> rows() const {
        return std::vector<AlleleWindowRow>(by_read_pct().begin(), by_read_pct().end());
    }

    void write(std::ostream &out) const {
        out << "Aligned_Sequence\tReference_Sequence\tUnedited\tn_deleted\tn_inserted\tn_mutated\t#Reads\t%Reads";
        if (full_sequences) out << "\tFull_Aligned_Sequence\tFull_Reference_Sequence";
        out << '\n';
        for (const auto &r : by_read_pct()) {
            out << r.aligned_window << '\t' << r.reference_window << '\t'
                << (r.is_unedited ? "True" : "False") << '\t'
                << r.n_deleted << '\t' << r.n_inserted << '\t' << r.n_mutated << '\t'
                << r.read_count << '\t' << std::setprecision(10) << r.read_pct;
            if (full_sequences) out << '\t' << r.aligned_sequence << '\t' << r.reference_sequence;
            out << '\n';
        }
    }
};

/**
 * @brief Builds the alleles-around-cut table for one cut point.
 * @param records every aligned read of the amplicon; each must cover cut_point
 * @param offset half window, the slice is [cut_idx - offset + 1, cut_idx + offset + 1)
 * @param full_sequences also group on the full aligned and reference sequences (debug output)
 */
inline AlleleTable get_alleles_around_cut(const std::vector<AlignedReadRecord> &records, int cut_point, int offset,
                                          bool full_sequences = false) {
    AlleleTable table(full_sequences);
    for (const auto &rec : records) {
        table.add_row(allele_tools::row_around_cut(rec, cut_point, offset));
    }
    return table;
}
