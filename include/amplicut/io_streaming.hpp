#pragma once
#include "amplicut_headers.h"

// Initialize kseq for gzipped file reading
KSEQ_INIT(gzFile, gzread)

class read_streaming {
public:
    struct sequence {
        std::string id;
        std::string seq;
        std::string qual;
        bool is_fastq;
    };

    explicit read_streaming(const std::string& file_path) : path(file_path) {
        if (!is_fastqa(path)) {
            throw std::invalid_argument("Not a FASTQ/FASTA file: " + path);
        }
        fp = gzopen(path.c_str(), "r");
        if (!fp) {
            throw std::runtime_error("Failed to open sequence file: " + path);
        }
        ks = kseq_init(fp);
    }

    ~read_streaming() {
        if (ks) kseq_destroy(ks);
        if (fp) gzclose(fp);
    }

    read_streaming(const read_streaming&) = delete;
    read_streaming& operator=(const read_streaming&) = delete;

    std::optional<sequence> next_sequence() {
        int l = kseq_read(ks);
        if (l == -2) {
            throw std::runtime_error("Truncated quality string in " + path);
        }
        if (l < 0) return std::nullopt;
        sequence rec;
        rec.id = ks->name.s;
        rec.seq = ks->seq.s;
        rec.is_fastq = ks->qual.l > 0;
        if (rec.is_fastq) rec.qual = ks->qual.s;
        return rec;
    }

    static bool has_suffix(const std::string& str, const std::string& suffix) {
        return str.size() >= suffix.size() &&
               str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    static bool is_fastqa(const std::string& path) {
        static const std::vector<std::string> extensions = {
            ".fastq", ".fq", ".fasta", ".fa",
            ".fastq.gz", ".fq.gz", ".fasta.gz", ".fa.gz"
        };
        for (const auto& ext : extensions) {
            if (has_suffix(path, ext)) return true;
        }
        return false;
    }

private:
    std::string path;
    gzFile fp = nullptr;
    kseq_t* ks = nullptr;
};

// (count, sequence) pairs, most frequent first, plus how many reads the counts were drawn from
struct ranked_reads {
    std::vector<std::pair<int64_t, std::string>> ranked;
    int64_t reads_considered = 0;
};

namespace read_counting {

    // ties broken on descending sequence so the order matches `sort | uniq -c | sort -nr`
    inline void rank(ranked_reads &out) {
        std::sort(out.ranked.begin(), out.ranked.end(),
                  [](const std::pair<int64_t, std::string> &a, const std::pair<int64_t, std::string> &b) {
                      if (a.first != b.first) return a.first > b.first;
                      return a.second > b.second;
                  });
    }

    // counts identical sequences among the first max_reads records of a FASTQ/FASTA file
    inline ranked_reads count_frequent_reads(const std::string &path, int64_t max_reads, bool verbose) {
        std::unordered_map<std::string, int64_t, boost::hash<std::string>> counts;
        ranked_reads out;
        read_streaming reader(path);
        while (max_reads < 0 || out.reads_considered < max_reads) {
            auto rec = reader.next_sequence();
            if (!rec) break;
            ++counts[seq_utils::to_upper(rec->seq)];
            ++out.reads_considered;
        }
        out.ranked.reserve(counts.size());
        for (auto &kv : counts) {
            out.ranked.emplace_back(kv.second, kv.first);
        }
        rank(out);
        if (verbose) {
            std::cout << "[count_frequent_reads] " << out.reads_considered << " reads, "
                      << out.ranked.size() << " distinct sequences from " << path << "\n";
        }
        return out;
    }

    // "count sequence" lines (uniq -c output), plain or .gz
    inline ranked_reads import_ranked_counts(const std::string &path, bool verbose) {
        ranked_reads out;
        auto lines = streaming_utils::import_text(path);
        size_t line_no = 0;
        for (auto &ln : lines) {
            ++line_no;
            std::string trimmed = seq_utils::trim(ln);
            if (trimmed.empty()) continue;
            std::istringstream fields(trimmed);
            int64_t count = 0;
            std::string seq;
            if (!(fields >> count >> seq) || count < 0) {
                throw std::runtime_error("Cannot parse line " + std::to_string(line_no) + " of " + path +
                                         ": '" + trimmed + "' (expected 'count sequence')");
            }
            out.ranked.emplace_back(count, seq_utils::validate_sequence(seq, "read at line " + std::to_string(line_no)));
            out.reads_considered += count;
        }
        rank(out);
        if (verbose) {
            std::cout << "[import_ranked_counts] " << out.ranked.size() << " sequences ("
                      << out.reads_considered << " reads) from " << path << "\n";
        }
        return out;
    }

};

class table_writing {
    public:
        std::unique_ptr<std::ostream> out;
        std::string path;

        // @param output_path   target filename; ".gz" is appended when compressing
        // @param compress      if true, writes through ogzstream
        table_writing(std::string output_path, bool compress) {
            if (compress) {
                if (output_path.size() < 3 || output_path.substr(output_path.size() - 3) != ".gz")
                    output_path += ".gz";
                auto gz = std::make_unique<ogzstream>(output_path.c_str());
                if (!gz->good())
                    throw std::runtime_error("Failed to open gz output: " + output_path);
                out = std::move(gz);
            } else {
                auto f = std::make_unique<std::ofstream>(output_path, std::ios::out | std::ios::trunc);
                if (!f->is_open())
                    throw std::runtime_error("Failed to open file: " + output_path);
                out = std::move(f);
            }
            path = output_path;
        }

        // one tab-separated row per call
        template<typename... fields>
        void row(const fields&... values) {
            bool first = true;
            ((*out << (first ? "" : "\t") << values, first = false), ...);
            *out << '\n';
        }

        ~table_writing() {
            if (out) {
                out->flush();
            }
        }
};
