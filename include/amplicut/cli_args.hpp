#pragma once
#include "amplicut_headers.h"

struct amplicut_params {
    std::string amplicon_seq, amplicon_name, guide_seq;
    std::string fastq_path, counts_path, alleles_path;
    std::string output_prefix = "output", output_dir;
    bool auto_infer = false, compress = false;
    bool verbose = false, max_verbose = false;
    int64_t reads_to_consider = 10000;
    int nthreads = 1;
    WindowSettings windows;
    InferenceSettings inference;
};

// thrown by parse_args when the program should stop: exit code 0 after --help, 1 on a usage error
class parse_args_exit : public std::runtime_error {
public:
    explicit parse_args_exit(int code, const std::string &msg = "") : std::runtime_error(msg), code(code) {}
    int exit_code() const { return code; }

private:
    int code;
};

inline void usage(const char* prog) {
    std::cerr
      << "Usage: " << prog
      << " (-a AMPLICONS | -A -q FASTQ | -A -u COUNTS) [-g GUIDES] [-r ALLELES] [-o PREFIX] [-d DIR] [-t THREADS] [-v] [-D] [-h]\n"
      << "  -a, --amplicon_seq                       comma-separated amplicon sequences\n"
      << "  -n, --amplicon_name                      comma-separated amplicon names (default: Reference, Reference_2, ...)\n"
      << "  -g, --guide_seq                          comma-separated guide sequences, without PAM\n"
      << "  -A, --auto                               infer amplicons from the most frequent reads\n"
      << "  -q, --fastq                              reads for --auto (FASTQ/FASTA, optionally gzipped)\n"
      << "  -u, --counts                             ranked 'count sequence' file for --auto\n"
      << "  -k, --reads_to_consider                  reads to count for --auto (default: 10000)\n"
      << "  -f, --min_freq_to_consider               minimum read frequency for an inferred amplicon (default: 0.01)\n"
      << "  -s, --amplicon_similarity_cutoff         reads scoring above this against a known amplicon are merged into it (default: 0.95)\n"
      << "  -l, --aligner                            engine for --auto: nw (affine gaps, matrix) or edlib (unit cost) (default: nw)\n"
      << "  -O, --needleman_wunsch_gap_open          gap open score for nw (default: -20)\n"
      << "  -E, --needleman_wunsch_gap_extend        gap extend score for nw (default: -2)\n"
      << "  -M, --needleman_wunsch_aln_matrix_loc    substitution matrix for nw: EDNAFULL or a matrix file (default: EDNAFULL)\n"
      << "  -r, --alleles                            aligned read table (TSV) to summarize around each cut point\n"
      << "  -w, --quantification_window_size         bp around each cut point to quantify (default: 1, 0 = whole amplicon)\n"
      << "  -c, --quantification_window_center       cut position relative to the 3' end of the guide (default: -3)\n"
      << "  -N, --nuclease                           preset window center: cas9, cpf1, base_editor\n"
      << "  -W, --quantification_window_coordinates  explicit windows, e.g. 5-10,5-10_20-30 (one entry per amplicon)\n"
      << "  -L, --exclude_bp_from_left               bp ignored at the left end of each amplicon (default: 15)\n"
      << "  -R, --exclude_bp_from_right              bp ignored at the right end of each amplicon (default: 15)\n"
      << "  -p, --plot_window_size                   bp shown around each cut point (default: 40)\n"
      << "  -o, --output                             filename prefix (default: output)\n"
      << "  -d, --dir                                output directory (default: current directory)\n"
      << "  -z, --compress                           gzip the allele tables\n"
      << "  -t, --threads                            number of threads (default: 1)\n"
      << "  -v, --verbose                            verbose mode\n"
      << "  -D, --max_verbose                        max verbose level (debug only), also writes full-sequence allele tables\n"
      << "  -h, --help                               prints this menu\n";
}

/**
 * @brief Parses the command line into amplicut_params.
 * @throws parse_args_exit for --help and for usage errors (unknown option, missing input mode)
 * @throws configuration_error for values that do not parse or conflict
 */
inline amplicut_params parse_args(int argc, char* argv[]) {
    amplicut_params p;

    const char* optstring = "a:n:g:q:u:Ar:w:c:N:W:L:R:p:k:f:s:l:O:E:M:o:d:zt:vDh";
    static const struct option longopts[] = {
        {"amplicon_seq",                      required_argument, nullptr, 'a'},
        {"amplicon_name",                     required_argument, nullptr, 'n'},
        {"guide_seq",                         required_argument, nullptr, 'g'},
        {"fastq",                             required_argument, nullptr, 'q'},
        {"counts",                            required_argument, nullptr, 'u'},
        {"auto",                              no_argument,       nullptr, 'A'},
        {"alleles",                           required_argument, nullptr, 'r'},
        {"quantification_window_size",        required_argument, nullptr, 'w'},
        {"quantification_window_center",      required_argument, nullptr, 'c'},
        {"nuclease",                          required_argument, nullptr, 'N'},
        {"quantification_window_coordinates", required_argument, nullptr, 'W'},
        {"exclude_bp_from_left",              required_argument, nullptr, 'L'},
        {"exclude_bp_from_right",             required_argument, nullptr, 'R'},
        {"plot_window_size",                  required_argument, nullptr, 'p'},
        {"reads_to_consider",                 required_argument, nullptr, 'k'},
        {"min_freq_to_consider",              required_argument, nullptr, 'f'},
        {"amplicon_similarity_cutoff",        required_argument, nullptr, 's'},
        {"aligner",                           required_argument, nullptr, 'l'},
        {"needleman_wunsch_gap_open",         required_argument, nullptr, 'O'},
        {"needleman_wunsch_gap_extend",       required_argument, nullptr, 'E'},
        {"needleman_wunsch_aln_matrix_loc",   required_argument, nullptr, 'M'},
        {"output",                            required_argument, nullptr, 'o'},
        {"dir",                               required_argument, nullptr, 'd'},
        {"compress",                          no_argument,       nullptr, 'z'},
        {"threads",                           required_argument, nullptr, 't'},
        {"verbose",                           no_argument,       nullptr, 'v'},
        {"max_verbose",                       no_argument,       nullptr, 'D'},
        {"help",                              no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    optind = 0;     // full getopt reset, so parse_args can run more than once per process
    int c;
    std::optional<std::string> nuclease;
    bool center_given = false;
    while ((c = getopt_long(argc, argv, optstring, longopts, nullptr)) != -1) {
        switch (c) {
          case 'a': p.amplicon_seq  = optarg;                                                         break;
          case 'n': p.amplicon_name = optarg;                                                         break;
          case 'g': p.guide_seq     = optarg;                                                         break;
          case 'q': p.fastq_path    = optarg;                                                         break;
          case 'u': p.counts_path   = optarg;                                                         break;
          case 'A': p.auto_infer    = true;                                                           break;
          case 'r': p.alleles_path  = optarg;                                                         break;
          case 'w': p.windows.quantification_window_size = config_utils::parse_int(optarg, "--quantification_window_size"); break;
          case 'c': p.windows.quantification_window_center = config_utils::parse_int(optarg, "--quantification_window_center");
                    center_given = true;                                                              break;
          case 'N': nuclease = std::string(optarg);                                                   break;
          case 'W': p.windows.quantification_window_coordinates = std::string(optarg);                break;
          case 'L': p.windows.exclude_bp_from_left  = config_utils::parse_int(optarg, "--exclude_bp_from_left");  break;
          case 'R': p.windows.exclude_bp_from_right = config_utils::parse_int(optarg, "--exclude_bp_from_right"); break;
          case 'p': p.windows.plot_window_size = config_utils::parse_int(optarg, "--plot_window_size");           break;
          case 'k': p.reads_to_consider = config_utils::parse_int64(optarg, "--reads_to_consider");               break;
          case 'f': p.inference.min_freq_to_consider = config_utils::parse_double(optarg, "--min_freq_to_consider"); break;
          case 's': p.inference.amplicon_similarity_cutoff = config_utils::parse_double(optarg, "--amplicon_similarity_cutoff"); break;
          case 'l': p.inference.aligner = seq_utils::trim(optarg);                                    break;
          case 'O': p.inference.gap_open = config_utils::parse_int(optarg, "--needleman_wunsch_gap_open");        break;
          case 'E': p.inference.gap_extend = config_utils::parse_int(optarg, "--needleman_wunsch_gap_extend");    break;
          case 'M': p.inference.aln_matrix = optarg;                                                  break;
          case 'o': p.output_prefix = optarg;                                                         break;
          case 'd': p.output_dir    = optarg;                                                         break;
          case 'z': p.compress      = true;                                                           break;
          case 't': p.nthreads      = config_utils::parse_int(optarg, "--threads");                   break;
          case 'v': p.verbose       = true;                                                           break;
          case 'D': p.max_verbose   = true;                                                           break;
          case 'h': throw parse_args_exit(0);
          default:  throw parse_args_exit(1);
        }
    }
    if (optind < argc) {
        throw parse_args_exit(1, std::string("unexpected argument '") + argv[optind] + "'");
    }

    if (p.auto_infer == !p.amplicon_seq.empty()) {
        throw parse_args_exit(1, "give either --amplicon_seq or --auto");
    }
    if (p.auto_infer && p.fastq_path.empty() == p.counts_path.empty()) {
        throw parse_args_exit(1, "--auto needs exactly one of --fastq or --counts");
    }
    if (!p.auto_infer && seq_utils::split_list(p.amplicon_seq).empty()) {
        throw configuration_error("No amplicon sequences in --amplicon_seq '" + p.amplicon_seq + "'");
    }
    if (nuclease) {
        if (center_given) {
            throw configuration_error("--nuclease and --quantification_window_center are mutually exclusive");
        }
        p.windows.quantification_window_center = config_utils::get_window_center(*nuclease);
    }
    if (p.nthreads < 1) {
        throw configuration_error("--threads must be at least 1, got " + std::to_string(p.nthreads));
    }
    if (p.inference.aligner != "nw" && p.inference.aligner != "edlib") {
        throw configuration_error("Unknown aligner '" + p.inference.aligner + "' (expected nw or edlib)");
    }
    if (p.inference.gap_open > 0 || p.inference.gap_extend > 0) {
        throw configuration_error("--needleman_wunsch_gap_open and --needleman_wunsch_gap_extend must be zero or negative");
    }
    p.output_prefix = seq_utils::clean_filename(p.output_prefix);
    if (p.output_prefix.empty()) {
        throw configuration_error("--output has no usable filename characters");
    }
    p.inference.threads = p.nthreads;
    if (p.max_verbose) p.verbose = true;
    return p;
}

/**
 * @brief An amplicon as used downstream. name is safe to put in a filename; given_name is what the user typed.
 */
struct amplicon_entry {
    std::string name;
    std::string given_name;
    std::string seq;
};

namespace amplicon_naming {

    inline std::string default_name(const std::string &stem, size_t idx) {
        return idx == 0 ? stem : stem + "_" + std::to_string(idx + 1);
    }

    /**
     * @brief Pairs sequences with names (defaults stem, stem_2, ...). Names are cleaned for use in output paths.
     * @throws configuration_error on an empty list, a name count mismatch, or a name that is empty or duplicated once cleaned
     */
    inline std::vector<amplicon_entry> name_amplicons(const std::vector<std::string> &seqs, const std::string &names_field,
                                                      const std::string &stem) {
        if (seqs.empty()) {
            throw configuration_error("No amplicons to analyze");
        }
        std::vector<std::string> names = seq_utils::split_list(names_field);
        if (!names.empty() && names.size() != seqs.size()) {
            throw configuration_error("Got " + std::to_string(names.size()) + " amplicon names for " +
                                      std::to_string(seqs.size()) + " amplicon sequences");
        }
        std::vector<amplicon_entry> out;
        std::set<std::string> seen;
        for (size_t i = 0; i < seqs.size(); ++i) {
            std::string given = names.empty() ? default_name(stem, i) : names[i];
            std::string name = seq_utils::clean_filename(given);
            if (name.empty()) {
                throw configuration_error("Amplicon name '" + given + "' has no usable filename characters");
            }
            if (!seen.insert(name).second) {
                throw configuration_error("Amplicon name '" + name + "' is used more than once");
            }
            if (name != given) {
                std::cerr << "[warning] Amplicon name '" << given << "' is written as '" << name << "' in output files\n";
            }
            out.push_back({name, given, seqs[i]});
        }
        return out;
    }

    // records with no Reference_Name belong to the first amplicon; unknown names are reported and skipped
    inline std::map<std::string, std::vector<AlignedReadRecord>> route_records(std::vector<AlignedReadRecord> records,
                                                                               const std::vector<amplicon_entry> &amplicons) {
        if (amplicons.empty()) {
            throw precondition_violation("Cannot route aligned records without amplicons");
        }
        std::map<std::string, std::vector<AlignedReadRecord>> routed;
        std::map<std::string, int64_t> unknown;
        for (auto &rec : records) {
            auto match = amplicons.begin();
            if (!rec.reference_name.empty()) {
                match = std::find_if(amplicons.begin(), amplicons.end(), [&rec](const amplicon_entry &a) {
                    return a.given_name == rec.reference_name || a.name == rec.reference_name;
                });
            }
            if (match == amplicons.end()) {
                ++unknown[rec.reference_name];
                continue;
            }
            routed[match->name].push_back(std::move(rec));
        }
        for (const auto &kv : unknown) {
            std::cerr << "[warning] Skipping " << kv.second << " aligned record(s) for unknown amplicon '"
                      << kv.first << "'\n";
        }
        return routed;
    }

};
