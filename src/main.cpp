// main.cpp
#include "amplicut/amplicut_headers.h"

namespace {

    std::string join(const std::vector<std::string> &parts, const std::string &sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += sep;
            out += parts[i];
        }
        return out;
    }

    std::vector<amplicon_entry> infer_from_reads(const amplicut_params &p, const boost::filesystem::path &outbase) {
        ranked_reads reads = p.counts_path.empty()
            ? read_counting::count_frequent_reads(p.fastq_path, p.reads_to_consider, p.verbose)
            : read_counting::import_ranked_counts(p.counts_path, p.verbose);

        std::unique_ptr<GlobalAligner> aligner = inference_tools::make_global_aligner(p.inference);
        std::vector<std::string> seqs = infer_amplicons(reads, *aligner, p.inference, p.max_verbose);
        std::vector<amplicon_entry> amplicons = amplicon_naming::name_amplicons(seqs, p.amplicon_name, "Inferred");

        std::map<std::string, int64_t> counts;
        for (const auto &r : reads.ranked) counts.emplace(r.second, r.first);

        table_writing out(outbase.string() + "_inferred_amplicons.txt", false);
        out.row("Name", "Sequence", "#Reads", "%Reads");
        for (const auto &a : amplicons) {
            int64_t n = counts[a.seq];
            out.row(a.name, a.seq, n, 100.0 * static_cast<double>(n) / static_cast<double>(reads.reads_considered));
        }
        std::cout << "[main] Inferred " << amplicons.size() << " amplicon(s) from "
                  << reads.reads_considered << " reads -> " << out.path << "\n";
        return amplicons;
    }

    std::string intervals_field(const AmpliconWindows &w) {
        std::vector<std::string> parts;
        for (const auto &gi : w.guide_intervals) {
            parts.push_back(std::to_string(gi.start) + "-" + std::to_string(gi.end) + ":" +
                            cut_geometry::to_string(gi.dir));
        }
        return join(parts, ",");
    }

    template<typename T>
    std::string list_field(const std::vector<T> &values) {
        std::vector<std::string> parts;
        for (const auto &v : values) {
            std::ostringstream oss;
            oss << v;
            parts.push_back(oss.str());
        }
        return join(parts, ",");
    }

};

int main(int argc, char* argv[]) {
    try {
        amplicut_params p;
        try {
            p = parse_args(argc, argv);
        } catch (const parse_args_exit &ex) {
            if (ex.exit_code() != 0 && !std::string(ex.what()).empty()) {
                std::cerr << "[ERROR] " << ex.what() << "\n\n";
            }
            usage(argv[0]);
            return ex.exit_code();
        }

        //
        // ─── OUTPUT PATHS ────────────────────────────────────────────────────────────
        //

        boost::filesystem::path outdir = p.output_dir.empty()
            ? boost::filesystem::current_path()
            : boost::filesystem::path(p.output_dir);

        if (!boost::filesystem::exists(outdir)) {
            if (!boost::filesystem::create_directories(outdir)) {
                std::cerr << "[ERROR] Cannot create output directory: "
                          << outdir.string() << "\n";
                return 1;
            }
        }
        boost::filesystem::path outbase = outdir / p.output_prefix;

        if (p.verbose) {
            std::cout << "============= Configuration =============\n"
                      << "  amplicons          : " << (p.auto_infer ? "[auto]" : p.amplicon_seq) << "\n"
                      << "  guides             : " << (p.guide_seq.empty() ? "[none]" : p.guide_seq) << "\n"
                      << "  reads input        : " << (p.fastq_path.empty() ? (p.counts_path.empty() ? "[none]" : p.counts_path) : p.fastq_path) << "\n"
                      << "  aligner            : " << p.inference.aligner << " (gap open " << p.inference.gap_open
                                                     << ", extend " << p.inference.gap_extend << ", matrix "
                                                     << p.inference.aln_matrix << ")\n"
                      << "  aligned reads      : " << (p.alleles_path.empty() ? "[none]" : p.alleles_path) << "\n"
                      << "  window center/size : " << p.windows.quantification_window_center << " / "
                                                     << p.windows.quantification_window_size << "\n"
                      << "  exclude left/right : " << p.windows.exclude_bp_from_left << " / "
                                                     << p.windows.exclude_bp_from_right << "\n"
                      << "  plot window size   : " << p.windows.plot_window_size << "\n"
                      << "  output directory   : " << outdir.string()          << "\n"
                      << "  filename base      : " << p.output_prefix          << "\n"
                      << "  threads            : " << p.nthreads               << "\n"
                      << "  max_threads avail. : " << omp_get_max_threads()    << "\n\n";
        }

        std::cout << "[main] Starting main processing...\n";
        auto main_start = std::chrono::steady_clock::now();

        // Amplicons
        std::vector<amplicon_entry> amplicons;
        if (p.auto_infer) {
            amplicons = infer_from_reads(p, outbase);
            auto infer_elapsed = std::chrono::steady_clock::now() - main_start;
            std::cout << "[main] Amplicon inference time: "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(infer_elapsed).count()
                      << " ms\n";
        } else {
            std::vector<std::string> seqs;
            for (const auto &s : seq_utils::split_list(p.amplicon_seq)) {
                seqs.push_back(seq_utils::validate_sequence(s, "amplicon sequence"));
            }
            amplicons = amplicon_naming::name_amplicons(seqs, p.amplicon_name, "Reference");
        }

        std::vector<std::string> guides;
        for (const auto &g : seq_utils::split_list(p.guide_seq)) {
            guides.push_back(seq_utils::validate_sequence(g, "guide sequence"));
        }

        // Windows
        std::map<std::string, AmpliconWindows> windows;
        {
            table_writing out(outbase.string() + "_windows.tsv", false);
            out.row("Name", "Length", "Guides_Found", "Guide_Intervals", "Cut_Points", "Guide_Plot_Offsets",
                    "Include_Idxs", "Exclude_Idxs", "Plot_Idxs");
            for (size_t i = 0; i < amplicons.size(); ++i) {
                const auto &a = amplicons[i];
                if (p.verbose) std::cout << "[get_amplicon_windows] " << a.name << " (" << a.seq.size() << " bp)\n";
                AmpliconWindows w = get_amplicon_windows(a.seq, guides, p.windows, i, p.max_verbose);
                if (!guides.empty() && w.guide_sequences_found.empty()) {
                    std::cerr << "[warning] None of the guides were found in amplicon " << a.name << "\n";
                }
                out.row(a.name, a.seq.size(), join(w.guide_sequences_found, ","), intervals_field(w),
                        list_field(w.cut_points), list_field(w.guide_plot_offsets),
                        window_tools::format_ranges(w.include_idxs), window_tools::format_ranges(w.exclude_idxs),
                        window_tools::format_ranges(w.plot_idxs));
                windows.emplace(a.name, std::move(w));
            }
            std::cout << "[main] Windows for " << amplicons.size() << " amplicon(s) -> " << out.path << "\n";
        }

        // Alleles around each cut point
        if (!p.alleles_path.empty()) {
            auto alleles_start = std::chrono::steady_clock::now();
            auto routed = amplicon_naming::route_records(allele_tools::import_aligned_records(p.alleles_path, p.verbose),
                                                         amplicons);
            const int offset = cut_geometry::half_window(p.windows.plot_window_size);
            size_t tables = 0;
            for (const auto &a : amplicons) {
                auto rec_it = routed.find(a.name);
                if (rec_it == routed.end()) continue;
                for (int cut : windows.at(a.name).cut_points) {
                    AlleleTable table = get_alleles_around_cut(rec_it->second, cut, offset);
                    table_writing out(outbase.string() + "_" + a.name + "_alleles_around_cut_" +
                                      std::to_string(cut) + ".txt", p.compress);
                    table.write(*out.out);
                    ++tables;
                    if (p.verbose) {
                        std::cout << "[get_alleles_around_cut] " << a.name << " cut " << cut << ": "
                                  << table.size() << " alleles -> " << out.path << "\n";
                    }
                    if (p.max_verbose) {
                        AlleleTable full = get_alleles_around_cut(rec_it->second, cut, offset, true);
                        table_writing full_out(outbase.string() + "_" + a.name + "_alleles_around_cut_" +
                                               std::to_string(cut) + "_full_sequences.txt", p.compress);
                        full.write(*full_out.out);
                        std::cout << "[get_alleles_around_cut] " << a.name << " cut " << cut << ": "
                                  << full.size() << " full-sequence alleles -> " << full_out.path << "\n";
                    }
                }
            }
            auto alleles_elapsed = std::chrono::steady_clock::now() - alleles_start;
            std::cout << "[main] Wrote " << tables << " allele table(s) in "
                      << std::chrono::duration_cast<std::chrono::milliseconds>(alleles_elapsed).count()
                      << " ms\n";
        }

        auto final_elapsed = std::chrono::steady_clock::now() - main_start;
        std::cout << "[main] Completed in "
                  << std::chrono::duration_cast<std::chrono::seconds>(final_elapsed).count()
                  << " s\n";
    }
    catch (const std::exception &ex) {
        std::cerr << "[ERROR] " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
