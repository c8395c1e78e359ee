#pragma once
#include "amplicut_headers.h"

/**
 * @param aligner "nw" (parasail, affine gaps and a substitution matrix) or "edlib" (unit cost)
 * @param gap_open, gap_extend, aln_matrix scoring for the "nw" engine
 */
struct InferenceSettings {
    double min_freq_to_consider = 0.01;
    double amplicon_similarity_cutoff = 0.95;
    int threads = 1;
    std::string aligner = "nw";
    int gap_open = -20;
    int gap_extend = -2;
    std::string aln_matrix = "EDNAFULL";
};

namespace inference_tools {

    inline std::unique_ptr<GlobalAligner> make_global_aligner(const InferenceSettings &settings) {
        if (settings.aligner == "nw") {
            return std::make_unique<ParasailGlobalAligner>(settings.gap_open, settings.gap_extend, settings.aln_matrix);
        }
        if (settings.aligner == "edlib") {
            return std::make_unique<EdlibGlobalAligner>();
        }
        throw configuration_error("Unknown aligner '" + settings.aligner + "' (expected nw or edlib)");
    }

    inline double frequency(int64_t count, int64_t reads_considered) {
        return static_cast<double>(count) / static_cast<double>(reads_considered);
    }

    /**
     * @brief Whether read (or its reverse complement) aligns to any candidate with a score above the cutoff.
     * The candidates are aligned in parallel; exceptions thrown by the aligner are rethrown on the calling thread.
     */
    inline bool matches_any_candidate(const std::string &read, const std::vector<std::string> &candidates,
                                      const GlobalAligner &aligner, double cutoff, int num_threads, bool verbose) {
        const std::string read_rc = seq_utils::revcomp(read);
        std::vector<char> matched(candidates.size(), 0);
        std::exception_ptr failure = nullptr;

        #pragma omp parallel num_threads(num_threads)
        {
            #pragma omp for schedule(dynamic)
            for (size_t i = 0; i < candidates.size(); ++i) {
                try {
                    double fw = aligner.align(read, candidates[i]).score;
                    double rc = aligner.align(read_rc, candidates[i]).score;
                    matched[i] = (fw > cutoff || rc > cutoff) ? 1 : 0;
                    if (verbose) {
                        #pragma omp critical
                        {
                            std::cout << "[infer_amplicons] vs candidate " << i << ": fw " << fw << ", rc " << rc << "\n";
                        }
                    }
                } catch (const std::exception &) {
                    #pragma omp critical
                    {
                        if (!failure) failure = std::current_exception();
                    }
                }
            }
        }
        if (failure) std::rethrow_exception(failure);

        return std::find(matched.begin(), matched.end(), 1) != matched.end();
    }

};

/**
 * @brief Greedy amplicon discovery over reads ranked by abundance.
 *
 * The most frequent read is always the first amplicon. Each following read is added unless it (or its reverse
 * complement) scores above amplicon_similarity_cutoff against an amplicon already chosen. Scanning stops once the
 * previous read's frequency drops to min_freq_to_consider, so the first read at or below the threshold is still
 * examined.
 *
 * @throws inference_degenerate if there are no reads or the top read is not frequent enough to seed
 */
inline std::vector<std::string> infer_amplicons(const ranked_reads &reads, const GlobalAligner &aligner,
                                                const InferenceSettings &settings, bool verbose = false) {
    if (reads.ranked.empty()) {
        throw inference_degenerate("No reads to infer amplicons from");
    }
    if (reads.reads_considered <= 0) {
        throw inference_degenerate("Number of reads considered is " + std::to_string(reads.reads_considered));
    }
    const auto &top = reads.ranked.front();
    const double top_freq = inference_tools::frequency(top.first, reads.reads_considered);
    if (top_freq <= settings.min_freq_to_consider) {
        throw inference_degenerate("Most frequent read (" + std::to_string(top.first) + " of " +
                                   std::to_string(reads.reads_considered) + " reads) is below the minimum frequency " +
                                   std::to_string(settings.min_freq_to_consider));
    }

    std::vector<std::string> amplicons;
    amplicons.push_back(top.second);
    if (verbose) {
        std::cout << "[infer_amplicons] Seed amplicon (" << top.first << " reads): " << top.second << "\n";
    }

    for (size_t i = 1; i < reads.ranked.size(); ++i) {
        if (inference_tools::frequency(reads.ranked[i - 1].first, reads.reads_considered) <= settings.min_freq_to_consider) {
            if (verbose) std::cout << "[infer_amplicons] Stopping at read " << i << "\n";
            break;
        }
        const std::string &read = reads.ranked[i].second;
        if (inference_tools::matches_any_candidate(read, amplicons, aligner, settings.amplicon_similarity_cutoff,
                                                   settings.threads, verbose)) {
            continue;
        }
        amplicons.push_back(read);
        if (verbose) {
            std::cout << "[infer_amplicons] New amplicon (" << reads.ranked[i].first << " reads): " << read << "\n";
        }
    }
    return amplicons;
}
