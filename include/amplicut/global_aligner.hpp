#pragma once
#include "amplicut_headers.h"

/**
 * @brief Full-length pairwise alignment of query against target.
 * @param aligned_query query with '-' where the target has bases the query lacks
 * @param aligned_target target with '-' where the query has extra bases
 * @param score matching columns / alignment columns, in [0,1]
 */
struct global_alignment {
    std::string aligned_query;
    std::string aligned_target;
    double score = 0.0;
};

/**
 * @brief Global alignment engine used to compare candidate amplicons. Implementations must be safe to call
 * concurrently from several threads on the same instance.
 */
class GlobalAligner {
public:
    virtual ~GlobalAligner() = default;
    virtual global_alignment align(const std::string &query, const std::string &target) const = 0;
};

namespace aligner_tools {

    inline global_alignment gapped_against_empty(const std::string &query, const std::string &target) {
        global_alignment out;
        out.aligned_query = query + std::string(target.size(), '-');
        out.aligned_target = std::string(query.size(), '-') + target;
        return out;
    }

};

/**
 * @brief Needleman-Wunsch alignment through edlib. Edlib scores by edit distance (unit cost per mismatch and per
 * gap base); the only scoring knob is the equality table, which lets an ambiguous N pair with any base.
 */
class EdlibGlobalAligner : public GlobalAligner {
public:
    explicit EdlibGlobalAligner(bool n_matches_any = true) : n_matches_any(n_matches_any) {}

    global_alignment align(const std::string &query, const std::string &target) const override {
        if (query.empty() || target.empty()) {
            return aligner_tools::gapped_against_empty(query, target);
        }
        global_alignment out;

        static const EdlibEqualityPair n_equalities[] = {
            {'N', 'A'}, {'N', 'C'}, {'N', 'G'}, {'N', 'T'}
        };
        EdlibAlignConfig config = edlibNewAlignConfig(-1, EDLIB_MODE_NW, EDLIB_TASK_PATH,
                                                      n_matches_any ? n_equalities : nullptr,
                                                      n_matches_any ? 4 : 0);
        EdlibAlignResult result = edlibAlign(query.c_str(), static_cast<int>(query.size()),
                                             target.c_str(), static_cast<int>(target.size()),
                                             config);
        if (result.status != EDLIB_STATUS_OK || result.alignment == nullptr) {
            edlibFreeAlignResult(result);
            throw std::runtime_error("edlib failed to align " + query + " against " + target);
        }

        int q = 0, t = 0, matches = 0;
        out.aligned_query.reserve(result.alignmentLength);
        out.aligned_target.reserve(result.alignmentLength);
        for (int i = 0; i < result.alignmentLength; ++i) {
            switch (result.alignment[i]) {
                case EDLIB_EDOP_MATCH:
                    ++matches;
                    out.aligned_query.push_back(query[q++]);
                    out.aligned_target.push_back(target[t++]);
                    break;
                case EDLIB_EDOP_MISMATCH:
                    out.aligned_query.push_back(query[q++]);
                    out.aligned_target.push_back(target[t++]);
                    break;
                case EDLIB_EDOP_INSERT:     // base present in query only
                    out.aligned_query.push_back(query[q++]);
                    out.aligned_target.push_back('-');
                    break;
                case EDLIB_EDOP_DELETE:     // base present in target only
                    out.aligned_query.push_back('-');
                    out.aligned_target.push_back(target[t++]);
                    break;
            }
        }
        out.score = result.alignmentLength > 0 ? static_cast<double>(matches) / result.alignmentLength : 0.0;
        edlibFreeAlignResult(result);
        return out;
    }

private:
    bool n_matches_any;
};

/**
 * @brief Affine-gap Needleman-Wunsch through parasail with a substitution matrix.
 * @param gap_open score of opening a gap (<= 0), charged on the first base of every gap
 * @param gap_extend score of each further gap base (<= 0)
 * @param matrix "EDNAFULL" (default), another parasail built-in matrix name, or a matrix file
 */
class ParasailGlobalAligner : public GlobalAligner {
public:
    explicit ParasailGlobalAligner(int gap_open = -20, int gap_extend = -2, const std::string &matrix = "EDNAFULL")
        : open(-gap_open), extend(-gap_extend), owned(nullptr, parasail_matrix_free) {
        if (gap_open > 0 || gap_extend > 0) {
            throw configuration_error("Gap penalties must be zero or negative, got open " + std::to_string(gap_open) +
                                      " and extend " + std::to_string(gap_extend));
        }
        std::string name = seq_utils::trim(matrix);
        std::string key = name;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (key == "ednafull") key = "nuc44";

        scoring = parasail_matrix_lookup(key.c_str());
        if (scoring == nullptr) {
            if (!boost::filesystem::is_regular_file(name)) {
                throw configuration_error("Unknown substitution matrix '" + name +
                                          "' (not a built-in matrix and no such file)");
            }
            owned.reset(parasail_matrix_from_file(name.c_str()));
            if (!owned) {
                throw configuration_error("Cannot read substitution matrix file: " + name);
            }
            scoring = owned.get();
        }
    }

    global_alignment align(const std::string &query, const std::string &target) const override {
        if (query.empty() || target.empty()) {
            return aligner_tools::gapped_against_empty(query, target);
        }
        const int qlen = static_cast<int>(query.size());
        const int tlen = static_cast<int>(target.size());
        parasail_result_t* result = parasail_nw_trace_scan_32(query.c_str(), qlen, target.c_str(), tlen,
                                                              open, extend, scoring);
        if (result == nullptr) {
            throw std::runtime_error("parasail failed to align " + query + " against " + target);
        }
        parasail_traceback_t* tb = parasail_result_get_traceback(result, query.c_str(), qlen, target.c_str(), tlen,
                                                                 scoring, '|', ':', '.');
        if (tb == nullptr) {
            parasail_result_free(result);
            throw std::runtime_error("parasail returned no traceback for " + query + " against " + target);
        }

        global_alignment out;
        out.aligned_query = tb->query;
        out.aligned_target = tb->ref;
        const std::string comp = tb->comp;
        parasail_traceback_free(tb);
        parasail_result_free(result);

        if (!comp.empty()) {
            out.score = static_cast<double>(std::count(comp.begin(), comp.end(), '|')) / comp.size();
        }
        return out;
    }

private:
    int open;
    int extend;
    const parasail_matrix_t* scoring = nullptr;
    std::unique_ptr<parasail_matrix_t, void (*)(parasail_matrix_t*)> owned;
};
