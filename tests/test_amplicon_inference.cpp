// Unit tests for greedy amplicon inference and the global aligners

#undef NDEBUG
#include <cassert>
#include "amplicut/amplicut_headers.h"

// Position-by-position identity for equal-length strings; unequal lengths never match.
class HammingAligner : public GlobalAligner {
public:
    global_alignment align(const std::string &query, const std::string &target) const override {
        global_alignment out{query, target, 0.0};
        if (query.size() != target.size() || query.empty()) return out;
        size_t same = 0;
        for (size_t i = 0; i < query.size(); ++i) {
            if (query[i] == target[i]) ++same;
        }
        out.score = static_cast<double>(same) / static_cast<double>(query.size());
        return out;
    }
};

class FailingAligner : public GlobalAligner {
public:
    global_alignment align(const std::string &query, const std::string &) const override {
        throw std::runtime_error("cannot align " + query);
    }
};

static ranked_reads make_reads(std::vector<std::pair<int64_t, std::string>> ranked, int64_t considered) {
    ranked_reads reads;
    reads.ranked = std::move(ranked);
    reads.reads_considered = considered;
    return reads;
}

static const std::string POLY_A(20, 'A');
static const std::string POLY_C(20, 'C');
static const std::string ACGT_REPEAT = "ACGAACGAACGAACGAACGA";

void test_seed_is_top_read() {
    std::cout << "Testing seed amplicon... ";
    HammingAligner aligner;
    auto reads = make_reads({{70, POLY_A}, {30, POLY_C}}, 100);
    auto amplicons = infer_amplicons(reads, aligner, InferenceSettings{});
    assert(!amplicons.empty());
    assert(amplicons[0] == POLY_A);
    assert(amplicons.size() == 2);
    assert(amplicons[1] == POLY_C);
    std::cout << "PASSED\n";
}

void test_similar_reads_rejected() {
    std::cout << "Testing similar reads are merged... ";
    HammingAligner aligner;
    std::string one_off = POLY_A;
    one_off[0] = 'C';       // 19/20 = 0.95, not above the default cutoff
    std::string two_off = one_off;
    two_off[1] = 'C';

    auto reads = make_reads({{50, POLY_A}, {20, POLY_A}, {10, seq_utils::revcomp(POLY_A)}, {10, one_off}}, 100);
    auto amplicons = infer_amplicons(reads, aligner, InferenceSettings{});
    // the duplicate and the reverse complement are rejected, the 0.95 read is kept
    assert(amplicons.size() == 2);
    assert(amplicons[0] == POLY_A);
    assert(amplicons[1] == one_off);

    InferenceSettings strict;
    strict.amplicon_similarity_cutoff = 0.9;
    amplicons = infer_amplicons(reads, aligner, strict);
    assert(amplicons.size() == 1);

    // 0.9 against POLY_A but 0.95 against one_off once that is an amplicon
    auto chained = make_reads({{50, POLY_A}, {20, one_off}, {20, two_off}}, 100);
    amplicons = infer_amplicons(chained, aligner, InferenceSettings{});
    assert(amplicons.size() == 3);
    std::cout << "PASSED\n";
}

void test_each_read_added_once() {
    std::cout << "Testing reads are added at most once... ";
    HammingAligner aligner;
    auto reads = make_reads({{40, POLY_A}, {30, POLY_C}, {20, ACGT_REPEAT}}, 100);
    auto amplicons = infer_amplicons(reads, aligner, InferenceSettings{});
    assert(amplicons.size() == 3);
    assert(amplicons[0] == POLY_A);
    assert(amplicons[1] == POLY_C);
    assert(amplicons[2] == ACGT_REPEAT);
    std::cout << "PASSED\n";
}

void test_one_read_lookback() {
    std::cout << "Testing one-read lookback stop... ";
    HammingAligner aligner;
    const std::string poly_g(20, 'G');
    InferenceSettings s;
    s.min_freq_to_consider = 0.1;

    // 10/100 is at the threshold: that read is still examined, the one after it is not
    auto reads = make_reads({{50, POLY_A}, {20, POLY_C}, {10, ACGT_REPEAT}, {5, poly_g}}, 100);
    auto amplicons = infer_amplicons(reads, aligner, s);
    assert(amplicons.size() == 3);
    assert(amplicons[2] == ACGT_REPEAT);
    assert(std::find(amplicons.begin(), amplicons.end(), poly_g) == amplicons.end());

    // a below-threshold read is still added when the read before it passed; nothing after it is examined
    auto below = make_reads({{50, POLY_A}, {9, POLY_C}, {9, ACGT_REPEAT}}, 100);
    amplicons = infer_amplicons(below, aligner, s);
    assert(amplicons.size() == 2);
    assert(amplicons[1] == POLY_C);
    std::cout << "PASSED\n";
}

void test_degenerate_inputs() {
    std::cout << "Testing degenerate inputs... ";
    HammingAligner aligner;
    auto expect_degenerate = [&aligner](const ranked_reads &reads) {
        bool threw = false;
        try {
            infer_amplicons(reads, aligner, InferenceSettings{});
        } catch (const inference_degenerate &) {
            threw = true;
        }
        assert(threw);
    };
    expect_degenerate(make_reads({}, 100));
    expect_degenerate(make_reads({{5, POLY_A}}, 0));
    expect_degenerate(make_reads({{1, POLY_A}}, 100));     // 0.01 is not above the default threshold
    std::cout << "PASSED\n";
}

void test_thread_count_independent() {
    std::cout << "Testing thread count independence... ";
    HammingAligner aligner;
    std::vector<std::pair<int64_t, std::string>> ranked;
    const std::string bases = "ACGT";
    int64_t count = 1000;
    for (int i = 0; i < 24; ++i) {
        std::string seq;
        for (int j = 0; j < 20; ++j) seq += bases[(i * 7 + j * (i % 5 + 1)) % 4];
        ranked.emplace_back(count, seq);
        count -= 10;
    }
    auto reads = make_reads(ranked, 20000);
    InferenceSettings one;
    InferenceSettings four;
    four.threads = 4;
    auto a = infer_amplicons(reads, aligner, one);
    auto b = infer_amplicons(reads, aligner, four);
    assert(a == b);
    std::cout << "PASSED\n";
}

void test_aligner_errors_propagate() {
    std::cout << "Testing aligner errors... ";
    FailingAligner aligner;
    auto reads = make_reads({{50, POLY_A}, {50, POLY_C}}, 100);
    InferenceSettings s;
    s.threads = 2;
    bool threw = false;
    try {
        infer_amplicons(reads, aligner, s);
    } catch (const std::runtime_error &e) {
        threw = true;
        assert(std::string(e.what()).find("cannot align") != std::string::npos);
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_edlib_aligner() {
    std::cout << "Testing edlib global aligner... ";
    EdlibGlobalAligner aligner;

    auto same = aligner.align("ACGT", "ACGT");
    assert(same.score == 1.0);
    assert(same.aligned_query == "ACGT" && same.aligned_target == "ACGT");

    auto gap = aligner.align("ACGT", "AGT");
    assert(gap.aligned_query == "ACGT");
    assert(gap.aligned_target == "A-GT");
    assert(gap.score == 0.75);

    auto del = aligner.align("AGT", "ACGT");
    assert(del.aligned_query == "A-GT");
    assert(del.aligned_target == "ACGT");

    auto n = aligner.align("ACNT", "ACGT");
    assert(n.score == 1.0);

    EdlibGlobalAligner strict_n(false);
    assert(strict_n.align("ACNT", "ACGT").score == 0.75);

    auto empty = aligner.align("", "ACG");
    assert(empty.score == 0.0);
    assert(empty.aligned_query == "---" && empty.aligned_target == "ACG");
    std::cout << "PASSED\n";
}

void test_inference_with_edlib() {
    std::cout << "Testing inference with edlib... ";
    EdlibGlobalAligner aligner;
    const std::string amplicon = "ACGTTGCAAGGCTTACCGATTGCAGGTCAATCGGTACCAT";
    std::string variant = amplicon;
    variant[20] = (variant[20] == 'A') ? 'C' : 'A';     // 39/40 identity
    const std::string other(40, 'A');

    auto reads = make_reads({{60, amplicon}, {30, variant}, {10, other}}, 100);
    InferenceSettings s;
    s.threads = 2;
    auto amplicons = infer_amplicons(reads, aligner, s);
    assert(amplicons.size() == 2);
    assert(amplicons[0] == amplicon);
    assert(amplicons[1] == other);
    std::cout << "PASSED\n";
}

void test_parasail_aligner() {
    std::cout << "Testing parasail global aligner... ";
    ParasailGlobalAligner aligner;      // -20 / -2 / EDNAFULL

    auto same = aligner.align("ACGT", "ACGT");
    assert(same.score == 1.0);
    assert(same.aligned_query == "ACGT" && same.aligned_target == "ACGT");

    auto gap = aligner.align("ACGT", "AGT");
    assert(gap.aligned_query == "ACGT");
    assert(gap.aligned_target == "A-GT");
    assert(gap.score == 0.75);

    auto empty = aligner.align("ACG", "");
    assert(empty.score == 0.0);
    assert(empty.aligned_query == "ACG" && empty.aligned_target == "---");

    auto expect_config_error = [](int open, int extend, const std::string &matrix) {
        bool threw = false;
        try {
            ParasailGlobalAligner bad(open, extend, matrix);
        } catch (const configuration_error &) {
            threw = true;
        }
        assert(threw);
    };
    expect_config_error(5, -2, "EDNAFULL");
    expect_config_error(-20, 1, "EDNAFULL");
    expect_config_error(-20, -2, "no_such_matrix_file.txt");
    std::cout << "PASSED\n";
}

void test_gap_penalties_change_inference() {
    std::cout << "Testing gap penalties in inference... ";
    // second read is the first rotated by one base: 19 of 21 columns match with two gaps, 7 of 20 without
    const std::string amplicon = "AACGTTGCAAGGCTTACCGA";
    const std::string rotated = "ACGTTGCAAGGCTTACCGAA";
    auto reads = make_reads({{60, amplicon}, {40, rotated}}, 100);

    InferenceSettings cheap_gaps;
    cheap_gaps.amplicon_similarity_cutoff = 0.9;
    cheap_gaps.gap_open = -1;
    cheap_gaps.gap_extend = -1;
    auto cheap = inference_tools::make_global_aligner(cheap_gaps);
    assert(cheap->align(rotated, amplicon).score > 0.9);
    auto merged = infer_amplicons(reads, *cheap, cheap_gaps);
    assert(merged.size() == 1);

    InferenceSettings costly_gaps = cheap_gaps;
    costly_gaps.gap_open = -100;
    auto costly = inference_tools::make_global_aligner(costly_gaps);
    auto ungapped = costly->align(rotated, amplicon);
    assert(ungapped.aligned_query == rotated && ungapped.aligned_target == amplicon);
    assert(ungapped.score == 0.35);
    auto split = infer_amplicons(reads, *costly, costly_gaps);
    assert(split.size() == 2);
    assert(split[1] == rotated);
    std::cout << "PASSED\n";
}

void test_aligner_selection() {
    std::cout << "Testing aligner selection... ";
    InferenceSettings s;
    assert(dynamic_cast<ParasailGlobalAligner *>(inference_tools::make_global_aligner(s).get()) != nullptr);
    s.aligner = "edlib";
    assert(dynamic_cast<EdlibGlobalAligner *>(inference_tools::make_global_aligner(s).get()) != nullptr);
    s.aligner = "sw";
    bool threw = false;
    try {
        inference_tools::make_global_aligner(s);
    } catch (const configuration_error &) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Amplicon Inference Tests ===\n\n";

    test_seed_is_top_read();
    test_similar_reads_rejected();
    test_each_read_added_once();
    test_one_read_lookback();
    test_degenerate_inputs();
    test_thread_count_independent();
    test_aligner_errors_propagate();
    test_edlib_aligner();
    test_inference_with_edlib();
    test_parasail_aligner();
    test_gap_penalties_change_inference();
    test_aligner_selection();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
