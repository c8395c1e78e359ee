// Unit tests for sequence helpers, config presets and cut geometry

#undef NDEBUG
#include <cassert>
#include "amplicut/amplicut_headers.h"

template<typename E, typename F>
static bool throws(F &&fn) {
    try {
        fn();
    } catch (const E &) {
        return true;
    }
    return false;
}

void test_revcomp() {
    std::cout << "Testing revcomp... ";
    assert(seq_utils::revcomp("ACGTN") == "NACGT");
    assert(seq_utils::revcomp("acgg") == "CCGT");
    assert(seq_utils::revcomp("") == "");
    // palindromic guide
    assert(seq_utils::revcomp("CCCCGGGG") == "CCCCGGGG");
    assert(seq_utils::revcomp(seq_utils::revcomp("GATTACA")) == "GATTACA");
    std::cout << "PASSED\n";
}

void test_reverse() {
    std::cout << "Testing reverse... ";
    assert(seq_utils::reverse("AACG") == "GCAA");
    assert(seq_utils::reverse("aacg") == "GCAA");
    std::cout << "PASSED\n";
}

void test_find_all() {
    std::cout << "Testing find_all... ";
    auto hits = seq_utils::find_all("AAAA", "AA");
    assert(hits.size() == 2);
    assert(hits[0] == 0 && hits[1] == 2);

    hits = seq_utils::find_all("TTACGTTTACGT", "ACGT");
    assert(hits.size() == 2);
    assert(hits[0] == 2 && hits[1] == 8);

    assert(seq_utils::find_all("ACGT", "").empty());
    assert(seq_utils::find_all("AC", "ACG").empty());
    assert(seq_utils::find_all("ACGT", "GGG").empty());
    std::cout << "PASSED\n";
}

void test_validate_sequence() {
    std::cout << "Testing validate_sequence... ";
    assert(seq_utils::find_wrong_nt("ACGXTZ-") == "-XZ");
    assert(seq_utils::find_wrong_nt("acgtn").empty());
    assert(seq_utils::validate_sequence(" acgtn ", "guide") == "ACGTN");

    assert(throws<configuration_error>([] { seq_utils::validate_sequence("ACGU", "guide"); }));
    // configuration errors are invalid_argument
    assert(throws<std::invalid_argument>([] { seq_utils::validate_sequence("AC GT", "amplicon"); }));

    try {
        seq_utils::validate_sequence("ACGU", "guide");
    } catch (const configuration_error &e) {
        assert(std::string(e.what()).find("'U'") != std::string::npos);
    }
    std::cout << "PASSED\n";
}

void test_split_list() {
    std::cout << "Testing split_list... ";
    auto parts = seq_utils::split_list("a, b,,c ");
    assert(parts.size() == 3);
    assert(parts[0] == "a" && parts[1] == "b" && parts[2] == "c");
    assert(seq_utils::split_list("").empty());
    std::cout << "PASSED\n";
}

void test_nuclease_presets() {
    std::cout << "Testing nuclease presets... ";
    assert(config_utils::get_window_center("cas9") == -3);
    assert(config_utils::get_window_center("CAS9") == -3);
    assert(config_utils::get_window_center("Cpf1") == 1);
    assert(config_utils::get_window_center("cas12a") == 1);
    assert(config_utils::get_window_center("base_editor") == -17);
    assert(throws<configuration_error>([] { config_utils::get_window_center("talen"); }));
    std::cout << "PASSED\n";
}

void test_numeric_options() {
    std::cout << "Testing numeric options... ";
    assert(config_utils::parse_int("12", "--threads") == 12);
    assert(config_utils::parse_int("-3", "--quantification_window_center") == -3);
    assert(throws<configuration_error>([] { config_utils::parse_int("12abc", "--threads"); }));
    assert(throws<configuration_error>([] { config_utils::parse_int("", "--threads"); }));
    assert(throws<configuration_error>([] { config_utils::parse_int("99999999999", "--threads"); }));
    assert(config_utils::parse_double("0.5", "--min_freq_to_consider") == 0.5);
    assert(throws<configuration_error>([] { config_utils::parse_double("0.5x", "--min_freq_to_consider"); }));

    try {
        config_utils::parse_int("four", "--threads");
    } catch (const configuration_error &e) {
        assert(std::string(e.what()) == "Invalid integer for --threads: 'four'");
    }
    std::cout << "PASSED\n";
}

void test_cut_geometry() {
    std::cout << "Testing cut geometry... ";
    // SpCas9: 20 nt guide, cut between guide positions 17 and 18
    assert(cut_geometry::forward_cut_offset(-3, 20) == 16);
    assert(cut_geometry::reverse_cut_offset(-3) == 2);
    assert(cut_geometry::cut_point(10, -3, 20, cut_geometry::orientation::forward) == 26);
    assert(cut_geometry::cut_point(10, -3, 20, cut_geometry::orientation::revcomp) == 12);
    assert(cut_geometry::cut_point(10, -3, 20, cut_geometry::orientation::reverse) == 12);
    // Cpf1 cuts past the 3' end
    assert(cut_geometry::cut_point(0, 1, 20, cut_geometry::orientation::forward) == 20);

    assert(cut_geometry::half_window(0) == 1);
    assert(cut_geometry::half_window(1) == 1);
    assert(cut_geometry::half_window(5) == 2);
    assert(cut_geometry::half_window(40) == 20);
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Sequence Ops Tests ===\n\n";

    test_revcomp();
    test_reverse();
    test_find_all();
    test_validate_sequence();
    test_split_list();
    test_nuclease_presets();
    test_numeric_options();
    test_cut_geometry();

    std::cout << "\n=== All tests passed! ===\n";
    return 0;
}
