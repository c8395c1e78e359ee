#pragma once
#include "amplicut_headers.h"

/**
 * @brief Cut-site geometry. A guide is given 5'->3' without its PAM; the window center is counted from the
 * guide's 3' end, so -3 puts the cut three bases inside the guide (SpCas9) and 1 puts it one base past it (Cpf1).
 *
 * Forward match at s:  cut = s + center + len(guide) - 1   (last guide base is s + len - 1)
 * Reverse match at s:  cut = s - center - 1                (guide reads right-to-left, its 3' end sits at s)
 *
 * The cut coordinate is the reference base immediately 5' of the break on the forward strand.
 */
namespace cut_geometry {

    enum class orientation {
        forward,      // guide as given
        revcomp,      // reverse complement of the guide
        reverse       // reversed but not complemented, for nucleases with non-canonical geometry
    };

    inline int forward_cut_offset(int window_center, int guide_length) {
        return window_center + guide_length - 1;
    }

    inline int reverse_cut_offset(int window_center) {
        return -window_center - 1;
    }

    inline int cut_point(int match_start, int window_center, int guide_length, orientation dir) {
        if (dir == orientation::forward)
            return match_start + forward_cut_offset(window_center, guide_length);
        return match_start + reverse_cut_offset(window_center);
    }

    // half width of a window of the given size; never below one base
    inline int half_window(int window_size) {
        return std::max(1, window_size / 2);
    }

    inline const char* to_string(orientation dir) {
        switch (dir) {
            case orientation::forward: return "forward";
            case orientation::revcomp: return "revcomp";
            case orientation::reverse: return "reverse";
        }
        return "unknown";
    }
};

/**
 * @brief One guide occurrence in an amplicon. start and end are inclusive, 0-based.
 */
struct GuideInterval {
    int start;
    int end;
    cut_geometry::orientation dir;
    int cut_point;
};

/**
 * @brief Window parameters shared by every amplicon of a run.
 * @param quantification_window_coordinates explicit override for all amplicons: "5-10,5-10_20-30"
 *        gives amplicon 0 the range 5..10 and amplicon 1 the ranges 5..10 and 20..30
 */
struct WindowSettings {
    int quantification_window_center = -3;
    int quantification_window_size = 1;
    std::optional<std::string> quantification_window_coordinates;
    int exclude_bp_from_left = 15;
    int exclude_bp_from_right = 15;
    int plot_window_size = 40;
};

/**
 * @brief Everything the quantification and report stages need to know about where to look in one amplicon.
 */
struct AmpliconWindows {
    std::vector<std::string> guide_sequences_found;   // guides with at least one occurrence, input order
    std::vector<GuideInterval> guide_intervals;       // per occurrence: forward, then revcomp, then reverse hits
    std::vector<int> cut_points;                      // parallel to guide_intervals
    std::vector<int> guide_plot_offsets;              // parallel to guide_sequences_found
    std::set<int> include_idxs;
    std::set<int> exclude_idxs;
    std::set<int> plot_idxs;
};

namespace window_tools {

    // picks this amplicon's entry out of the comma-separated override string; empty or "0" means no override
    inline std::optional<std::string> coordinates_for_amplicon(const std::optional<std::string> &all_coords, size_t amplicon_idx) {
        if (!all_coords || all_coords->empty())
            return std::nullopt;
        std::vector<std::string> per_amplicon;
        std::stringstream ss(*all_coords);
        std::string part;
        while (std::getline(ss, part, ',')) {
            per_amplicon.push_back(seq_utils::trim(part));
        }
        if (amplicon_idx >= per_amplicon.size())
            return std::nullopt;
        const std::string &mine = per_amplicon[amplicon_idx];
        if (mine.empty() || mine == "0")
            return std::nullopt;
        return mine;
    }

    // "5-10_20-30" -> {5..10, 20..30}; both ends inclusive and must fall inside the reference
    inline std::set<int> parse_coordinates(const std::string &coords, int ref_seq_length) {
        static const std::regex range_re(R"(^(\d+)-(\d+)$)");
        std::set<int> idxs;
        // split on every '_' so a leading, trailing or doubled separator leaves an empty (unparseable) token
        std::vector<std::string> tokens;
        size_t from = 0;
        for (size_t at = coords.find('_'); at != std::string::npos; at = coords.find('_', from)) {
            tokens.push_back(coords.substr(from, at - from));
            from = at + 1;
        }
        tokens.push_back(coords.substr(from));
        for (const std::string &token : tokens) {
            std::smatch m;
            if (!std::regex_match(token, m, range_re)) {
                throw configuration_error("Cannot parse analysis window coordinate '" + token + "' in '" + coords +
                                          "'. Coordinates must be given in the form start-end e.g. 5-10");
            }
            long start = 0, end = 0;
            try {
                start = std::stol(m[1].str());
                end = std::stol(m[2].str());
            } catch (const std::out_of_range &) {
                throw configuration_error("Coordinate '" + token + "' in '" + coords + "' is out of range");
            }
            if (end >= ref_seq_length) {
                throw configuration_error("End coordinate " + std::to_string(end + 1) + " for '" + token + "' in '" +
                                          coords + "' is longer than the sequence length (" +
                                          std::to_string(ref_seq_length) + ")");
            }
            if (start > end) {
                throw configuration_error("Start coordinate " + std::to_string(start) + " is after end coordinate " +
                                          std::to_string(end) + " in '" + token + "'");
            }
            for (long i = start; i <= end; ++i) idxs.insert(static_cast<int>(i));
        }
        return idxs;
    }

    // [max(0, cut - half + 1), min(len - 1, cut + half + 1)), the right edge stops short of the last base
    inline void add_window(std::set<int> &idxs, int cut, int half, int ref_seq_length) {
        int st = std::max(0, cut - half + 1);
        int en = std::min(ref_seq_length - 1, cut + half + 1);
        for (int i = st; i < en; ++i) idxs.insert(i);
    }

    inline std::set<int> exclusion_idxs(int ref_seq_length, int left, int right) {
        std::set<int> idxs;
        for (int i = 0; i < std::min(std::max(left, 0), ref_seq_length); ++i)
            idxs.insert(i);
        for (int i = std::max(0, ref_seq_length - std::max(right, 0)); i < ref_seq_length; ++i)
            idxs.insert(i);
        return idxs;
    }

    // "6-11_20-25" for {6..11, 20..25}: the same shape the coordinate override accepts
    inline std::string format_ranges(const std::set<int> &idxs) {
        std::ostringstream oss;
        bool first = true;
        auto it = idxs.begin();
        while (it != idxs.end()) {
            int start = *it;
            int stop = start;
            ++it;
            while (it != idxs.end() && *it == stop + 1) {
                stop = *it;
                ++it;
            }
            if (!first) oss << '_';
            oss << start << '-' << stop;
            first = false;
        }
        return oss.str();
    }

};

/**
 * @brief Locates the guides in a reference and derives the include/exclude/plot coordinate sets.
 * @param ref_seq upper-case reference amplicon
 * @param guides guide sequences without PAM, upper case
 * @param settings window parameters
 * @param amplicon_idx position of this amplicon in the run, selects its coordinate override
 * @throws configuration_error on a bad override, an emptied quantification window or a plot window off the amplicon
 */
inline AmpliconWindows get_amplicon_windows(const std::string &ref_seq, const std::vector<std::string> &guides,
                                            const WindowSettings &settings, size_t amplicon_idx = 0, bool verbose = false) {
    using cut_geometry::orientation;
    const int ref_seq_length = static_cast<int>(ref_seq.size());
    AmpliconWindows out;

    for (const auto &guide : guides) {
        if (guide.empty()) continue;
        const int guide_length = static_cast<int>(guide.size());

        const std::pair<orientation, std::string> searches[] = {
            {orientation::forward, guide},
            {orientation::revcomp, seq_utils::revcomp(guide)},
            {orientation::reverse, seq_utils::reverse(guide)}
        };

        std::vector<GuideInterval> hits;
        for (const auto &[dir, pattern] : searches) {
            for (int start : seq_utils::find_all(ref_seq, pattern)) {
                int cut = cut_geometry::cut_point(start, settings.quantification_window_center, guide_length, dir);
                hits.push_back({start, start + guide_length - 1, dir, cut});
            }
        }

        if (hits.empty()) {
            if (verbose) std::cout << "[get_amplicon_windows] Guide " << guide << " not found in amplicon " << amplicon_idx << "\n";
            continue;
        }
        for (const auto &hit : hits) {
            out.guide_intervals.push_back(hit);
            out.cut_points.push_back(hit.cut_point);
            if (verbose) {
                std::cout << "[get_amplicon_windows] Guide " << guide << " " << cut_geometry::to_string(hit.dir)
                          << " at " << hit.start << "-" << hit.end << ", cut point " << hit.cut_point << "\n";
            }
        }
        out.guide_sequences_found.push_back(guide);
        out.guide_plot_offsets.push_back(ref_seq.find(guide) != std::string::npos ? 1 : 0);
    }

    // quantification window: explicit coordinates win, then windows around cuts, then the whole amplicon
    auto coords = window_tools::coordinates_for_amplicon(settings.quantification_window_coordinates, amplicon_idx);
    if (coords) {
        out.include_idxs = window_tools::parse_coordinates(*coords, ref_seq_length);
        if (verbose) std::cout << "[get_amplicon_windows] Using coordinate override " << *coords << "\n";
    } else if (!out.cut_points.empty() && settings.quantification_window_size > 0) {
        int half = cut_geometry::half_window(settings.quantification_window_size);
        for (int cut : out.cut_points) {
            window_tools::add_window(out.include_idxs, cut, half, ref_seq_length);
        }
    } else {
        for (int i = 0; i < ref_seq_length; ++i) out.include_idxs.insert(i);
    }

    out.exclude_idxs = window_tools::exclusion_idxs(ref_seq_length, settings.exclude_bp_from_left, settings.exclude_bp_from_right);
    for (int idx : out.exclude_idxs) {
        out.include_idxs.erase(idx);
    }
    if (out.include_idxs.empty()) {
        throw configuration_error("The entire sequence has been excluded (length " + std::to_string(ref_seq_length) +
                                  ", exclude_bp_from_left " + std::to_string(settings.exclude_bp_from_left) +
                                  ", exclude_bp_from_right " + std::to_string(settings.exclude_bp_from_right) +
                                  "). Please enter a longer amplicon, or decrease the exclude_bp_from_right and exclude_bp_from_left parameters");
    }

    if (!out.cut_points.empty() && settings.plot_window_size > 0) {
        int window_around_cut = cut_geometry::half_window(settings.plot_window_size);
        for (int cut : out.cut_points) {
            if (cut - window_around_cut + 1 < 0) {
                throw configuration_error("Offset around cut would extend to the left of the amplicon. Please decrease plot_window_size parameter. Cut point: " +
                                          std::to_string(cut) + " window: " + std::to_string(window_around_cut));
            }
            if (cut - window_around_cut > ref_seq_length - 1) {
                throw configuration_error("Offset around cut would be greater than sequence length. Please decrease plot_window_size parameter. Cut point: " +
                                          std::to_string(cut) + " window: " + std::to_string(window_around_cut));
            }
            window_tools::add_window(out.plot_idxs, cut, window_around_cut, ref_seq_length);
        }
    } else {
        for (int i = 0; i < ref_seq_length; ++i) out.plot_idxs.insert(i);
    }

    if (verbose) {
        std::cout << "[get_amplicon_windows] include " << out.include_idxs.size() << " bp, exclude "
                  << out.exclude_idxs.size() << " bp, plot " << out.plot_idxs.size() << " bp\n";
    }
    return out;
}
