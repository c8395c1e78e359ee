#pragma once
#include "amplicut_headers.h"

namespace seq_utils {

    inline char complement(char c) {
        switch (c) {
            case 'A': return 'T';
            case 'T': return 'A';
            case 'G': return 'C';
            case 'C': return 'G';
            case 'N': return 'N';
            default: return c; // gaps ('-', '_') pass through
        }
    }

    inline std::string to_upper(std::string seq) {
        std::transform(seq.begin(), seq.end(), seq.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return seq;
    }

    inline std::string reverse(const std::string& seq) {
        std::string rev = to_upper(seq);
        std::reverse(rev.begin(), rev.end());
        return rev;
    }

    inline std::string revcomp(const std::string& seq) {
        if (seq.empty()) return seq;
        std::string rc = reverse(seq);
        std::transform(rc.begin(), rc.end(), rc.begin(), complement);
        return rc;
    }

    inline std::string trim(const std::string& s) {
        size_t start = s.find_first_not_of(" \t\n\r\f\v");
        if (start == std::string::npos)
            return "";
        size_t end = s.find_last_not_of(" \t\n\r\f\v");
        return s.substr(start, end - start + 1);
    }

    // start offsets of every non-overlapping literal occurrence of pattern in seq, left to right
    inline std::vector<int> find_all(const std::string& seq, const std::string& pattern) {
        std::vector<int> hits;
        if (pattern.empty() || seq.size() < pattern.size())
            return hits;
        for (size_t pos = seq.find(pattern);
             pos != std::string::npos;
             pos = seq.find(pattern, pos + pattern.size()))
        {
            hits.push_back(static_cast<int>(pos));
        }
        return hits;
    }

    // characters outside {A,C,G,T,N} (case-insensitive), each reported once in sorted order
    inline std::string find_wrong_nt(const std::string& seq) {
        std::set<char> wrong;
        for (unsigned char c : seq) {
            char u = static_cast<char>(std::toupper(c));
            if (u != 'A' && u != 'C' && u != 'G' && u != 'T' && u != 'N')
                wrong.insert(u);
        }
        return std::string(wrong.begin(), wrong.end());
    }

    // upper-cases a user-supplied sequence and rejects anything that isn't a nucleotide
    inline std::string validate_sequence(const std::string& raw, const std::string& what) {
        std::string seq = to_upper(trim(raw));
        std::string wrong = find_wrong_nt(seq);
        if (!wrong.empty()) {
            throw configuration_error("Illegal character(s) '" + wrong + "' in " + what + ": " + seq +
                                      " (only A, C, G, T and N are allowed)");
        }
        return seq;
    }

    // comma-separated field -> trimmed tokens, empties dropped
    inline std::vector<std::string> split_list(const std::string& field, char delim = ',') {
        std::vector<std::string> out;
        std::stringstream ss(field);
        std::string part;
        while (std::getline(ss, part, delim)) {
            part = trim(part);
            if (!part.empty()) out.push_back(part);
        }
        return out;
    }

    // keeps letters, digits and "+-_.() ", then turns spaces into underscores
    inline std::string clean_filename(const std::string& name) {
        static const std::string allowed = "+-_.() ";
        std::string out;
        for (unsigned char c : name) {
            if (std::isalnum(c) || allowed.find(static_cast<char>(c)) != std::string::npos) {
                out.push_back(c == ' ' ? '_' : static_cast<char>(c));
            }
        }
        return out;
    }

};

namespace streaming_utils {
    std::vector<std::string> import_text(const std::string &path, size_t max_lines = SIZE_MAX) {
        std::unique_ptr<std::istream> in;
        if (path.size() > 3 && path.substr(path.size() - 3) == ".gz") {
            in = std::make_unique<igzstream>(path.c_str());
        } else {
            in = std::make_unique<std::ifstream>(path);
        }
        if (!in || !*in) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        std::vector<std::string> out;
        out.reserve(std::min(max_lines, size_t(10)));
        std::string line;
        size_t count = 0;
        while (count < max_lines && std::getline(*in, line)) {
            out.push_back(std::move(line));
            ++count;
        }
        return out;
    }
};

namespace config_utils {

    // quantification window centers relative to the 3' end of the guide, per nuclease
    static std::unordered_map<std::string, int> nuclease_presets = {
        {"cas9", -3},
        {"spcas9", -3},
        {"cpf1", 1},
        {"cas12a", 1},
        {"base_editor", -17}
    };

    inline int get_window_center(const std::string &name) {
        std::string key = seq_utils::trim(name);
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = nuclease_presets.find(key);
        if (it == nuclease_presets.end())
            throw configuration_error("Unknown nuclease preset: " + name);
        return it->second;
    }

    // integer CLI values; std::stoi alone would accept "12abc"
    inline int parse_int(const std::string &value, const std::string &option) {
        size_t used = 0;
        int out = 0;
        try {
            out = std::stoi(value, &used);
        } catch (const std::exception &) {
            throw configuration_error("Invalid integer for " + option + ": '" + value + "'");
        }
        if (used != value.size())
            throw configuration_error("Invalid integer for " + option + ": '" + value + "'");
        return out;
    }

    inline int64_t parse_int64(const std::string &value, const std::string &option) {
        size_t used = 0;
        long long out = 0;
        try {
            out = std::stoll(value, &used);
        } catch (const std::exception &) {
            throw configuration_error("Invalid integer for " + option + ": '" + value + "'");
        }
        if (used != value.size())
            throw configuration_error("Invalid integer for " + option + ": '" + value + "'");
        return static_cast<int64_t>(out);
    }

    inline double parse_double(const std::string &value, const std::string &option) {
        size_t used = 0;
        double out = 0.0;
        try {
            out = std::stod(value, &used);
        } catch (const std::exception &) {
            throw configuration_error("Invalid number for " + option + ": '" + value + "'");
        }
        if (used != value.size())
            throw configuration_error("Invalid number for " + option + ": '" + value + "'");
        return out;
    }

};
