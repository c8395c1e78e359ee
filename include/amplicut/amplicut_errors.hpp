#pragma once
#include "amplicut_headers.h"

// bad user-facing parameter: coordinate overrides, exclusion that empties the window, plot window
// that runs off the amplicon, invalid nucleotides
class configuration_error : public std::invalid_argument {
public:
    explicit configuration_error(const std::string &msg) : std::invalid_argument(msg) {}
};

// an upstream record does not satisfy what the caller promised (e.g. alignment doesn't span the cut)
class precondition_violation : public std::logic_error {
public:
    explicit precondition_violation(const std::string &msg) : std::logic_error(msg) {}
};

// amplicon inference had nothing frequent enough to seed a reference
class inference_degenerate : public std::runtime_error {
public:
    explicit inference_degenerate(const std::string &msg) : std::runtime_error(msg) {}
};
