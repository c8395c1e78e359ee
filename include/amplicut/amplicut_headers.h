#pragma once

// ————————————————————————————————————————————————————————————————
// C++ Standard Library in alphabetical order
// ————————————————————————————————————————————————————————————————
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fstream>
#include <functional>
#include <getopt.h>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <numeric>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <tuple>
#include <unordered_map>
#include <utility>
#include <vector>

// ————————————————————————————————————————————————————————————————
// Parallelism
// ————————————————————————————————————————————————————————————————
#include <omp.h>

// ————————————————————————————————————————————————————————————————
// Boost
// ————————————————————————————————————————————————————————————————
#include <boost/filesystem.hpp>
#include <boost/functional/hash.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>
#include <boost/multi_index_container.hpp>

// ————————————————————————————————————————————————————————————————
// External libraries
// ————————————————————————————————————————————————————————————————
#include <csv.hpp>
#include <edlib.h>
#include <gzstream.h>
#include <kseq.h>
#include <parasail.h>
#include <zlib.h>

// ————————————————————————————————————————————————————————————————
//  amplicut headers
// ————————————————————————————————————————————————————————————————
#include "amplicut_errors.hpp"
#include "misc_utils.hpp"
#include "io_streaming.hpp"
#include "guide_windows.hpp"
#include "allele_table.hpp"
#include "global_aligner.hpp"
#include "amplicon_inference.hpp"
#include "cli_args.hpp"
