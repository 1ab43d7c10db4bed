#pragma once

#include "entry.hpp"

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace quickswitch {

using FilteredView = std::vector<std::size_t>;

// Positions of the entries whose name contains `query` (ASCII case-insensitive),
// in entry order. An empty query selects every entry.
FilteredView filter_entries(const EntrySet &entries, const std::string &query);

bool name_matches(const std::string &name, const std::string &query);

// Byte ranges [begin, end) of non-overlapping query occurrences in `name`.
std::vector<std::pair<std::size_t, std::size_t>> match_ranges(const std::string &name,
                                                              const std::string &query);

}
