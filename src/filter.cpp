#include "filter.hpp"
#include "text_format.hpp"

namespace quickswitch {

bool name_matches(const std::string &name, const std::string &query) {
    if (query.empty()) {
        return true;
    }
    return to_lower_ascii(name).find(to_lower_ascii(query)) != std::string::npos;
}

FilteredView filter_entries(const EntrySet &entries, const std::string &query) {
    FilteredView view;
    view.reserve(entries.size());

    if (query.empty()) {
        for (std::size_t i = 0; i < entries.size(); ++i) {
            view.push_back(i);
        }
        return view;
    }

    const std::string needle = to_lower_ascii(query);
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (to_lower_ascii(entries[i].name).find(needle) != std::string::npos) {
            view.push_back(i);
        }
    }
    return view;
}

std::vector<std::pair<std::size_t, std::size_t>> match_ranges(const std::string &name,
                                                              const std::string &query) {
    std::vector<std::pair<std::size_t, std::size_t>> ranges;
    if (query.empty()) {
        return ranges;
    }

    const std::string haystack = to_lower_ascii(name);
    const std::string needle = to_lower_ascii(query);
    std::size_t position = haystack.find(needle);
    while (position != std::string::npos) {
        ranges.emplace_back(position, position + needle.size());
        position = haystack.find(needle, position + needle.size());
    }
    return ranges;
}

}
