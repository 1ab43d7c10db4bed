#include "filter.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using quickswitch::Entry;
using quickswitch::EntryKind;
using quickswitch::EntrySet;
using quickswitch::FilteredView;
using quickswitch::filter_entries;
using quickswitch::match_ranges;

namespace {

Entry make(const std::string &name, EntryKind kind) {
    Entry entry;
    entry.name = name;
    entry.path = "/fixture/" + name;
    entry.kind = kind;
    return entry;
}

bool is_subset(const FilteredView &narrow, const FilteredView &wide) {
    for (auto index : narrow) {
        bool found = false;
        for (auto other : wide) {
            found = found || other == index;
        }
        if (!found) return false;
    }
    return true;
}

}

int main() {
    const EntrySet entries{
        make("banana", EntryKind::Directory),
        make("apple.txt", EntryKind::File),
        make("avocado.md", EntryKind::File),
    };

    const FilteredView all = filter_entries(entries, "");
    assert((all == FilteredView{0, 1, 2}));

    // Substring match: "banana" contains "a" as well.
    const FilteredView with_a = filter_entries(entries, "a");
    assert((with_a == FilteredView{0, 1, 2}));

    const FilteredView with_av = filter_entries(entries, "av");
    assert((with_av == FilteredView{2}));

    const FilteredView with_p = filter_entries(entries, "P");
    assert((with_p == FilteredView{1}));

    assert(filter_entries(entries, "zzz").empty());

    // Extending the query never widens the result.
    const std::vector<std::string> queries{"", "a", "ap", "app", "appl", "apple"};
    FilteredView previous = filter_entries(entries, queries.front());
    for (std::size_t i = 1; i < queries.size(); ++i) {
        const FilteredView next = filter_entries(entries, queries[i]);
        assert(is_subset(next, previous));
        previous = next;
    }

    // Same input, same output.
    assert(filter_entries(entries, "an") == filter_entries(entries, "an"));

    const auto ranges = match_ranges("Banana", "an");
    assert(ranges.size() == 2);
    assert(ranges[0].first == 1 && ranges[0].second == 3);
    assert(ranges[1].first == 3 && ranges[1].second == 5);
    assert(match_ranges("Banana", "").empty());
    assert(match_ranges("Banana", "x").empty());

    std::cout << "All filter tests passed." << std::endl;
    return 0;
}
