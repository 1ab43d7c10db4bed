#include "entry.hpp"
#include "text_format.hpp"

#include <algorithm>

namespace quickswitch {

bool entry_order(const Entry &a, const Entry &b) {
    const bool a_dir = a.is_navigable();
    const bool b_dir = b.is_navigable();
    if (a_dir != b_dir) {
        return a_dir;
    }
    const std::string a_lower = to_lower_ascii(a.name);
    const std::string b_lower = to_lower_ascii(b.name);
    if (a_lower != b_lower) {
        return a_lower < b_lower;
    }
    return a.name < b.name;
}

void sort_entries(EntrySet &entries) {
    std::sort(entries.begin(), entries.end(), entry_order);
}

}
