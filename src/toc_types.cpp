#include "toc_types.hpp"

#include <algorithm>
#include <utility>

TocEntry::TocEntry(std::string title, unsigned int level, unsigned int page) :
    title(std::move(title)),
    level(level),
    page(page) {

}

bool TocEntry::operator==(const TocEntry& other) const {
    return title == other.title &&
           level == other.level &&
           page == other.page &&
           children == other.children;
}

bool TocEntry::operator!=(const TocEntry& other) const {
    return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const TocEntry& entry) {
    os << "L" << entry.level << " \"" << entry.title << "\" (p." << entry.page << ")";
    if (!entry.children.empty()) {
        os << " { ";
        for (const TocEntry& child : entry.children) {
            os << child << " ";
        }
        os << "}";
    }
    return os;
}

std::size_t count_toc_entries(const TocForest& forest) {
    std::size_t count = 0;
    for (const TocEntry& entry : forest) {
        count += 1 + count_toc_entries(entry.children);
    }
    return count;
}

unsigned int max_toc_level(const TocForest& forest) {
    unsigned int deepest = 0;
    for (const TocEntry& entry : forest) {
        deepest = std::max({deepest, entry.level, max_toc_level(entry.children)});
    }
    return deepest;
}
