#include "outline_tree.hpp"
#include "logging.hpp"

#include <algorithm>
#include <utility>

unsigned int clamp_level(unsigned int requested_level, unsigned int open_depth) {
    return std::max(1u, std::min(requested_level, open_depth + 1));
}

const TocEntry& OutlineBuilder::add(std::string title, unsigned int raw_level, std::optional<unsigned int> page) {
    while (!open_.empty() && open_.back().raw_level >= raw_level) {
        open_.pop_back();
    }

    unsigned int level = clamp_level(raw_level, open_depth());
    if (level != raw_level) {
        LOG_CHANNEL_DEBUG("outline") << "\"" << title << "\" requested level " << raw_level << ", placed at level " << level;
    }

    TocForest& siblings = open_.empty() ? forest_ : open_.back().entry->children;
    unsigned int previous_page = siblings.empty() ? 1 : siblings.back().page;
    if (page && !siblings.empty() && page.value() < previous_page) {
        LOG_CHANNEL_WARNING("outline") << "\"" << title << "\" on page " << page.value()
                                       << " comes after a sibling on page " << previous_page;
    }

    siblings.emplace_back(std::move(title), level, page.value_or(previous_page));
    TocEntry& entry = siblings.back();
    open_.push_back({raw_level, &entry});
    return entry;
}

unsigned int OutlineBuilder::open_depth() const {
    return static_cast<unsigned int>(open_.size());
}

TocForest OutlineBuilder::release() {
    open_.clear();
    return std::move(forest_);
}

TocForest build_outline_tree(std::vector<HeadingCandidate> candidates) {
    std::stable_sort(candidates.begin(), candidates.end(), [](const HeadingCandidate& a, const HeadingCandidate& b) {
        if (a.page != b.page) {
            return a.page < b.page;
        }
        return a.y < b.y;
    });

    OutlineBuilder builder;
    for (HeadingCandidate& candidate : candidates) {
        const TocEntry& entry = builder.add(std::move(candidate.text), candidate.raw_level, candidate.page);
        LOG_CHANNEL_DEBUG("outline") << std::string(2 * (entry.level - 1), ' ') << "L" << entry.level
                                     << ": \"" << entry.title << "\" (p." << entry.page << ")";
    }
    return builder.release();
}
