#pragma once

#include <optional>
#include <string>
#include <vector>

#include "toc_types.hpp"

/* Level repair rule shared by heading detection and TOC text parsing:
 * an entry can open at most one level below the deepest open ancestor.
 * open_depth is the number of ancestors left open for the entry. */
unsigned int clamp_level(unsigned int requested_level, unsigned int open_depth);

// Nests entries, given in document order, into a TocForest.
class OutlineBuilder {
  public:
    OutlineBuilder() = default;

    // disable copy constructor and copy assignment, open_ points into forest_
    OutlineBuilder(OutlineBuilder const&) = delete;
    OutlineBuilder& operator=(OutlineBuilder const&) = delete;

    /* Closes every open entry whose requested level is >= raw_level, then
     * attaches the new entry under the deepest remaining one at the clamped
     * level. Without a page the previous sibling's page is used, or 1. */
    const TocEntry& add(std::string title, unsigned int raw_level, std::optional<unsigned int> page);

    unsigned int open_depth() const;

    TocForest release();

  private:
    struct OpenEntry {
        unsigned int raw_level;
        TocEntry* entry;
    };

    TocForest forest_;
    std::vector<OpenEntry> open_;
};

// candidates in any order, sorted here by (page, y)
TocForest build_outline_tree(std::vector<HeadingCandidate> candidates);
