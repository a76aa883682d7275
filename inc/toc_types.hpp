#pragma once

#include <list>
#include <ostream>
#include <string>
#include <vector>

// one styled run of text as produced by the span extractor
struct TextSpan {
    std::string text;
    double font_size = 0;
    bool bold = false;
    unsigned int page = 1;     // 1-based
    double y = 0;              // top of the line, growing downwards
};

struct SizeHistogramEntry {
    double size;
    unsigned long char_count;
};

/* Run-scoped statistics of one document. Built once from the unfiltered
 * spans and handed explicitly to the classifier and the clusterer. */
struct DocumentStatistics {
    double body_size;
    double tolerance;
    unsigned int page_count;
    unsigned long total_chars;
};

struct HeadingCandidate {
    std::string text;
    double font_size = 0;
    bool bold = false;
    unsigned int page = 1;
    double y = 0;
    unsigned int raw_level = 0;   // 0 until the clusterer ran, not contiguous
};

struct TocEntry {
    std::string title;
    unsigned int level;
    unsigned int page;
    std::list<TocEntry> children;

    TocEntry(std::string title, unsigned int level, unsigned int page);

    bool operator==(const TocEntry& other) const;
    bool operator!=(const TocEntry& other) const;

    friend std::ostream& operator<<(std::ostream& os, const TocEntry& entry);
};

// top-level entries; the root of the outline is implicit
using TocForest = std::list<TocEntry>;

// number of entries in the whole forest
std::size_t count_toc_entries(const TocForest& forest);

// deepest level present, 0 for an empty forest
unsigned int max_toc_level(const TocForest& forest);
