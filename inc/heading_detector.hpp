#pragma once

#include <optional>
#include <vector>

#include "toc_types.hpp"

// font sizes closer than this fall into the same histogram bucket and level
#ifndef PDFTOC_SIZE_TOLERANCE
#define PDFTOC_SIZE_TOLERANCE 0.1
#endif

// below this many non-whitespace characters there is no body size
#ifndef PDFTOC_MIN_DOCUMENT_CHARS
#define PDFTOC_MIN_DOCUMENT_CHARS 20
#endif

// height in points of the vertical band used to match running headers/footers
#ifndef PDFTOC_BAND_HEIGHT
#define PDFTOC_BAND_HEIGHT 10.0
#endif

// fraction of pages a text must repeat on, in one band, to be boilerplate
#ifndef PDFTOC_REPEAT_THRESHOLD
#define PDFTOC_REPEAT_THRESHOLD 0.5
#endif

// documents shorter than this never have running headers/footers
#ifndef PDFTOC_MIN_REPEAT_PAGES
#define PDFTOC_MIN_REPEAT_PAGES 3
#endif

// vertical distance, in multiples of the font size, still merged into one heading
#ifndef PDFTOC_MERGE_LINE_GAP
#define PDFTOC_MERGE_LINE_GAP 1.5
#endif

#ifndef PDFTOC_TITLE_MAX_LENGTH
#define PDFTOC_TITLE_MAX_LENGTH 200
#endif

struct DetectionOptions {
    double size_tolerance = PDFTOC_SIZE_TOLERANCE;
    unsigned long min_document_chars = PDFTOC_MIN_DOCUMENT_CHARS;
    double band_height = PDFTOC_BAND_HEIGHT;
    double repeat_threshold = PDFTOC_REPEAT_THRESHOLD;
    unsigned int min_repeat_pages = PDFTOC_MIN_REPEAT_PAGES;
    double merge_line_gap = PDFTOC_MERGE_LINE_GAP;
    unsigned long title_max_length = PDFTOC_TITLE_MAX_LENGTH;
    unsigned int max_level = 0;          // 0: unlimited
};

// ===== histogram =====

// integer bucket of a font size, so that sizes compare exactly
long size_key(double font_size, double tolerance);

// sorted by size, largest first
std::vector<SizeHistogramEntry> build_size_histogram(const std::vector<TextSpan> &spans, double tolerance);

// nullopt if the document carries too little text to tell its body size
std::optional<DocumentStatistics> compute_document_statistics(const std::vector<TextSpan> &spans,
                                                              unsigned int page_count,
                                                              const DetectionOptions &options = DetectionOptions());

// ===== noise filter =====

bool is_page_number_token(const std::string &text);

bool is_caption_text(const std::string &text);

/* Copy of the spans without running headers/footers, lone page numbers and
 * figure/table captions. Applying it to its own output changes nothing.
 * page_count is the document's, not derived from the spans. */
std::vector<TextSpan> filter_noise(const std::vector<TextSpan> &spans,
                                   unsigned int page_count,
                                   const DetectionOptions &options = DetectionOptions());

// ===== classifier =====

std::vector<HeadingCandidate> classify_headings(const std::vector<TextSpan> &spans,
                                                const DocumentStatistics &stats,
                                                const DetectionOptions &options = DetectionOptions());

// ===== clusterer =====

// sets raw_level on every candidate, none is removed
void cluster_levels(std::vector<HeadingCandidate> &candidates,
                    const DocumentStatistics &stats,
                    unsigned int max_level = 0);

// ===== pipeline =====

// the whole detection run, an empty forest means "no headings detected"
TocForest detect_headings(const std::vector<TextSpan> &spans,
                          unsigned int page_count,
                          const DetectionOptions &options = DetectionOptions());
