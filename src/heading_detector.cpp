#include "heading_detector.hpp"
#include "logging.hpp"
#include "outline_tree.hpp"
#include "string_utils.hpp"

#include <cctype>
#include <cmath>
#include <map>
#include <utility>

std::vector<HeadingCandidate> classify_headings(const std::vector<TextSpan> &spans,
                                                const DocumentStatistics &stats,
                                                const DetectionOptions &options) {
    const long body_key = size_key(stats.body_size, stats.tolerance);
    std::vector<HeadingCandidate> candidates;

    // true while the previous non-blank span was a heading span
    bool run_open = false;
    double last_y = 0;

    for (const TextSpan& span : spans) {
        std::string text = collapse_whitespace(span.text);
        if (text.empty()) {
            continue;
        }

        const long key = size_key(span.font_size, stats.tolerance);
        if (key < body_key || (key == body_key && !span.bold)) {
            run_open = false;
            continue;
        }

        if (run_open) {
            HeadingCandidate& previous = candidates.back();
            if (previous.page == span.page &&
                size_key(previous.font_size, stats.tolerance) == key &&
                previous.bold == span.bold &&
                std::fabs(span.y - last_y) <= options.merge_line_gap * span.font_size) {
                previous.text += " " + text;
                last_y = span.y;
                continue;
            }
        }

        HeadingCandidate candidate;
        candidate.text = std::move(text);
        candidate.font_size = span.font_size;
        candidate.bold = span.bold;
        candidate.page = span.page;
        candidate.y = span.y;
        candidates.push_back(std::move(candidate));
        last_y = span.y;
        run_open = true;
    }

    std::vector<HeadingCandidate> accepted;
    accepted.reserve(candidates.size());
    for (HeadingCandidate& candidate : candidates) {
        unsigned long length = count_non_whitespace(candidate.text);
        bool numbered = std::isdigit(static_cast<unsigned char>(candidate.text.front())) != 0;
        if (length < 2 && !numbered) {
            LOG_CHANNEL_TRACE("classify") << "Too short for a heading: \"" << candidate.text << "\"";
            continue;
        }
        if (length > options.title_max_length) {
            LOG_CHANNEL_TRACE("classify") << "Too long for a heading on page " << candidate.page;
            continue;
        }
        accepted.push_back(std::move(candidate));
    }

    LOG_CHANNEL_DEBUG("classify") << accepted.size() << " heading candidates against body size " << stats.body_size << "pt";
    return accepted;
}

void cluster_levels(std::vector<HeadingCandidate> &candidates,
                    const DocumentStatistics &stats,
                    unsigned int max_level) {
    // larger size first, bold before regular at the same size
    auto more_prominent = [](const std::pair<long, bool>& a, const std::pair<long, bool>& b) {
        if (a.first != b.first) {
            return a.first > b.first;
        }
        return a.second && !b.second;
    };
    std::map<std::pair<long, bool>, unsigned int, decltype(more_prominent)> level_of_style(more_prominent);

    for (const HeadingCandidate& candidate : candidates) {
        level_of_style.emplace(std::make_pair(size_key(candidate.font_size, stats.tolerance), candidate.bold), 0);
    }

    unsigned int level = 0;
    for (auto& [style, style_level] : level_of_style) {
        ++level;
        style_level = (max_level > 0 && level > max_level) ? max_level : level;
        LOG_CHANNEL_DEBUG("cluster") << style.first * stats.tolerance << "pt" << (style.second ? " bold" : "")
                                     << " -> level " << style_level;
    }

    for (HeadingCandidate& candidate : candidates) {
        candidate.raw_level = level_of_style.at(std::make_pair(size_key(candidate.font_size, stats.tolerance), candidate.bold));
    }
}

TocForest detect_headings(const std::vector<TextSpan> &spans,
                          unsigned int page_count,
                          const DetectionOptions &options) {
    // statistics come from the unfiltered spans, captions included
    std::optional<DocumentStatistics> stats = compute_document_statistics(spans, page_count, options);
    if (!stats) {
        return TocForest();
    }

    std::vector<TextSpan> filtered = filter_noise(spans, page_count, options);
    std::vector<HeadingCandidate> candidates = classify_headings(filtered, stats.value(), options);
    if (candidates.empty()) {
        return TocForest();
    }

    cluster_levels(candidates, stats.value(), options.max_level);
    TocForest forest = build_outline_tree(std::move(candidates));

    LOG_CHANNEL_DEBUG("outline") << "Detected " << count_toc_entries(forest) << " headings";
    return forest;
}
