#include "heading_detector.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <iomanip>
#include <map>

long size_key(double font_size, double tolerance) {
    return std::lround(font_size / tolerance);
}

namespace {

std::map<long, unsigned long> char_count_by_size(const std::vector<TextSpan> &spans, double tolerance) {
    std::map<long, unsigned long> counts;
    for (const TextSpan& span : spans) {
        unsigned long chars = count_non_whitespace(span.text);
        if (chars > 0) {
            counts[size_key(span.font_size, tolerance)] += chars;
        }
    }
    return counts;
}

}

std::vector<SizeHistogramEntry> build_size_histogram(const std::vector<TextSpan> &spans, double tolerance) {
    std::vector<SizeHistogramEntry> histogram;
    std::map<long, unsigned long> counts = char_count_by_size(spans, tolerance);
    for (auto it = counts.rbegin(); it != counts.rend(); ++it) {
        histogram.push_back({it->first * tolerance, it->second});
    }
    return histogram;
}

std::optional<DocumentStatistics> compute_document_statistics(const std::vector<TextSpan> &spans,
                                                              unsigned int page_count,
                                                              const DetectionOptions &options) {
    std::vector<SizeHistogramEntry> histogram = build_size_histogram(spans, options.size_tolerance);

    unsigned long total_chars = 0;
    std::size_t body_index = histogram.size();
    // largest size first, so >= leaves a tie on the smaller size
    for (std::size_t i = 0; i < histogram.size(); ++i) {
        total_chars += histogram[i].char_count;
        if (body_index == histogram.size() || histogram[i].char_count >= histogram[body_index].char_count) {
            body_index = i;
        }
    }

    if (total_chars < options.min_document_chars || body_index == histogram.size()) {
        LOG_CHANNEL_INFO("histogram") << "Only " << total_chars << " characters of text, body size undefined";
        return std::nullopt;
    }

    DocumentStatistics stats;
    stats.body_size = histogram[body_index].size;
    stats.tolerance = options.size_tolerance;
    stats.page_count = page_count;
    stats.total_chars = total_chars;

    LOG_CHANNEL_DEBUG("histogram") << "Font histogram (chars per size):";
    for (std::size_t i = 0; i < histogram.size(); ++i) {
        LOG_CHANNEL_DEBUG("histogram") << std::fixed << std::setprecision(1) << std::setw(6)
                                       << histogram[i].size << "pt: "
                                       << std::setw(6) << histogram[i].char_count << " chars"
                                       << (i == body_index ? " <-- body" : "");
    }

    return stats;
}
