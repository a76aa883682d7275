#include "heading_detector.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <utility>

namespace {

long vertical_band(double y, double band_height) {
    return std::lround(y / band_height);
}

// normalized texts repeating in one band on more than the threshold of pages
std::set<std::string> find_recurring_texts(const std::vector<TextSpan> &spans,
                                           unsigned int page_count,
                                           const DetectionOptions &options) {
    std::set<std::string> recurring;
    if (page_count < options.min_repeat_pages) {
        return recurring;
    }

    std::map<std::pair<std::string, long>, std::set<unsigned int>> pages_by_text_and_band;
    for (const TextSpan& span : spans) {
        std::string normalized = normalize_text(span.text);
        if (normalized.empty()) {
            continue;
        }
        pages_by_text_and_band[{normalized, vertical_band(span.y, options.band_height)}].insert(span.page);
    }

    const double min_pages = options.repeat_threshold * page_count;
    for (const auto& [text_and_band, pages] : pages_by_text_and_band) {
        if (pages.size() >= 2 && static_cast<double>(pages.size()) > min_pages) {
            recurring.insert(text_and_band.first);
        }
    }
    return recurring;
}

}

bool is_page_number_token(const std::string &text) {
    static const std::regex arabic_pattern("\\d+");
    // i..xxxix in a single case, words such as "Mix", "DC" or "Vi" stay text
    static const std::regex roman_pattern("(?=[xvi])x{0,3}(ix|iv|v?i{0,3})|(?=[XVI])X{0,3}(IX|IV|V?I{0,3})");
    static const std::regex page_label_pattern("page\\s+\\d+(\\s+of\\s+\\d+)?", std::regex::icase);

    std::string stripped = trim_copy(text);
    if (stripped.empty()) {
        return false;
    }
    return std::regex_match(stripped, arabic_pattern) ||
           std::regex_match(stripped, roman_pattern) ||
           std::regex_match(stripped, page_label_pattern);
}

bool is_caption_text(const std::string &text) {
    static const std::regex caption_pattern("^(figure|fig\\.|table|tab\\.|listing|algorithm|chart|exhibit)\\s*(\\d|[ivxlc]+\\b|[:.\\-])",
                                            std::regex::icase);
    return std::regex_search(trim_copy(text), caption_pattern);
}

std::vector<TextSpan> filter_noise(const std::vector<TextSpan> &spans,
                                   unsigned int page_count,
                                   const DetectionOptions &options) {
    std::set<std::string> recurring = find_recurring_texts(spans, page_count, options);
    for (const std::string& text : recurring) {
        LOG_CHANNEL_DEBUG("noise") << "Recurring header/footer text: \"" << text << "\"";
    }

    // boilerplate and captions first, they do not count as band-mates of a page number
    std::vector<bool> is_noise(spans.size(), false);
    std::map<std::pair<unsigned int, long>, unsigned int> occupants_by_band;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const TextSpan& span = spans[i];
        if (recurring.count(normalize_text(span.text)) > 0 || is_caption_text(span.text)) {
            is_noise[i] = true;
            continue;
        }
        ++occupants_by_band[{span.page, vertical_band(span.y, options.band_height)}];
    }

    std::vector<TextSpan> filtered;
    filtered.reserve(spans.size());
    unsigned int dropped_page_numbers = 0, dropped_other = 0;
    for (std::size_t i = 0; i < spans.size(); ++i) {
        const TextSpan& span = spans[i];
        if (is_noise[i]) {
            ++dropped_other;
            continue;
        }
        if (is_page_number_token(span.text) &&
            occupants_by_band[{span.page, vertical_band(span.y, options.band_height)}] == 1) {
            ++dropped_page_numbers;
            continue;
        }
        filtered.push_back(span);
    }

    LOG_CHANNEL_DEBUG("noise") << "Dropped " << dropped_other << " header/footer/caption spans and "
                               << dropped_page_numbers << " page numbers, " << filtered.size() << " spans left";
    return filtered;
}
