#include "string_utils.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool is_space(unsigned char ch) {
    return std::isspace(ch) != 0;
}

}

void ltrim(std::string &s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
        return !is_space(ch);
    }));
}

void rtrim(std::string &s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) {
        return !is_space(ch);
    }).base(), s.end());
}

std::string trim_copy(std::string s) {
    ltrim(s);
    rtrim(s);
    return s;
}

std::string collapse_whitespace(std::string_view s) {
    std::string collapsed;
    collapsed.reserve(s.size());
    bool pending_space = false;
    for (unsigned char ch : s) {
        if (is_space(ch)) {
            pending_space = !collapsed.empty();
            continue;
        }
        if (pending_space) {
            collapsed += ' ';
            pending_space = false;
        }
        collapsed += static_cast<char>(ch);
    }
    return collapsed;
}

std::string normalize_text(std::string_view s) {
    std::string normalized = collapse_whitespace(s);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return normalized;
}

unsigned long count_non_whitespace(std::string_view s) {
    unsigned long count = 0;
    for (unsigned char ch : s) {
        // continuation bytes belong to the code point already counted
        if ((ch & 0xC0) == 0x80 || is_space(ch)) {
            continue;
        }
        ++count;
    }
    return count;
}

std::string UnicodeToUTF8(int codepoint) {
    std::string out;
    if (codepoint < 0 || codepoint > 0x10FFFF) {
        codepoint = 0xFFFD;
    }

    if (codepoint <= 0x7f) {
        out.append(1, static_cast<char>(codepoint));
    } else if (codepoint <= 0x7ff) {
        out.append(1, static_cast<char>(0xc0 | ((codepoint >> 6) & 0x1f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    } else if (codepoint <= 0xffff) {
        out.append(1, static_cast<char>(0xe0 | ((codepoint >> 12) & 0x0f)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    } else {
        out.append(1, static_cast<char>(0xf0 | ((codepoint >> 18) & 0x07)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 12) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | ((codepoint >> 6) & 0x3f)));
        out.append(1, static_cast<char>(0x80 | (codepoint & 0x3f)));
    }
    return out;
}

nlohmann::json add_json_node(const TocEntry &entry, unsigned int &id, std::optional<unsigned int> parent_id)
{
    nlohmann::json json_toc_entry;
    unsigned int entry_id = id++;
    json_toc_entry["id"] = entry_id;
    json_toc_entry["title"] = entry.title;
    json_toc_entry["level"] = entry.level;
    json_toc_entry["page"] = entry.page;
    if (parent_id) {
        json_toc_entry["parent_id"] = parent_id.value();
    }

    json_toc_entry["children"] = nlohmann::json::array();
    for (const TocEntry& child : entry.children) {
        json_toc_entry["children"].push_back(add_json_node(child, id, entry_id));
    }

    return json_toc_entry;
}

std::string format_toc_tree_json(const TocForest &forest)
{
    unsigned int start_id = 0;
    nlohmann::json json_toc = nlohmann::json::array();
    for (const TocEntry& entry : forest) {
        json_toc.push_back(add_json_node(entry, start_id, std::nullopt));
    }
    return json_toc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}
