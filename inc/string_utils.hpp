#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "toc_types.hpp"

// trim from start (in place)
void ltrim(std::string &s);

// trim from end (in place)
void rtrim(std::string &s);

std::string trim_copy(std::string s);

// trim, and replace every inner run of whitespace by a single space
std::string collapse_whitespace(std::string_view s);

// collapse_whitespace + ASCII lower case, the key used to compare repeated text
std::string normalize_text(std::string_view s);

// number of UTF-8 code points that are not whitespace
unsigned long count_non_whitespace(std::string_view s);

std::string UnicodeToUTF8(int codepoint);

nlohmann::json add_json_node(const TocEntry &entry, unsigned int &id, std::optional<unsigned int> parent_id);

// the outline as a JSON array of nested nodes, ids in pre-order
std::string format_toc_tree_json(const TocForest &forest);
