#include "toc_text.hpp"
#include "logging.hpp"
#include "outline_tree.hpp"
#include "string_utils.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <regex>
#include <sstream>

TocParseError::TocParseError(unsigned int line_number, const std::string& line, const std::string& reason) :
    std::runtime_error("malformed TOC line " + std::to_string(line_number) + " (" + reason + "): \"" + line + "\""),
    line_number_(line_number),
    line_(line) {

}

namespace {

void write_entries(std::ostream& os, const TocForest& entries) {
    for (const TocEntry& entry : entries) {
        os << std::string(2 * (entry.level - 1), ' ') << entry.title << PDFTOC_TOC_PAGE_PREFIX << entry.page << ")\n";
        write_entries(os, entry.children);
    }
}

}

void write_toc_text(std::ostream& os, const TocForest& forest) {
    write_entries(os, forest);
}

std::string serialize_toc(const TocForest& forest) {
    std::ostringstream os;
    write_toc_text(os, forest);
    return os.str();
}

std::optional<TocForest> parse_toc(const std::string& text) {
    // <title> (p. <page>), the separator before "(p." may be any run of spaces
    static const std::regex entry_pattern("(.*?) *\\(p\\. *([0-9]+)\\)");
    // something that was meant as a page suffix but does not parse as one
    static const std::regex broken_suffix_pattern("\\(p\\.\\s*[^()\\s]*\\)?$");

    std::istringstream stream(text);
    std::string line;
    unsigned int line_number = 0;
    bool has_entries = false;
    OutlineBuilder builder;

    while (std::getline(stream, line)) {
        ++line_number;
        if (line_number == 1 && line.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            line.erase(0, 3);
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim_copy(line).empty()) {
            continue;
        }

        std::size_t indent = line.find_first_not_of(' ');
        if (std::isspace(static_cast<unsigned char>(line[indent]))) {
            throw TocParseError(line_number, line, "indentation must be made of spaces");
        }

        std::string content = line.substr(indent);
        rtrim(content);

        std::string title;
        std::optional<unsigned int> page;
        std::smatch match;
        if (std::regex_match(content, match, entry_pattern)) {
            title = match[1].str();
            unsigned long page_number = 0;
            try {
                page_number = std::stoul(match[2].str());
            } catch (const std::out_of_range&) {
                throw TocParseError(line_number, line, "page number out of range");
            }
            if (page_number == 0 || page_number > std::numeric_limits<unsigned int>::max()) {
                throw TocParseError(line_number, line, "page numbers start at 1");
            }
            page = static_cast<unsigned int>(page_number);
        } else if (std::regex_search(content, broken_suffix_pattern)) {
            throw TocParseError(line_number, line, "unparsable page suffix");
        } else {
            title = content;
        }

        rtrim(title);
        if (title.empty()) {
            throw TocParseError(line_number, line, "missing title");
        }

        builder.add(std::move(title), static_cast<unsigned int>(indent / 2 + 1), page);
        has_entries = true;
    }

    if (!has_entries) {
        LOG_CHANNEL_INFO("toc_text") << "TOC text holds no entries";
        return std::nullopt;
    }
    return builder.release();
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        throw std::runtime_error("cannot read file: " + path);
    }
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}
