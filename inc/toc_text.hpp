#pragma once

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include "toc_types.hpp"

/* Plain-text TOC notation, one entry per line:
 *
 *   Chapter 1  (p. 1)
 *     Section 1.1  (p. 3)
 *
 * Two spaces of indentation per level below 1. Titles are not escaped, a
 * title containing "(p. " is a known limitation of the format. */

#ifndef PDFTOC_TOC_PAGE_PREFIX
#define PDFTOC_TOC_PAGE_PREFIX "  (p. "
#endif

class TocParseError : public std::runtime_error {
  public:
    TocParseError(unsigned int line_number, const std::string& line, const std::string& reason);

    unsigned int line_number() const { return line_number_; }
    const std::string& line() const { return line_; }

  private:
    unsigned int line_number_;
    std::string line_;
};

void write_toc_text(std::ostream& os, const TocForest& forest);

std::string serialize_toc(const TocForest& forest);

/* Inverse of serialize_toc. Returns nullopt when the text holds no entry
 * at all (every line blank), which callers treat as a cancellation.
 * Throws TocParseError on the first malformed line; nothing is returned
 * for a partially valid text. */
std::optional<TocForest> parse_toc(const std::string& text);

// reads the whole file, throws std::runtime_error if it cannot be opened
std::string read_text_file(const std::string& path);
