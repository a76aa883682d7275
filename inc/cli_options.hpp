#pragma once

#include <optional>
#include <ostream>
#include <string>

#include "heading_detector.hpp"

struct PDFTOC_Options {
    enum class FORMAT {TEXT, JSON};

    std::string input;
    std::optional<std::string> output;
    std::optional<std::string> toc_file;
    bool preview = false;
    bool replace = false;
    bool debug = false;
    bool edit = false;
    FORMAT preview_format = FORMAT::TEXT;
    DetectionOptions detection;
};

/* Parses pdftoc's command line. Returns nullopt after printing the usage
 * to help_out for --help. Throws boost::program_options::error on unknown
 * options, bad values and conflicting flags. */
std::optional<PDFTOC_Options> parse_command_line(int argc, const char* const argv[], std::ostream& help_out);

// where the outlined PDF goes: the input for --replace, -o, or <stem>_toc<ext> beside the input
std::string resolve_output_path(const PDFTOC_Options& options);

// true if both paths name the same file, also when the output does not exist yet
bool is_same_path(const std::string& a, const std::string& b);
