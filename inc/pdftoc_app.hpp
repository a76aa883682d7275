#pragma once

#include <ostream>
#include <string>

#include "cli_options.hpp"
#include "toc_types.hpp"

// first entry pointing past the last page, nullptr if there is none
const TocEntry* find_entry_beyond(const TocForest& forest, unsigned int page_count);

/* One pdftoc run on parsed options: detect or import the TOC, preview or
 * edit it, check its pages and write the bookmarks. Results go to out,
 * diagnostics to err. editor_command is only used with --edit. Returns the
 * process exit status; TocParseError and std::runtime_error from the TOC
 * file or the editor propagate to the caller. */
int run_pdftoc(const PDFTOC_Options& options, const std::string& editor_command, std::ostream& out, std::ostream& err);
