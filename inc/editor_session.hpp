#pragma once

#include <string>

#ifndef PDFTOC_DEFAULT_EDITOR
#define PDFTOC_DEFAULT_EDITOR "vi"
#endif

#ifndef PDFTOC_EDIT_FILE_PATTERN
#define PDFTOC_EDIT_FILE_PATTERN "pdftoc_%%%%-%%%%-%%%%.txt"
#endif

// $VISUAL, then $EDITOR, then PDFTOC_DEFAULT_EDITOR
std::string resolve_editor();

/* Writes text to a fresh temporary file, runs the editor command on it and
 * blocks until the editor exits, then returns the saved content. The
 * command may carry arguments ("code --wait"), the file path is appended.
 * The temporary file is removed in every case. Throws std::runtime_error
 * when the editor cannot be started or exits with a non-zero status. */
std::string edit_text_in_editor(const std::string& text, const std::string& editor_command);
