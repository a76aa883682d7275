#include "editor_session.hpp"
#include "logging.hpp"
#include "string_utils.hpp"
#include "toc_text.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/process.hpp>
#include <cstdlib>
#include <stdexcept>
#include <utility>
#include <vector>

namespace {

// removes the file when the session ends, whatever the outcome
struct TemporaryFile {
    boost::filesystem::path path;

    explicit TemporaryFile(boost::filesystem::path path) : path(std::move(path)) {}
    TemporaryFile(TemporaryFile const&) = delete;
    TemporaryFile& operator=(TemporaryFile const&) = delete;

    ~TemporaryFile() {
        boost::system::error_code ec;
        boost::filesystem::remove(path, ec);
        if (ec) {
            LOG_CHANNEL_WARNING("editor") << "Cannot remove " << path.string() << ": " << ec.message();
        }
    }
};

}

std::string resolve_editor() {
    for (const char* variable : {"VISUAL", "EDITOR"}) {
        const char* value = std::getenv(variable);
        if (value && !trim_copy(value).empty()) {
            return value;
        }
    }
    return PDFTOC_DEFAULT_EDITOR;
}

std::string edit_text_in_editor(const std::string& text, const std::string& editor_command) {
    std::vector<std::string> words;
    std::string command = trim_copy(editor_command);
    boost::algorithm::split(words, command, boost::algorithm::is_any_of(" \t"), boost::algorithm::token_compress_on);
    if (command.empty() || words.empty()) {
        throw std::runtime_error("no editor configured");
    }

    boost::filesystem::path executable(words.front());
    if (!executable.has_parent_path()) {
        executable = boost::process::search_path(words.front());
    }
    if (executable.empty() || !boost::filesystem::exists(executable)) {
        throw std::runtime_error("editor not found: " + words.front());
    }

    TemporaryFile edit_file(boost::filesystem::temp_directory_path() / boost::filesystem::unique_path(PDFTOC_EDIT_FILE_PATTERN));
    {
        boost::filesystem::ofstream out(edit_file.path, std::ios::out | std::ios::binary);
        if (!out) {
            throw std::runtime_error("cannot create " + edit_file.path.string());
        }
        out << text;
    }

    std::vector<std::string> args(words.begin() + 1, words.end());
    args.push_back(edit_file.path.string());

    LOG_CHANNEL_DEBUG("editor") << "Running " << executable.string() << " on " << edit_file.path.string();
    int exit_code = 0;
    try {
        exit_code = boost::process::system(executable, boost::process::args(args));
    } catch (const boost::process::process_error& e) {
        throw std::runtime_error("cannot run editor " + executable.string() + ": " + e.what());
    }
    if (exit_code != 0) {
        throw std::runtime_error("editor exited with code " + std::to_string(exit_code));
    }

    return read_text_file(edit_file.path.string());
}
