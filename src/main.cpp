#include <cstdlib>
#include <iostream>
#include <boost/program_options/errors.hpp>
#include "cli_options.hpp"
#include "editor_session.hpp"
#include "logging.hpp"
#include "pdftoc_app.hpp"
#include "toc_text.hpp"

int main(int argc, char* argv[]) {
    std::optional<PDFTOC_Options> options;
    try {
        options = parse_command_line(argc, argv, std::cout);
        if (!options) {
            return EXIT_SUCCESS;
        }
    } catch (const boost::program_options::error& e) {
        std::cerr << "Error: " << e.what() << "\nTry 'pdftoc --help' for more information." << std::endl;
        return EXIT_FAILURE;
    }

    init_logging(options->debug ? boost::log::trivial::debug : boost::log::trivial::PDFTOC_LOG_SEVERITY_THRESHOLD);

    try {
        LOG_DEBUG << "Processing " << options->input;
        return run_pdftoc(options.value(), resolve_editor(), std::cout, std::cerr);
    } catch (const TocParseError& e) {
        LOG_CHANNEL_DEBUG("cli") << "Rejected TOC at line " << e.line_number();
        std::cerr << "Error: " << e.what() << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
    }
    return EXIT_FAILURE;
}
