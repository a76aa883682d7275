#include "cli_options.hpp"

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

std::optional<PDFTOC_Options> parse_command_line(int argc, const char* const argv[], std::ostream& help_out) {
    namespace po = boost::program_options;

    PDFTOC_Options options;
    std::string output, toc_file, format = "text";
    int max_level = 0;

    po::options_description visible("Usage: pdftoc <input.pdf> [options]\n"
                                    "Infer a table of contents from font sizes and write it as PDF bookmarks.\n\n"
                                    "Options");
    visible.add_options()
        ("help,h", "print this help")
        ("output,o", po::value<std::string>(&output), "output PDF path (default: <input stem>_toc.pdf beside the input)")
        ("preview", po::bool_switch(&options.preview), "print the detected TOC to stdout, write nothing")
        ("format", po::value<std::string>(&format)->default_value("text"), "preview format: text or json")
        ("max-level", po::value<int>(&max_level)->default_value(0),
            "deepest heading level kept, deeper styles merge into it (0: unlimited)")
        ("replace", po::bool_switch(&options.replace), "overwrite the input file")
        ("debug", po::bool_switch(&options.debug), "log the font histogram and detection details to stderr")
        ("edit", po::bool_switch(&options.edit), "open the detected TOC in $EDITOR before writing")
        ("toc", po::value<std::string>(&toc_file), "import the TOC from a text file instead of detecting it")
        ("repeat-threshold", po::value<double>(&options.detection.repeat_threshold)->default_value(PDFTOC_REPEAT_THRESHOLD),
            "fraction of pages a header/footer must repeat on");

    po::options_description hidden;
    hidden.add_options()
        ("input", po::value<std::string>(&options.input));

    po::options_description all;
    all.add(visible).add(hidden);

    po::positional_options_description positional;
    positional.add("input", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(all).positional(positional).run(), vm);

    if (vm.count("help")) {
        help_out << visible << std::endl;
        return std::nullopt;
    }

    po::notify(vm);

    if (options.input.empty()) {
        throw po::error("missing input PDF");
    }
    if (vm.count("output")) {
        options.output = output;
    }
    if (vm.count("toc")) {
        options.toc_file = toc_file;
    }

    if (format == "text") {
        options.preview_format = PDFTOC_Options::FORMAT::TEXT;
    } else if (format == "json") {
        options.preview_format = PDFTOC_Options::FORMAT::JSON;
    } else {
        throw po::invalid_option_value(format);
    }

    if (max_level < 0) {
        throw po::error("--max-level must not be negative");
    }
    options.detection.max_level = static_cast<unsigned int>(max_level);

    if (options.detection.repeat_threshold < 0 || options.detection.repeat_threshold > 1) {
        throw po::error("--repeat-threshold must lie between 0 and 1");
    }
    if (options.edit && options.toc_file) {
        throw po::error("--edit and --toc are mutually exclusive");
    }
    if (options.preview && (options.edit || options.toc_file)) {
        throw po::error(std::string("--preview and ") + (options.edit ? "--edit" : "--toc") + " are mutually exclusive");
    }
    if (options.replace && options.output) {
        throw po::error("--replace and --output are mutually exclusive");
    }

    return options;
}

std::string resolve_output_path(const PDFTOC_Options& options) {
    if (options.replace) {
        return options.input;
    }
    if (options.output) {
        return options.output.value();
    }
    boost::filesystem::path input(options.input);
    std::string extension = input.has_extension() ? input.extension().string() : ".pdf";
    return (input.parent_path() / (input.stem().string() + "_toc" + extension)).string();
}

bool is_same_path(const std::string& a, const std::string& b) {
    boost::system::error_code ec;
    if (boost::filesystem::exists(a, ec) && boost::filesystem::exists(b, ec)) {
        bool same = boost::filesystem::equivalent(a, b, ec);
        if (!ec) {
            return same;
        }
    }
    return boost::filesystem::absolute(a).lexically_normal() == boost::filesystem::absolute(b).lexically_normal();
}
