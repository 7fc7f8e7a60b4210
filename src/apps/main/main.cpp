// mermaid-ascii: renders Mermaid diagrams as Unicode box-drawing text (C++20)
#include <diagram_loaders/json_loader.hpp>
#include <mermaid_ascii/render.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace {

const char* usage_text =
    "usage: mermaid-ascii [-w|--width N] [--json] [--verbose] [-h|--help] [FILE]\n"
    "\n"
    "Renders a Mermaid sequence diagram, graph/flowchart or erDiagram read from\n"
    "FILE (or stdin when FILE is absent or '-') as box-drawing text.\n"
    "\n"
    "  -w, --width N  fit the output into N columns\n"
    "  --json         read a JSON diagram AST instead of Mermaid text\n"
    "  --verbose      log layout decisions to stderr\n"
    "  -h, --help     show this help\n";

struct CliOptions {
    std::optional<int> max_width;
    bool json = false;
    bool verbose = false;
    bool help = false;
    std::string input = "-";
};

std::optional<int> parse_width(const std::string& text) {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value <= 0) return std::nullopt;
    return value;
}

// Returns nullopt after printing a usage error.
std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    CliOptions opts;
    bool have_input = false;
    for (int i = 1; i < argc; ++i) {
        const std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-w" || arg == "--width" || arg.rfind("--width=", 0) == 0) {
            std::string value;
            if (arg.rfind("--width=", 0) == 0) {
                value = arg.substr(8);
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                (void)fprintf(stderr, "ERROR: %s needs a value\n%s", arg.c_str(), usage_text);
                return std::nullopt;
            }
            opts.max_width = parse_width(value);
            if (!opts.max_width) {
                (void)fprintf(stderr, "ERROR: invalid width '%s'\n%s", value.c_str(), usage_text);
                return std::nullopt;
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            (void)fprintf(stderr, "ERROR: unknown option %s\n%s", arg.c_str(), usage_text);
            return std::nullopt;
        } else if (have_input) {
            (void)fprintf(stderr, "ERROR: more than one input file\n%s", usage_text);
            return std::nullopt;
        } else {
            opts.input = arg;
            have_input = true;
        }
    }
    return opts;
}

void init_logging(bool verbose) {
    try {
        auto logger = spdlog::stderr_color_mt("mermaid_ascii");
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex&) {
        // keep the previous default logger
    }
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::optional<std::string> read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) return std::nullopt;
    std::ostringstream buffer;
    buffer << f.rdbuf();
    return buffer.str();
}

} // namespace

int main(int argc, char* argv[])
{
    const auto opts = parse_args(argc, argv);
    if (!opts) return 2;
    if (opts->help) {
        (void)fputs(usage_text, stdout);
        return 0;
    }
    init_logging(opts->verbose);

    const auto source = read_input(opts->input);
    if (!source) {
        (void)fprintf(stderr, "ERROR: cannot read %s\n", opts->input.c_str());
        return 1;
    }
    spdlog::debug("read {} bytes from {}", source->size(), opts->input);

    mermaid_ascii::RenderOptions render_options;
    render_options.max_width = opts->max_width;
    std::string error;
    std::optional<std::string> output;
    if (opts->json) {
        std::istringstream in(*source);
        const auto diagram = diagram_loaders::load_diagram_from_json(in, &error);
        if (diagram) output = mermaid_ascii::render_diagram(*diagram, render_options, &error);
    } else {
        output = mermaid_ascii::render_with_options(*source, render_options, &error);
    }

    if (!output) {
        (void)fprintf(stderr, "ERROR: %s\n", error.c_str());
        return 1;
    }
    std::cout << *output << '\n';
    return 0;
}
