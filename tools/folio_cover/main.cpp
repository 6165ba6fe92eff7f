/**
 * Cover Generator CLI
 * Usage: folio-cover [options] <title> [author]
 */

#include "folio/cover/cover_engine.hpp"
#include "folio/core/logger.hpp"
#include <charconv>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace folio;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_ERROR = 1;
constexpr int EXIT_USAGE = 2;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <title> [author]\n"
              << "\n"
              << "Options:\n"
              << "  --width N           Cover width in pixels (default 1600)\n"
              << "  --height N          Cover height in pixels (default 2400)\n"
              << "  --subtitle TEXT     Subtitle drawn below the title block\n"
              << "  --seed N            Seed for a reproducible design\n"
              << "  --output FILE       Output path (default cover.jpg / cover.png)\n"
              << "  --format jpg|png    Output format (default jpg)\n"
              << "  --quality N         JPEG quality 1-100 (default 95)\n"
              << "  --stride N          Gradient column sample stride (default 4)\n"
              << "  --font PATH         Latin font file, tried before the defaults\n"
              << "  --cjk-font PATH     CJK font file, tried before the defaults\n"
              << "  --genre-palettes    Pick palettes matching the title's genre\n"
              << "  --cover FILE        Copy a pre-made JPEG/PNG cover instead\n"
              << "  --log-level LEVEL   trace, debug, info, warn or error (default warn)\n"
              << "  --log-file PATH     Also append log records to PATH\n"
              << "  --help              Show this help message\n"
              << "\n"
              << "Examples:\n"
              << "  " << program_name << " --seed 7 \"The Courage to be Disliked\" \"Ichiro Kishimi\"\n"
              << "  " << program_name << " --format png --width 800 --height 1200 \"Journey\"\n";
}

template<typename T>
std::optional<T> parse_number(const std::string& text) {
    T value{};
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
        return std::nullopt;
    }
    return value;
}

int usage_error(const std::string& message) {
    std::cerr << "Error: " << message << "\n"
              << "Try --help for usage.\n";
    return EXIT_USAGE;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    logging::init();
    logging::set_level(LogLevel::Warn);

    cover::CoverRequest request;
    cover::CoverConfig config;
    std::optional<std::string> output;
    std::optional<std::string> premade;
    text::FontChain extra_latin;
    text::FontChain extra_cjk;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return EXIT_OK;
        }
        if (arg == "--genre-palettes") {
            config.genre_palettes = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            positional.push_back(arg);
            continue;
        }

        if (i + 1 >= argc) {
            return usage_error("missing value for " + arg);
        }
        std::string value = argv[++i];

        if (arg == "--width" || arg == "--height") {
            auto number = parse_number<i32>(value);
            if (!number) return usage_error("invalid " + arg + ": " + value);
            (arg == "--width" ? request.width : request.height) = *number;
        } else if (arg == "--subtitle") {
            request.subtitle = value;
        } else if (arg == "--seed") {
            auto number = parse_number<u32>(value);
            if (!number) return usage_error("invalid seed: " + value);
            request.seed = *number;
        } else if (arg == "--output") {
            output = value;
        } else if (arg == "--format") {
            auto format = cover::parse_image_format(value);
            if (!format) return usage_error("unknown format: " + value);
            config.output_format = *format;
        } else if (arg == "--quality") {
            auto number = parse_number<i32>(value);
            if (!number || *number < 1 || *number > 100) {
                return usage_error("quality must be 1-100: " + value);
            }
            config.jpeg_quality = *number;
        } else if (arg == "--stride") {
            auto number = parse_number<i32>(value);
            if (!number || *number < 1) return usage_error("invalid stride: " + value);
            config.gradient_sample_stride = *number;
        } else if (arg == "--font") {
            extra_latin.push_back(value);
        } else if (arg == "--cjk-font") {
            extra_cjk.push_back(value);
        } else if (arg == "--cover") {
            premade = value;
        } else if (arg == "--log-level") {
            auto level = parse_log_level(value);
            if (!level) return usage_error("unknown log level: " + value);
            logging::set_level(*level);
        } else if (arg == "--log-file") {
            auto sink = std::make_unique<FileSink>(value);
            if (!sink->is_open()) return usage_error("cannot open log file: " + value);
            logging::add_sink(std::move(sink));
        } else {
            return usage_error("unknown option " + arg);
        }
    }

    config.latin_fonts.insert(config.latin_fonts.begin(), extra_latin.begin(), extra_latin.end());
    config.cjk_fonts.insert(config.cjk_fonts.begin(), extra_cjk.begin(), extra_cjk.end());

    if (positional.empty() && !premade) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }
    if (positional.size() > 2) {
        return usage_error("too many arguments");
    }
    if (!positional.empty()) {
        request.title = positional[0];
    }
    if (positional.size() == 2) {
        request.author = positional[1];
    }

    cover::CoverEngine engine(config);

    auto image = premade ? engine.load_premade_cover(*premade) : engine.render_encoded(request);
    if (image.is_err()) {
        std::cerr << "Error: " << cover::to_string(image.error().kind) << ": "
                  << image.error().message << "\n";
        logging::shutdown();
        return EXIT_ERROR;
    }

    std::string path = output.value_or(image.value().file_name());
    auto saved = cover::save_image(image.value(), path);
    if (saved.is_err()) {
        std::cerr << "Error: " << saved.error().message << "\n";
        logging::shutdown();
        return EXIT_ERROR;
    }

    std::cout << path << " (" << image.value().media_type() << ", "
              << image.value().bytes.size() << " bytes)\n";

    logging::shutdown();
    return EXIT_OK;
}
