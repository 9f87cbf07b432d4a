#include "settings.h"

#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>

bool parse_int(const std::string& text, int& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < INT_MIN || v > INT_MAX) return false;
    out = static_cast<int>(v);
    return true;
}

bool parse_float(const std::string& text, float& out) {
    if (text.empty()) return false;
    errno = 0;
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (errno != 0 || *end != '\0' || !std::isfinite(v)) return false;
    out = static_cast<float>(v);
    return true;
}

static std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

static bool is_blockart_key(const std::string& key) {
    return key.compare(0, 9, "BLOCKART_") == 0 || key == "PORT";
}

std::vector<std::string> load_dotenv(const std::string& path) {
    std::vector<std::string> applied;
    std::ifstream f(path);
    std::string raw;
    while (std::getline(f, raw)) {
        std::string line = trim(raw);
        if (line.empty() || line[0] == '#') continue;
        if (line.compare(0, 7, "export ") == 0) line = trim(line.substr(7));
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        if (!is_blockart_key(key)) continue;
        if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
            val.back() == val.front())
            val = val.substr(1, val.size() - 2);
        if (std::getenv(key.c_str())) continue;
        if (setenv(key.c_str(), val.c_str(), 0) == 0) applied.push_back(key);
    }
    return applied;
}

Settings settings_from_env() {
    Settings s;
    if (const char* v = std::getenv("BLOCKART_LINES")) parse_int(v, s.render.lines);
    if (const char* v = std::getenv("BLOCKART_CONTRAST")) parse_float(v, s.render.contrast);
    if (const char* v = std::getenv("BLOCKART_BRIGHTNESS")) parse_float(v, s.render.brightness);
    if (const char* v = std::getenv("BLOCKART_THREADS")) parse_int(v, s.render.threads);
    if (const char* v = std::getenv("BLOCKART_VERBOSE"))
        s.verbose = std::string(v) == "1" || std::string(v) == "true";
    return s;
}

const char* usage_text() {
    return
        "Usage: blockart <image> [options]\n"
        "\n"
        "Convert an image to Unicode block characters by quadrant best-fit matching.\n"
        "\n"
        "Options:\n"
        "  --lines N          output height in lines (default 40)\n"
        "  --contrast F       contrast boost strength (default 1.0)\n"
        "  --brightness F     brightness shift applied before alpha compositing\n"
        "                     (negative darkens, positive lightens; default 0.0)\n"
        "  --threads N        worker threads, 0 = all cores (default 0)\n"
        "  --preview FILE     also write a PNG rendering of the output\n"
        "  --font FILE        font for --preview (default: DejaVu Sans Mono)\n"
        "  --cell-size PX     preview cell width in pixels (default 8)\n"
        "  --verbose          print the stage log to stderr\n"
        "  -h, --help         show this help\n"
        "\n"
        "Environment: BLOCKART_LINES, BLOCKART_CONTRAST, BLOCKART_BRIGHTNESS,\n"
        "BLOCKART_THREADS, BLOCKART_VERBOSE, BLOCKART_FONT (also read from .env).\n";
}

bool parse_cli_args(int argc, const char* const argv[], Settings& s, std::string& error) {
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string value;
        bool has_inline = false;

        // --flag=value
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            auto eq = arg.find('=');
            if (eq != std::string::npos) {
                value = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
                has_inline = true;
            }
        }

        auto take_value = [&]() -> bool {
            if (has_inline) return true;
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            value = argv[++i];
            return true;
        };
        auto bad_value = [&]() {
            error = "invalid value for " + arg + ": '" + value + "'";
            return false;
        };

        if (arg == "-h" || arg == "--help") {
            s.help = true;
        } else if (arg == "--verbose") {
            s.verbose = true;
        } else if (arg == "--lines") {
            if (!take_value()) return false;
            if (!parse_int(value, s.render.lines)) return bad_value();
        } else if (arg == "--contrast") {
            if (!take_value()) return false;
            if (!parse_float(value, s.render.contrast)) return bad_value();
        } else if (arg == "--brightness") {
            if (!take_value()) return false;
            if (!parse_float(value, s.render.brightness)) return bad_value();
        } else if (arg == "--threads") {
            if (!take_value()) return false;
            if (!parse_int(value, s.render.threads) || s.render.threads < 0) return bad_value();
        } else if (arg == "--preview") {
            if (!take_value()) return false;
            s.preview_path = value;
        } else if (arg == "--font") {
            if (!take_value()) return false;
            s.font_path = value;
        } else if (arg == "--cell-size") {
            if (!take_value()) return false;
            if (!parse_int(value, s.cell_px)) return bad_value();
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "unknown option " + arg;
            return false;
        } else if (s.image_path.empty()) {
            s.image_path = arg;
        } else {
            error = "unexpected argument '" + arg + "'";
            return false;
        }
    }

    if (!s.help && s.image_path.empty()) {
        error = "missing image path";
        return false;
    }
    return true;
}
