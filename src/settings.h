#pragma once

#include <string>
#include <vector>

#include "render.h"

// Everything one CLI invocation needs.
struct Settings {
    std::string image_path;
    RenderParams render;
    std::string preview_path;  // empty = no preview
    std::string font_path;     // empty = resolve_font_path() default
    int cell_px = 8;
    bool verbose = false;
    bool help = false;
};

// Read BLOCKART_* and PORT entries (KEY=VALUE, optional `export`, optional
// quotes) from a .env file into the environment. Variables that are already
// set win. Other keys are ignored. A missing file is not an error. Returns
// the keys that were set.
std::vector<std::string> load_dotenv(const std::string& path = ".env");

// Defaults overlaid with BLOCKART_* environment variables. Values that do
// not parse are ignored.
Settings settings_from_env();

// Overlay command-line arguments onto `s`. Returns false and sets `error`
// on an unknown flag, a missing or malformed value, or a missing image path
// (unless --help was given).
bool parse_cli_args(int argc, const char* const argv[], Settings& s, std::string& error);

const char* usage_text();

// Strict numeric parsing: the whole string must be consumed.
bool parse_int(const std::string& text, int& out);
bool parse_float(const std::string& text, float& out);
