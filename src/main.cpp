#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "errors.h"
#include "preview.h"
#include "render.h"
#include "settings.h"

// ---------------------------------------------------------------------------
// Write the optional PNG preview. Returns false on failure.
// ---------------------------------------------------------------------------
static bool write_preview(const Settings& s, const RenderGrid& grid, std::string& log) {
    std::ostringstream plog;
    std::string font = resolve_font_path(s.font_path);
    auto png = render_preview_png(grid, font, s.cell_px, plog);
    log += plog.str();
    if (png.empty()) {
        std::cerr << "blockart: could not render preview (see --verbose)\n";
        return false;
    }
    std::ofstream out(s.preview_path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(png.data()),
              static_cast<std::streamsize>(png.size()));
    if (!out) {
        std::cerr << "blockart: cannot write " << s.preview_path << "\n";
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> dotenv_keys = load_dotenv();

    Settings settings = settings_from_env();
    std::string error;
    if (!parse_cli_args(argc, argv, settings, error)) {
        std::cerr << "blockart: " << error << "\n\n" << usage_text();
        return 2;
    }
    if (settings.help) {
        std::cout << usage_text();
        return 0;
    }

    RenderResult result;
    try {
        result = render_image_file(settings.image_path, settings.render);
    } catch (const InvalidParameterError& e) {
        std::cerr << "blockart: " << e.what() << "\n";
        return 2;
    } catch (const ImageLoadError& e) {
        std::cerr << "blockart: " << e.what() << "\n";
        return 1;
    }

    std::cout << result.grid.text() << "\n";

    int status = 0;
    if (!settings.preview_path.empty()) {
        try {
            if (!write_preview(settings, result.grid, result.log)) status = 1;
        } catch (const InvalidParameterError& e) {
            std::cerr << "blockart: " << e.what() << "\n";
            status = 2;
        }
    }

    if (settings.verbose) {
        if (!dotenv_keys.empty()) {
            std::cerr << "Config: .env set";
            for (const auto& k : dotenv_keys) std::cerr << " " << k;
            std::cerr << "\n";
        }
        std::cerr << result.log;
    }
    return status;
}
