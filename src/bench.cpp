#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <httplib.h>

#include "errors.h"
#include "preview.h"
#include "render.h"
#include "settings.h"

// Escape a UTF-8 string for a JSON string literal. Multi-byte sequences
// pass through; other control bytes become \u00XX.
static std::string json_escape(const std::string& s) {
    static const char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(s.size() + 16);
    for (unsigned char c : s) {
        if (c == '"' || c == '\\') {
            out += '\\';
            out += static_cast<char>(c);
        } else if (c == '\n') {
            out += "\\n";
        } else if (c < 0x20) {
            out += "\\u00";
            out += HEX[c >> 4];
            out += HEX[c & 0xF];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

static std::string json_error(const std::string& msg) {
    return "{\"error\":\"" + json_escape(msg) + "\"}";
}

// Form field from a multipart body, falling back to the query string.
static std::string form_value(const httplib::Request& req, const char* name) {
    if (req.has_file(name)) return req.get_file_value(name).content;
    if (req.has_param(name)) return req.get_param_value(name);
    return {};
}

// Read lines/contrast/brightness from the request over the env defaults.
// Returns false and sets `error` if a supplied value does not parse.
static bool request_params(const httplib::Request& req, RenderParams& p, std::string& error) {
    std::string v;
    if (!(v = form_value(req, "lines")).empty() && !parse_int(v, p.lines)) {
        error = "invalid lines: '" + v + "'";
        return false;
    }
    if (!(v = form_value(req, "contrast")).empty() && !parse_float(v, p.contrast)) {
        error = "invalid contrast: '" + v + "'";
        return false;
    }
    if (!(v = form_value(req, "brightness")).empty() && !parse_float(v, p.brightness)) {
        error = "invalid brightness: '" + v + "'";
        return false;
    }
    return true;
}

// Shared request handling: decode the upload and render it. On failure the
// response is filled in and false is returned.
static bool render_request(const httplib::Request& req, httplib::Response& res,
                           RenderResult& result) {
    if (!req.has_file("image")) {
        res.status = 400;
        res.set_content(json_error("no image field"), "application/json");
        return false;
    }
    RenderParams params = settings_from_env().render;
    std::string error;
    if (!request_params(req, params, error)) {
        res.status = 400;
        res.set_content(json_error(error), "application/json");
        return false;
    }

    const auto& file = req.get_file_value("image");
    std::vector<uint8_t> buf(file.content.begin(), file.content.end());
    try {
        result = render_image_data(buf, params);
    } catch (const InvalidParameterError& e) {
        res.status = 400;
        res.set_content(json_error(e.what()), "application/json");
        return false;
    } catch (const ImageLoadError& e) {
        res.status = 422;
        res.set_content(json_error(e.what()), "application/json");
        return false;
    }
    return true;
}

static const char* HTML = R"html(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="utf-8">
<title>blockart bench</title>
<style>
*{margin:0;padding:0;box-sizing:border-box}
body{
  font-family:-apple-system,BlinkMacSystemFont,'Segoe UI',system-ui,sans-serif;
  background:#1a1a2e;color:#e0e0e0;min-height:100vh;padding:24px;
}
h1{font-size:1.4rem;margin-bottom:20px;color:#fff;font-weight:600}
.panel{background:#16213e;border-radius:12px;padding:20px;border:1px solid #2a2a4a;margin-bottom:20px}
label{font-size:.8rem;color:#888;margin-right:12px}
input[type=number]{width:80px;background:#0d1117;color:#ccc;border:1px solid #333;border-radius:4px;padding:2px 6px}
.btn{background:#333;border:1px solid #555;color:#ccc;padding:4px 12px;border-radius:6px;cursor:pointer}
#output{
  font-family:'DejaVu Sans Mono','SF Mono',monospace;line-height:1;white-space:pre;
  background:#000;color:#fff;padding:12px;border-radius:8px;overflow:auto;
}
#log{
  font-size:.75rem;color:#8b8;font-family:'SF Mono','Fira Code',monospace;
  background:#0d1117;border-radius:8px;padding:8px;white-space:pre-wrap;margin-top:12px;
}
#preview{max-width:100%;margin-top:12px;display:none}
</style>
</head>
<body>
<h1>blockart bench</h1>
<div class="panel">
  <form id="form">
    <input type="file" name="image" accept="image/*" required>
    <label>lines <input type="number" name="lines" value="40" min="1"></label>
    <label>contrast <input type="number" name="contrast" value="1.0" step="0.1"></label>
    <label>brightness <input type="number" name="brightness" value="0.0" step="0.05"></label>
    <button class="btn" type="submit">Render</button>
    <button class="btn" type="button" id="preview-btn">Preview PNG</button>
  </form>
</div>
<div class="panel">
  <div id="output"></div>
  <div id="log"></div>
  <img id="preview" alt="preview">
</div>
<script>
const form=document.getElementById('form');
form.addEventListener('submit',async e=>{
  e.preventDefault();
  const r=await fetch('/render',{method:'POST',body:new FormData(form)});
  const j=await r.json();
  document.getElementById('output').textContent=j.text||'';
  document.getElementById('log').textContent=j.error?('Error: '+j.error):j.log;
});
document.getElementById('preview-btn').addEventListener('click',async()=>{
  const r=await fetch('/preview',{method:'POST',body:new FormData(form)});
  const img=document.getElementById('preview');
  if(!r.ok){document.getElementById('log').textContent='Error: '+(await r.json()).error;return}
  img.src=URL.createObjectURL(await r.blob());img.style.display='block';
});
</script>
</body>
</html>
)html";

int main() {
    for (const auto& key : load_dotenv())
        std::cout << "Loaded " << key << " from .env\n";

    httplib::Server svr;

    svr.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(HTML, "text/html; charset=utf-8");
    });

    svr.Post("/render", [](const httplib::Request& req, httplib::Response& res) {
        RenderResult result;
        if (!render_request(req, res, result)) return;
        std::string json = "{\"text\":\"" + json_escape(result.grid.text()) + "\"";
        json += ",\"lines\":" + std::to_string(result.grid.lines);
        json += ",\"columns\":" + std::to_string(result.grid.columns);
        json += ",\"log\":\"" + json_escape(result.log) + "\"}";
        res.set_content(json, "application/json; charset=utf-8");
    });

    svr.Post("/preview", [](const httplib::Request& req, httplib::Response& res) {
        RenderResult result;
        if (!render_request(req, res, result)) return;
        std::ostringstream log;
        auto png = render_preview_png(result.grid, resolve_font_path(""), 8, log);
        if (png.empty()) {
            res.status = 500;
            res.set_content(json_error(log.str()), "application/json");
            return;
        }
        res.set_content(std::string(png.begin(), png.end()), "image/png");
    });

    const char* port_env = std::getenv("PORT");
    int port = 8080;
    if (port_env && !parse_int(port_env, port)) {
        std::cerr << "Invalid PORT '" << port_env << "'\n";
        return 1;
    }

    std::cout << "blockart bench -> http://localhost:" << port << "\n";

    if (!svr.listen("127.0.0.1", port)) {
        std::cerr << "Failed to bind to port " << port << "\n";
        return 1;
    }
}
