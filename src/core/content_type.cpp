/**
 * @file content_type.cpp
 * @brief MIME type detection tables
 */

#include "kcenon/streamup/core/content_type.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <unordered_map>

namespace kcenon::streamup {

namespace {

constexpr std::string_view default_content_type = "application/octet-stream";

// Web types checked before the general table
const std::unordered_map<std::string, std::string>& custom_types() {
    static const std::unordered_map<std::string, std::string> types = {
        {".json", "application/json"},
        {".jsonld", "application/ld+json"},
        {".map", "application/json"},
        {".webp", "image/webp"},
        {".woff", "font/woff"},
        {".woff2", "font/woff2"},
        {".ttf", "font/ttf"},
        {".otf", "font/otf"},
        {".eot", "application/vnd.ms-fontobject"},
        {".md", "text/markdown"},
        {".markdown", "text/markdown"},
        {".yml", "text/yaml"},
        {".yaml", "text/yaml"},
        {".toml", "application/toml"},
        {".ts", "application/typescript"},
        {".tsx", "application/typescript"},
        {".mjs", "application/javascript"},
        {".cjs", "application/javascript"},
        {".pbf", "application/octet-stream"},
        {".br", "application/x-br"},
        {".zst", "application/zstd"},
    };
    return types;
}

const std::unordered_map<std::string, std::string>& standard_types() {
    static const std::unordered_map<std::string, std::string> types = {
        {".txt", "text/plain"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".csv", "text/csv"},
        {".js", "text/javascript"},
        {".xml", "text/xml"},
        {".svg", "image/svg+xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".wasm", "application/wasm"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".avif", "image/avif"},
        {".ico", "image/vnd.microsoft.icon"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".flac", "audio/flac"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
        {".mov", "video/quicktime"},
    };
    return types;
}

auto lower_extension(std::string_view name) -> std::string {
    auto slash = name.find_last_of("/\\");
    auto base = slash == std::string_view::npos ? name : name.substr(slash + 1);
    auto dot = base.rfind('.');
    if (dot == std::string_view::npos) {
        return {};
    }
    std::string ext(base.substr(dot));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

}  // namespace

auto detect_content_type(std::string_view name) -> std::string {
    auto ext = lower_extension(name);
    if (ext.empty()) {
        return std::string(default_content_type);
    }

    if (auto it = custom_types().find(ext); it != custom_types().end()) {
        return it->second;
    }
    if (auto it = standard_types().find(ext); it != standard_types().end()) {
        return it->second;
    }
    return std::string(default_content_type);
}

auto detect_content_encoding(std::string_view name) -> std::string {
    auto ext = lower_extension(name);
    if (ext == ".gz" || ext == ".gzip") {
        return "gzip";
    }
    if (ext == ".br") {
        return "br";
    }
    if (ext == ".zst") {
        return "zstd";
    }
    return {};
}

auto should_compress(std::string_view content_type) -> bool {
    static constexpr std::array<std::string_view, 7> prefixes = {
        "text/",
        "application/json",
        "application/javascript",
        "application/xml",
        "application/xhtml+xml",
        "application/ld+json",
        "image/svg+xml",
    };
    return std::any_of(prefixes.begin(), prefixes.end(),
                       [&](std::string_view p) { return content_type.starts_with(p); });
}

}  // namespace kcenon::streamup
