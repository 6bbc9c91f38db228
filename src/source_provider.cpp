#include "source_provider.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <spdlog/spdlog.h>
#include "errors.hpp"

namespace sharpmap {

namespace {

// Windows-1252 code points for bytes 0x80..0x9F. Undefined slots map to
// the C1 control of the same value, as Latin-1 would.
const uint16_t kCp1252High[32] = {
    0x20AC, 0x0081, 0x201A, 0x0192, 0x201E, 0x2026, 0x2020, 0x2021,
    0x02C6, 0x2030, 0x0160, 0x2039, 0x0152, 0x008D, 0x017D, 0x008F,
    0x0090, 0x2018, 0x2019, 0x201C, 0x201D, 0x2022, 0x2013, 0x2014,
    0x02DC, 0x2122, 0x0161, 0x203A, 0x0153, 0x009D, 0x017E, 0x0178};

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    while (i < n) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        size_t extra;
        uint32_t cp;
        if (c < 0x80) { ++i; continue; }
        if ((c & 0xE0) == 0xC0) { extra = 1; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { extra = 2; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { extra = 3; cp = c & 0x07; }
        else return false;
        if (i + extra >= n) return false;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000)) return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return false;
        i += extra + 1;
    }
    return true;
}

std::string decode_utf16(const std::string& raw, size_t offset, bool little_endian) {
    std::string out;
    out.reserve(raw.size());
    auto unit_at = [&](size_t i) -> uint32_t {
        unsigned char a = static_cast<unsigned char>(raw[i]);
        unsigned char b = static_cast<unsigned char>(raw[i + 1]);
        return little_endian ? (a | (b << 8)) : ((a << 8) | b);
    };
    size_t i = offset;
    while (i + 1 < raw.size()) {
        uint32_t unit = unit_at(i);
        i += 2;
        if (unit >= 0xD800 && unit <= 0xDBFF && i + 1 < raw.size()) {
            uint32_t low = unit_at(i);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                i += 2;
                append_utf8(out, 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00));
                continue;
            }
        }
        if (unit >= 0xD800 && unit <= 0xDFFF) unit = 0xFFFD;
        append_utf8(out, unit);
    }
    return out;
}

std::string normalize_extension(std::string ext) {
    if (!ext.empty() && ext[0] == '.') ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

void scan_directory_recursive(const fs::path& current_dir,
                              const fs::path& root_dir,
                              const std::unordered_set<std::string>& ext_set,
                              const PathRules& rules,
                              std::vector<SourceFile>& results) {
    std::error_code ec;
    fs::directory_iterator it(current_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        spdlog::warn("⚠️  Cannot list {}: {}", current_dir.string(), ec.message());
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            spdlog::warn("⚠️  Listing interrupted at {}: {}", current_dir.string(), ec.message());
            break;
        }
        const auto& entry = *it;
        const fs::path& path = entry.path();
        fs::path rel = path.lexically_relative(root_dir);
        std::error_code type_ec;

        if (entry.is_directory(type_ec)) {
            if (entry.is_symlink(type_ec)) continue;
            if (!rules.should_descend(rel)) {
                spdlog::debug("DIR  | {} | SKIP", rel.generic_string());
                continue;
            }
            scan_directory_recursive(path, root_dir, ext_set, rules, results);
            continue;
        }
        if (!entry.is_regular_file(type_ec)) continue;
        if (rules.is_excluded(rel)) {
            spdlog::debug("FILE | {} | SKIP (excluded)", rel.generic_string());
            continue;
        }
        if (!ext_set.empty() && !ext_set.count(normalize_extension(path.extension().string()))) continue;

        SourceFile file;
        file.relative_path = rel.generic_string();
        file.absolute_path = path;
        file.size = entry.file_size(type_ec);
        if (type_ec) file.size = 0;
        file.fingerprint = SourceProvider::calculate_file_hash(path);
        results.push_back(std::move(file));
    }
}

} // namespace

const char* encoding_name(SourceEncoding encoding) {
    switch (encoding) {
        case SourceEncoding::Utf8: return "utf-8";
        case SourceEncoding::Utf8Bom: return "utf-8-bom";
        case SourceEncoding::Utf16LE: return "utf-16le";
        case SourceEncoding::Utf16BE: return "utf-16be";
        case SourceEncoding::Windows1252: return "windows-1252";
    }
    return "utf-8";
}

bool is_inside(const fs::path& child, const fs::path& root) {
    auto c = child.lexically_normal();
    auto p = root.lexically_normal();
    auto it_c = c.begin();
    for (auto it_p = p.begin(); it_p != p.end(); ++it_p) {
        if (it_p->empty() || it_p->string() == ".") continue;
        if (it_c == c.end() || *it_c != *it_p) return false;
        ++it_c;
    }
    return true;
}

std::string SourceProvider::decode(const std::string& raw, SourceEncoding& detected) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(raw[i]); };
    if (raw.size() >= 3 && byte(0) == 0xEF && byte(1) == 0xBB && byte(2) == 0xBF) {
        detected = SourceEncoding::Utf8Bom;
        return raw.substr(3);
    }
    if (raw.size() >= 2 && byte(0) == 0xFF && byte(1) == 0xFE) {
        detected = SourceEncoding::Utf16LE;
        return decode_utf16(raw, 2, true);
    }
    if (raw.size() >= 2 && byte(0) == 0xFE && byte(1) == 0xFF) {
        detected = SourceEncoding::Utf16BE;
        return decode_utf16(raw, 2, false);
    }
    if (is_valid_utf8(raw)) {
        detected = SourceEncoding::Utf8;
        return raw;
    }

    detected = SourceEncoding::Windows1252;
    std::string out;
    out.reserve(raw.size() + raw.size() / 4);
    for (char ch : raw) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80) out += ch;
        else if (c < 0xA0) append_utf8(out, kCp1252High[c - 0x80]);
        else append_utf8(out, c);
    }
    return out;
}

SourceText SourceProvider::read_file(const fs::path& path, std::uintmax_t max_bytes) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        if (ec == std::errc::permission_denied) {
            throw AnalysisError(ErrorCode::PermissionDenied, "Permission denied: " + path.string(), path.string());
        }
        throw AnalysisError(ErrorCode::NotFound, "File not found: " + path.string(), path.string());
    }
    if (!fs::is_regular_file(status)) {
        throw AnalysisError(ErrorCode::NotFound, "Not a regular file: " + path.string(), path.string());
    }

    SourceText text;
    text.size = fs::file_size(path, ec);
    if (!ec && max_bytes > 0 && text.size > max_bytes) {
        throw AnalysisError(ErrorCode::InvalidArgument,
            "File too large (" + std::to_string(text.size) + " bytes): " + path.string(), path.string());
    }

    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f) {
        throw AnalysisError(ErrorCode::PermissionDenied, "Cannot open file: " + path.string(), path.string());
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    std::string raw = buffer.str();
    text.size = raw.size();
    text.content = decode(raw, text.encoding);
    return text;
}

std::vector<SourceFile> SourceProvider::list_files(const fs::path& root,
                                                   const std::vector<std::string>& extensions,
                                                   const PathRules& rules) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw AnalysisError(ErrorCode::NotFound, "Directory not found: " + root.string(), root.string());
    }

    std::unordered_set<std::string> ext_set;
    for (const auto& ext : extensions) {
        std::string clean = normalize_extension(ext);
        if (!clean.empty()) ext_set.insert(clean);
    }

    std::vector<SourceFile> results;
    scan_directory_recursive(root, root, ext_set, rules, results);
    std::sort(results.begin(), results.end(),
        [](const SourceFile& a, const SourceFile& b) { return a.relative_path < b.relative_path; });
    return results;
}

Manifest SourceProvider::build_manifest(const std::vector<SourceFile>& files) {
    Manifest manifest;
    for (const auto& f : files) manifest[f.relative_path] = f.fingerprint;
    return manifest;
}

std::string SourceProvider::calculate_file_hash(const fs::path& file_path) {
    std::error_code ec;
    auto size = fs::file_size(file_path, ec);
    if (ec) return "err";
    auto time = fs::last_write_time(file_path, ec);
    if (ec) return "err";
    return std::to_string(size) + "-" + std::to_string(time.time_since_epoch().count());
}

} // namespace sharpmap
