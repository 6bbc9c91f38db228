#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "PathRules.hpp"

namespace sharpmap {

namespace fs = std::filesystem;

enum class SourceEncoding { Utf8, Utf8Bom, Utf16LE, Utf16BE, Windows1252 };

const char* encoding_name(SourceEncoding encoding);

struct SourceText {
    std::string content;  // always UTF-8, BOM removed
    SourceEncoding encoding = SourceEncoding::Utf8;
    std::uintmax_t size = 0;  // bytes on disk
};

struct SourceFile {
    std::string relative_path;  // generic, '/'-separated
    fs::path absolute_path;
    std::uintmax_t size = 0;
    std::string fingerprint;  // "size-mtime"
};

// root-relative path -> fingerprint
using Manifest = std::map<std::string, std::string>;

constexpr std::uintmax_t kDefaultMaxFileBytes = 4 * 1024 * 1024;

class SourceProvider {
public:
    // Throws AnalysisError: NotFound for a missing path or a directory,
    // PermissionDenied when the file cannot be opened, InvalidArgument when
    // it exceeds max_bytes.
    static SourceText read_file(const fs::path& path, std::uintmax_t max_bytes = kDefaultMaxFileBytes);

    // Regular files under root with one of the extensions (dot-less,
    // case-insensitive; empty list admits every file), sorted by relative
    // path. Excluded directories are never entered.
    static std::vector<SourceFile> list_files(const fs::path& root,
                                              const std::vector<std::string>& extensions,
                                              const PathRules& rules);

    static Manifest build_manifest(const std::vector<SourceFile>& files);

    static std::string decode(const std::string& raw, SourceEncoding& detected);

    static std::string calculate_file_hash(const fs::path& file_path);
};

// True when child is root itself or lies below it, after normalisation.
bool is_inside(const fs::path& child, const fs::path& root);

} // namespace sharpmap
