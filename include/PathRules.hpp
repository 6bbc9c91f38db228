#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace sharpmap {

enum PathFlag : uint8_t {
    NONE = 0,
    IGNORE = 1 << 0,
    INCLUDE = 1 << 1  // Overrides IGNORE
};

// Exclusion and exception rules for the source tree. A rule is one of:
//   "bin"          a bare name, matches that segment at any depth
//   "src/Legacy"   a root-relative prefix (contains '/')
//   "*.g.cs"       a glob on a single segment ('*' matches any run)
class PathRules {
    struct Node {
        std::unordered_map<std::string, std::unique_ptr<Node>> children;
        uint8_t flags = PathFlag::NONE;
    };

    struct SegmentRule {
        std::string pattern;
        bool glob = false;
        PathFlag flag = PathFlag::NONE;
    };

    std::unique_ptr<Node> root_;
    std::vector<SegmentRule> segment_rules_;

public:
    PathRules() : root_(std::make_unique<Node>()) {}
    PathRules(const std::vector<std::string>& ignored, const std::vector<std::string>& included);

    PathRules(PathRules&&) = default;
    PathRules& operator=(PathRules&&) = default;

    void insert(const std::string& rule, PathFlag flag);

    // Most specific rule for the root-relative path, as PathFlag bits.
    uint8_t check(const std::filesystem::path& rel_path) const;

    bool is_excluded(const std::filesystem::path& rel_path) const {
        uint8_t f = check(rel_path);
        return (f & PathFlag::IGNORE) && !(f & PathFlag::INCLUDE);
    }

    // A directory is entered when it is not excluded, or when an
    // INCLUDE prefix lies somewhere below it.
    bool should_descend(const std::filesystem::path& rel_dir) const;

    void clear() {
        root_ = std::make_unique<Node>();
        segment_rules_.clear();
    }

    static bool glob_match(const std::string& pattern, const std::string& text);
};

} // namespace sharpmap
