#include "PathRules.hpp"

namespace sharpmap {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_segments(const fs::path& path) {
    std::vector<std::string> parts;
    for (const auto& part : path.lexically_normal()) {
        std::string segment = part.generic_string();
        if (segment == "." || segment.empty() || segment == "/") continue;
        parts.push_back(segment);
    }
    return parts;
}

} // namespace

PathRules::PathRules(const std::vector<std::string>& ignored, const std::vector<std::string>& included)
    : PathRules() {
    for (const auto& p : ignored) insert(p, PathFlag::IGNORE);
    for (const auto& p : included) insert(p, PathFlag::INCLUDE);
}

void PathRules::insert(const std::string& rule, PathFlag flag) {
    std::string clean = rule;
    for (auto& c : clean) if (c == '\\') c = '/';
    while (!clean.empty() && clean.back() == '/') clean.pop_back();
    while (clean.rfind("./", 0) == 0) clean.erase(0, 2);
    if (clean.empty()) return;

    if (clean.find('/') == std::string::npos) {
        segment_rules_.push_back({clean, clean.find('*') != std::string::npos, flag});
        return;
    }

    Node* current = root_.get();
    for (const auto& segment : split_segments(fs::path(clean))) {
        auto& child = current->children[segment];
        if (!child) child = std::make_unique<Node>();
        current = child.get();
    }
    current->flags |= flag;
}

uint8_t PathRules::check(const fs::path& rel_path) const {
    uint8_t accumulated = PathFlag::NONE;
    const auto segments = split_segments(rel_path);

    for (const auto& segment : segments) {
        for (const auto& rule : segment_rules_) {
            bool hit = rule.glob ? glob_match(rule.pattern, segment) : rule.pattern == segment;
            if (hit) accumulated |= rule.flag;
        }
    }

    // Prefix rules: the deepest flagged node decides. A parent that is
    // ignored keeps its children ignored unless one is explicitly included.
    const Node* current = root_.get();
    uint8_t prefix_flags = PathFlag::NONE;
    for (const auto& segment : segments) {
        auto it = current->children.find(segment);
        if (it == current->children.end()) break;
        current = it->second.get();
        if (current->flags != PathFlag::NONE) prefix_flags = current->flags;
    }
    if (prefix_flags & PathFlag::INCLUDE) return PathFlag::INCLUDE;
    return accumulated | prefix_flags;
}

bool PathRules::should_descend(const fs::path& rel_dir) const {
    if (!is_excluded(rel_dir)) return true;

    const Node* current = root_.get();
    for (const auto& segment : split_segments(rel_dir)) {
        auto it = current->children.find(segment);
        if (it == current->children.end()) return false;
        current = it->second.get();
    }
    // Bridge: any INCLUDE node strictly below this directory.
    std::vector<const Node*> stack;
    for (const auto& [name, child] : current->children) stack.push_back(child.get());
    while (!stack.empty()) {
        const Node* n = stack.back();
        stack.pop_back();
        if (n->flags & PathFlag::INCLUDE) return true;
        for (const auto& [name, child] : n->children) stack.push_back(child.get());
    }
    return false;
}

bool PathRules::glob_match(const std::string& pattern, const std::string& text) {
    size_t p = 0, t = 0;
    size_t star = std::string::npos, mark = 0;
    while (t < text.size()) {
        if (p < pattern.size() && (pattern[p] == '?' || pattern[p] == text[t])) {
            ++p;
            ++t;
        } else if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            mark = t;
        } else if (star != std::string::npos) {
            p = star + 1;
            t = ++mark;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

} // namespace sharpmap
