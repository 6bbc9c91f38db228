#include "solution_index.hpp"
#include <algorithm>

namespace sharpmap {

using json = nlohmann::json;

json ProjectInfo::to_json() const {
    return json{{"name", name}, {"path", path}, {"directory", directory}};
}

json IndexStats::to_json() const {
    return json{
        {"total_files", files},
        {"total_classes", classes},
        {"total_interfaces", interfaces},
        {"total_enums", enums},
        {"total_records", records},
        {"total_structs", structs},
        {"total_methods", methods},
        {"total_properties", properties},
        {"total_fields", fields},
        {"total_lines", total_lines},
        {"code_lines", code_lines}
    };
}

json FileWarning::to_json() const {
    json j = warning.to_json();
    j["file"] = file;
    return j;
}

const std::vector<DeclarationRef>& SolutionIndex::of_kind(ElementKind kind) const {
    static const std::vector<DeclarationRef> none;
    auto it = by_kind.find(kind);
    return it == by_kind.end() ? none : it->second;
}

std::vector<DeclarationRef> SolutionIndex::find_by_name(const std::string& name) const {
    std::vector<DeclarationRef> hits;
    for (size_t f = 0; f < files.size(); ++f) {
        const auto& decls = files[f].document.declarations;
        for (size_t d = 0; d < decls.size(); ++d) {
            if (decls[d].name == name) hits.push_back({f, d});
        }
    }
    return hits;
}

std::optional<size_t> SolutionIndex::find_file(const std::string& relative_path) const {
    auto it = std::lower_bound(files.begin(), files.end(), relative_path,
        [](const IndexedFile& f, const std::string& path) { return f.relative_path < path; });
    if (it == files.end() || it->relative_path != relative_path) return std::nullopt;
    return static_cast<size_t>(it - files.begin());
}

void SolutionIndex::rebuild() {
    by_namespace.clear();
    by_kind.clear();
    stats = IndexStats{};
    stats.files = files.size();

    for (size_t f = 0; f < files.size(); ++f) {
        const auto& doc = files[f].document;
        stats.total_lines += static_cast<size_t>(doc.metrics.total_lines);
        stats.code_lines += static_cast<size_t>(doc.metrics.code_lines);

        // Declarations are already in span order within a file.
        for (size_t d = 0; d < doc.declarations.size(); ++d) {
            const auto& decl = doc.declarations[d];
            by_namespace[decl.namespace_name].push_back({f, d});
            by_kind[decl.element_kind].push_back({f, d});

            switch (decl.kind) {
                case TypeKind::Class: ++stats.classes; break;
                case TypeKind::Interface: ++stats.interfaces; break;
                case TypeKind::Enum: ++stats.enums; break;
                case TypeKind::Record: ++stats.records; break;
                case TypeKind::Struct: ++stats.structs; break;
            }
            stats.methods += decl.count_members(MemberKind::Method);
            stats.properties += decl.count_members(MemberKind::Property);
            stats.fields += decl.count_members(MemberKind::Field);
        }
    }
}

} // namespace sharpmap
