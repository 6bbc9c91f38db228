#include "tools/AnalysisTools.hpp"
#include <spdlog/spdlog.h>

namespace sharpmap {

using json = nlohmann::json;

namespace {

std::string required_string(const json& args, const char* key) {
    if (!args.contains(key) || args.at(key).is_null()) {
        throw AnalysisError(ErrorCode::InvalidArgument, std::string("Missing argument '") + key + "'");
    }
    if (!args.at(key).is_string()) {
        throw AnalysisError(ErrorCode::InvalidArgument, std::string("Argument '") + key + "' must be a string");
    }
    return args.at(key).get<std::string>();
}

std::string optional_string(const json& args, const char* key, const std::string& fallback) {
    if (!args.contains(key) || args.at(key).is_null()) return fallback;
    return required_string(args, key);
}

json object_schema(json properties, std::vector<std::string> required) {
    return json{{"type", "object"}, {"properties", std::move(properties)}, {"required", std::move(required)}};
}

} // namespace

json AnalysisTool::execute(const json& args, const CancellationToken* cancel) {
    const std::string name = get_metadata().name;
    try {
        if (!args.is_object()) {
            throw AnalysisError(ErrorCode::InvalidArgument, "Arguments must be a JSON object");
        }
        return success_record(run(args, cancel));
    } catch (const AnalysisError& e) {
        spdlog::warn("⚠️  {} failed [{}]: {}", name, error_code_name(e.code()), e.what());
        return error_record(e.code(), e.what());
    } catch (const json::exception& e) {
        spdlog::warn("⚠️  {} rejected its arguments: {}", name, e.what());
        return error_record(ErrorCode::InvalidArgument, std::string("Invalid JSON parameters: ") + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("❌ {} hit a filesystem error: {}", name, e.what());
        ErrorCode code = e.code() == std::errc::permission_denied ? ErrorCode::PermissionDenied : ErrorCode::NotFound;
        return error_record(code, e.what());
    }
}

// --- find_class ---

ToolMetadata FindClassTool::get_metadata() {
    return {"find_class",
            "Finds a C# class by name. 'direct' looks only at files named after the class; "
            "'deep' scans the whole tree and returns every declaration with that name.",
            object_schema({
                {"root", {{"type", "string"}, {"description", "Project root directory"}}},
                {"class_name", {{"type", "string"}}},
                {"search_type", {{"type", "string"}, {"enum", {"direct", "deep"}}, {"default", "direct"}}}
            }, {"root", "class_name"})};
}

json FindClassTool::run(const json& args, const CancellationToken* cancel) {
    std::string mode_text = optional_string(args, "search_type", "direct");
    auto mode = parse_search_mode(mode_text);
    if (!mode) {
        throw AnalysisError(ErrorCode::InvalidArgument, "Unknown search_type '" + mode_text + "' (expected direct or deep)");
    }
    return engine_->find_class(required_string(args, "root"), required_string(args, "class_name"),
                               *mode, cancel).to_json();
}

// --- find_elements ---

ToolMetadata FindElementsTool::get_metadata() {
    return {"find_elements",
            "Lists declarations of one kind (dto, service, controller, interface, enum, generic_class) "
            "whose name contains element_name, case-insensitively.",
            object_schema({
                {"root", {{"type", "string"}}},
                {"element_type", {{"type", "string"},
                    {"enum", {"dto", "service", "controller", "interface", "enum", "generic_class", "class"}}}},
                {"element_name", {{"type", "string"}, {"default", ""}}}
            }, {"root", "element_type"})};
}

json FindElementsTool::run(const json& args, const CancellationToken* cancel) {
    std::string kind_text = required_string(args, "element_type");
    auto kind = parse_element_kind(kind_text);
    if (!kind) {
        throw AnalysisError(ErrorCode::InvalidArgument, "Unknown element_type '" + kind_text + "'");
    }
    return engine_->find_elements(required_string(args, "root"), *kind,
                                  optional_string(args, "element_name", ""), cancel).to_json();
}

// --- get_file_with_analysis ---

ToolMetadata GetFileWithAnalysisTool::get_metadata() {
    return {"get_file_with_analysis",
            "Reads one file under root and returns its content with the structural analysis.",
            object_schema({
                {"root", {{"type", "string"}}},
                {"file_path", {{"type", "string"}, {"description", "Path relative to root"}}}
            }, {"root", "file_path"})};
}

json GetFileWithAnalysisTool::run(const json& args, const CancellationToken* cancel) {
    if (cancel && cancel->is_cancelled()) {
        throw AnalysisError(ErrorCode::Cancelled, "Request cancelled before the file was read");
    }
    return engine_->get_file_with_analysis(required_string(args, "root"), required_string(args, "file_path")).to_json();
}

// --- get_solution_structure ---

ToolMetadata GetSolutionStructureTool::get_metadata() {
    return {"get_solution_structure",
            "Summarises the whole tree: namespaces, element counts, file categories and projects.",
            object_schema({{"root", {{"type", "string"}}}}, {"root"})};
}

json GetSolutionStructureTool::run(const json& args, const CancellationToken* cancel) {
    return engine_->get_solution_structure(required_string(args, "root"), cancel).to_json();
}

void register_analysis_tools(ToolRegistry& registry, std::shared_ptr<SearchEngine> engine) {
    registry.register_tool(std::make_unique<FindClassTool>(engine));
    registry.register_tool(std::make_unique<FindElementsTool>(engine));
    registry.register_tool(std::make_unique<GetFileWithAnalysisTool>(engine));
    registry.register_tool(std::make_unique<GetSolutionStructureTool>(std::move(engine)));
}

} // namespace sharpmap
