#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "cancellation.hpp"
#include "errors.hpp"

namespace sharpmap {

struct ToolMetadata {
    std::string name;
    std::string description;
    nlohmann::json parameter_schema;
};

inline nlohmann::json success_record(nlohmann::json result) {
    return {{"success", true}, {"result", std::move(result)}};
}

inline nlohmann::json error_record(ErrorCode code, const std::string& message) {
    return {{"success", false}, {"error", {{"code", error_code_name(code)}, {"message", message}}}};
}

class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    // Always returns a success or error record; never throws. cancel may
    // be null; long-running tools poll it and report CANCELLED.
    virtual nlohmann::json execute(const nlohmann::json& args, const CancellationToken* cancel) = 0;
};

class ToolRegistry {
private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        std::string name = tool->get_metadata().name;
        spdlog::info("🛰️ Tool registered: {}", name);
        tools_[name] = std::move(tool);
    }

    bool has_tool(const std::string& name) const { return tools_.count(name) > 0; }
    size_t size() const { return tools_.size(); }

    nlohmann::json get_manifest_json() const {
        auto manifest = nlohmann::json::array();
        for (const auto& [name, tool] : tools_) {
            auto meta = tool->get_metadata();
            manifest.push_back({
                {"name", meta.name},
                {"description", meta.description},
                {"inputSchema", meta.parameter_schema}
            });
        }
        return manifest;
    }

    nlohmann::json dispatch(const std::string& name, const nlohmann::json& args,
                            const CancellationToken* cancel = nullptr) {
        auto it = tools_.find(name);
        if (it == tools_.end()) {
            spdlog::warn("⚠️  Unknown tool requested: {}", name);
            return error_record(ErrorCode::NotFound, "Tool '" + name + "' not found.");
        }

        auto start = std::chrono::high_resolution_clock::now();
        nlohmann::json res = it->second->execute(args, cancel);
        auto end = std::chrono::high_resolution_clock::now();
        double duration = std::chrono::duration<double, std::milli>(end - start).count();

        spdlog::info("🔧 TOOL_EXEC {} | {} | {:.1f} ms", name,
                     res.value("success", false) ? "ok" : "error", duration);
        return res;
    }
};

} // namespace sharpmap
