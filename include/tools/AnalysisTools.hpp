#pragma once
#include <memory>
#include <string>
#include "search_engine.hpp"
#include "tools/ToolRegistry.hpp"

namespace sharpmap {

// Base for tools backed by the SearchEngine. Converts AnalysisError and
// malformed arguments into error records at the tool boundary.
class AnalysisTool : public ITool {
public:
    explicit AnalysisTool(std::shared_ptr<SearchEngine> engine) : engine_(std::move(engine)) {}
    nlohmann::json execute(const nlohmann::json& args, const CancellationToken* cancel) override;

protected:
    std::shared_ptr<SearchEngine> engine_;
    virtual nlohmann::json run(const nlohmann::json& args, const CancellationToken* cancel) = 0;
};

class FindClassTool : public AnalysisTool {
public:
    using AnalysisTool::AnalysisTool;
    ToolMetadata get_metadata() override;
protected:
    nlohmann::json run(const nlohmann::json& args, const CancellationToken* cancel) override;
};

class FindElementsTool : public AnalysisTool {
public:
    using AnalysisTool::AnalysisTool;
    ToolMetadata get_metadata() override;
protected:
    nlohmann::json run(const nlohmann::json& args, const CancellationToken* cancel) override;
};

class GetFileWithAnalysisTool : public AnalysisTool {
public:
    using AnalysisTool::AnalysisTool;
    ToolMetadata get_metadata() override;
protected:
    nlohmann::json run(const nlohmann::json& args, const CancellationToken* cancel) override;
};

class GetSolutionStructureTool : public AnalysisTool {
public:
    using AnalysisTool::AnalysisTool;
    ToolMetadata get_metadata() override;
protected:
    nlohmann::json run(const nlohmann::json& args, const CancellationToken* cancel) override;
};

void register_analysis_tools(ToolRegistry& registry, std::shared_ptr<SearchEngine> engine);

} // namespace sharpmap
