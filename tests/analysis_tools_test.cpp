#include "tools/AnalysisTools.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <chrono>

using namespace sharpmap;
using nlohmann::json;
using sharpmap::testing::TempTree;

class AnalysisToolsTest : public ::testing::Test {
protected:
    TempTree tree_;
    ToolRegistry registry_;

    void SetUp() override {
        tree_.write("Services/OrderService.cs", R"(namespace Shop.Services;
public class OrderService
{
    public Order Place(Cart cart) { return new Order(cart); }
}
)");
        tree_.write("Dtos/OrderDto.cs", "namespace Shop.Dtos;\npublic record OrderDto(int Id);\n");
        register_analysis_tools(registry_, std::make_shared<SearchEngine>());
    }

    json call(const std::string& tool, json args, const CancellationToken* cancel = nullptr) {
        return registry_.dispatch(tool, args, cancel);
    }

    static std::string error_code(const json& record) {
        EXPECT_FALSE(record.at("success").get<bool>()) << record.dump();
        return record.at("error").at("code").get<std::string>();
    }
};

TEST_F(AnalysisToolsTest, ManifestListsEveryTool) {
    EXPECT_EQ(registry_.size(), 4u);
    auto manifest = registry_.get_manifest_json();
    ASSERT_EQ(manifest.size(), 4u);

    std::vector<std::string> names;
    for (const auto& entry : manifest) {
        names.push_back(entry["name"].get<std::string>());
        EXPECT_EQ(entry["inputSchema"]["type"], "object");
        EXPECT_FALSE(entry["description"].get<std::string>().empty());
    }
    EXPECT_EQ(names, (std::vector<std::string>{
        "find_class", "find_elements", "get_file_with_analysis", "get_solution_structure"}));
}

TEST_F(AnalysisToolsTest, UnknownToolIsNotFound) {
    EXPECT_FALSE(registry_.has_tool("delete_everything"));
    EXPECT_EQ(error_code(call("delete_everything", json::object())), "NOT_FOUND");
}

TEST_F(AnalysisToolsTest, FindClassSucceedsWithDefaultMode) {
    auto record = call("find_class", {{"root", tree_.str()}, {"class_name", "OrderService"}});
    ASSERT_TRUE(record["success"].get<bool>()) << record.dump();
    const auto& result = record["result"];
    EXPECT_EQ(result["search_type"], "direct");
    EXPECT_TRUE(result["found"].get<bool>());
    EXPECT_EQ(result["file_path"], "Services/OrderService.cs");
    EXPECT_EQ(result["matches"][0]["element_kind"], "service");
    EXPECT_TRUE(result["file_analysis"].is_object());
}

TEST_F(AnalysisToolsTest, FindClassDeepMode) {
    auto record = call("find_class", {{"root", tree_.str()}, {"class_name", "OrderDto"}, {"search_type", "deep"}});
    ASSERT_TRUE(record["success"].get<bool>()) << record.dump();
    EXPECT_EQ(record["result"]["total_matches"], 1);
    EXPECT_EQ(record["result"]["matches"][0]["type"], "record");
}

TEST_F(AnalysisToolsTest, FindClassMissIsNotFoundRecord) {
    auto record = call("find_class", {{"root", tree_.str()}, {"class_name", "Ghost"}, {"search_type", "deep"}});
    EXPECT_EQ(error_code(record), "NOT_FOUND");
    EXPECT_NE(record["error"]["message"].get<std::string>().find("Ghost"), std::string::npos);
}

TEST_F(AnalysisToolsTest, BadArgumentsAreInvalid) {
    EXPECT_EQ(error_code(call("find_class", {{"root", tree_.str()}})), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code(call("find_class", {{"root", tree_.str()}, {"class_name", "   "}})), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code(call("find_class", {{"root", tree_.str()}, {"class_name", 42}})), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code(call("find_class",
        {{"root", tree_.str()}, {"class_name", "OrderService"}, {"search_type", "fuzzy"}})), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code(call("find_elements", {{"root", tree_.str()}, {"element_type", "widget"}})),
              "INVALID_ARGUMENT");
    EXPECT_EQ(error_code(call("get_solution_structure", json::array())), "INVALID_ARGUMENT");
    EXPECT_EQ(error_code(call("get_solution_structure", {{"root", ""}})), "INVALID_ARGUMENT");
}

TEST_F(AnalysisToolsTest, FindElementsAcceptsClassAlias) {
    auto record = call("find_elements", {{"root", tree_.str()}, {"element_type", "service"}, {"element_name", "order"}});
    ASSERT_TRUE(record["success"].get<bool>()) << record.dump();
    EXPECT_EQ(record["result"]["total_found"], 1);
    EXPECT_EQ(record["result"]["elements"][0]["name"], "OrderService");

    auto alias = call("find_elements", {{"root", tree_.str()}, {"element_type", "class"}});
    ASSERT_TRUE(alias["success"].get<bool>()) << alias.dump();
    EXPECT_EQ(alias["result"]["element_type"], "generic_class");
}

TEST_F(AnalysisToolsTest, GetFileWithAnalysis) {
    auto record = call("get_file_with_analysis", {{"root", tree_.str()}, {"file_path", "Dtos/OrderDto.cs"}});
    ASSERT_TRUE(record["success"].get<bool>()) << record.dump();
    EXPECT_EQ(record["result"]["category"], "dtos");
    EXPECT_EQ(record["result"]["analysis"]["namespace"], "Shop.Dtos");

    auto missing = call("get_file_with_analysis", {{"root", tree_.str()}, {"file_path", "Nope.cs"}});
    EXPECT_EQ(error_code(missing), "NOT_FOUND");
}

TEST_F(AnalysisToolsTest, GetSolutionStructure) {
    auto record = call("get_solution_structure", {{"root", tree_.str()}});
    ASSERT_TRUE(record["success"].get<bool>()) << record.dump();
    const auto& result = record["result"];
    EXPECT_EQ(result["total_files"], 2);
    EXPECT_TRUE(result["namespaces"].contains("Shop.Services"));
    EXPECT_TRUE(result["namespaces"].contains("Shop.Dtos"));
    EXPECT_EQ(result["element_counts"]["service"], 1);
}

TEST_F(AnalysisToolsTest, MissingRootIsNotFoundRecord) {
    auto record = call("get_solution_structure", {{"root", (tree_.path() / "gone").string()}});
    EXPECT_EQ(error_code(record), "NOT_FOUND");
}

TEST_F(AnalysisToolsTest, CancelledTokenYieldsCancelledRecord) {
    CancellationToken token;
    token.cancel();
    const json root = {{"root", tree_.str()}};

    EXPECT_EQ(error_code(call("get_solution_structure", root, &token)), "CANCELLED");
    EXPECT_EQ(error_code(call("find_elements",
        {{"root", tree_.str()}, {"element_type", "dto"}}, &token)), "CANCELLED");
    EXPECT_EQ(error_code(call("find_class",
        {{"root", tree_.str()}, {"class_name", "OrderService"}, {"search_type", "deep"}}, &token)), "CANCELLED");
    EXPECT_EQ(error_code(call("find_class",
        {{"root", tree_.str()}, {"class_name", "OrderService"}}, &token)), "CANCELLED");
    EXPECT_EQ(error_code(call("get_file_with_analysis",
        {{"root", tree_.str()}, {"file_path", "Dtos/OrderDto.cs"}}, &token)), "CANCELLED");
}

TEST_F(AnalysisToolsTest, ExpiredDeadlineYieldsCancelledRecord) {
    auto expired = CancellationToken::after(std::chrono::milliseconds(0));
    EXPECT_EQ(error_code(call("get_solution_structure", {{"root", tree_.str()}}, &expired)), "CANCELLED");

    auto generous = CancellationToken::after(std::chrono::hours(1));
    auto record = call("get_solution_structure", {{"root", tree_.str()}}, &generous);
    EXPECT_TRUE(record["success"].get<bool>()) << record.dump();
}
