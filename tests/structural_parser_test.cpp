#include "structural_parser.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace sharpmap;

namespace {

const Member* find_member(const TypeDeclaration& decl, const std::string& name) {
    auto it = std::find_if(decl.members.begin(), decl.members.end(),
        [&](const Member& m) { return m.name == name; });
    return it == decl.members.end() ? nullptr : &*it;
}

bool has_warning_containing(const StructuralDocument& doc, const std::string& text) {
    return std::any_of(doc.warnings.begin(), doc.warnings.end(),
        [&](const ParseWarning& w) { return w.message.find(text) != std::string::npos; });
}

} // namespace

// ============================================================================
// Declarations
// ============================================================================

TEST(StructuralParserTest, EmptyInputYieldsEmptyDocument) {
    auto doc = StructuralParser::parse("");
    EXPECT_FALSE(doc.namespace_name.has_value());
    EXPECT_TRUE(doc.declarations.empty());
    EXPECT_TRUE(doc.warnings.empty());
    EXPECT_EQ(doc.metrics.total_lines, 0);
}

TEST(StructuralParserTest, ParsesServiceClassWithMembers) {
    auto doc = StructuralParser::parse(R"(using System;
using System.Collections.Generic;

namespace MyApp.Services
{
    /// <summary>
    /// Handles users.
    /// </summary>
    public class UserService : IUserService
    {
        private readonly IRepo _repo;

        public UserService(IRepo repo)
        {
            _repo = repo;
        }

        public async Task<User> GetAsync(int id)
        {
            return await _repo.Find(id);
        }

        public string Name { get; set; }
    }
}
)");

    ASSERT_TRUE(doc.namespace_name.has_value());
    EXPECT_EQ(*doc.namespace_name, "MyApp.Services");
    EXPECT_EQ(doc.imports.count("System"), 1u);
    EXPECT_EQ(doc.imports.count("System.Collections.Generic"), 1u);
    EXPECT_TRUE(doc.warnings.empty());

    ASSERT_EQ(doc.declarations.size(), 1u);
    const auto& svc = doc.declarations[0];
    EXPECT_EQ(svc.name, "UserService");
    EXPECT_EQ(svc.kind, TypeKind::Class);
    EXPECT_TRUE(svc.modifiers & MOD_PUBLIC);
    EXPECT_EQ(svc.namespace_name, "MyApp.Services");
    EXPECT_EQ(svc.span.start_line, 9);
    EXPECT_EQ(svc.span.end_line, 24);
    ASSERT_EQ(svc.base_types.size(), 1u);
    EXPECT_EQ(svc.base_types[0], "IUserService");
    ASSERT_TRUE(svc.summary.has_value());
    EXPECT_EQ(*svc.summary, "Handles users.");

    ASSERT_EQ(svc.members.size(), 4u);

    const Member* repo = find_member(svc, "_repo");
    ASSERT_NE(repo, nullptr);
    EXPECT_EQ(repo->kind, MemberKind::Field);
    EXPECT_EQ(repo->return_type, "IRepo");
    EXPECT_TRUE(repo->modifiers & MOD_READONLY);

    const Member* ctor = find_member(svc, "UserService");
    ASSERT_NE(ctor, nullptr);
    EXPECT_EQ(ctor->kind, MemberKind::Constructor);
    ASSERT_EQ(ctor->parameters.size(), 1u);
    EXPECT_EQ(ctor->parameters[0].type, "IRepo");
    EXPECT_EQ(ctor->parameters[0].name, "repo");

    const Member* get = find_member(svc, "GetAsync");
    ASSERT_NE(get, nullptr);
    EXPECT_EQ(get->kind, MemberKind::Method);
    EXPECT_EQ(get->return_type, "Task<User>");
    EXPECT_TRUE(get->is_async());
    EXPECT_TRUE(get->has_nontrivial_body);
    EXPECT_EQ(get->line, 18);

    const Member* name = find_member(svc, "Name");
    ASSERT_NE(name, nullptr);
    EXPECT_EQ(name->kind, MemberKind::Property);
    EXPECT_EQ(name->return_type, "string");
    EXPECT_TRUE(name->has_getter);
    EXPECT_TRUE(name->has_setter);
}

TEST(StructuralParserTest, KeywordsInsideStringsAndCommentsAreIgnored) {
    auto doc = StructuralParser::parse(R"(public class Real
{
    private string s = "class Fake { }";
    // class Commented { }
    /* interface Hidden { } */
    private char c = '{';
}
)");

    ASSERT_EQ(doc.declarations.size(), 1u);
    EXPECT_EQ(doc.declarations[0].name, "Real");
    EXPECT_EQ(doc.declarations[0].span.end_line, 7);
    EXPECT_NE(find_member(doc.declarations[0], "s"), nullptr);
    EXPECT_NE(find_member(doc.declarations[0], "c"), nullptr);
    EXPECT_TRUE(doc.warnings.empty());
}

TEST(StructuralParserTest, VerbatimInterpolatedAndRawStringsAreMasked) {
    auto doc = StructuralParser::parse(R"cs(public class S
{
    string a = @"C:\path\""quoted"" { class X }";
    string b = $"{Value} {{ literal }} {(x ? "y" : "z")}";
    string c = """
        raw { class Y }
        """;
}
)cs");

    ASSERT_EQ(doc.declarations.size(), 1u);
    const auto& s = doc.declarations[0];
    EXPECT_EQ(s.name, "S");
    EXPECT_EQ(s.count_members(MemberKind::Field), 3u);
    EXPECT_EQ(s.span.end_line, 8);
    EXPECT_TRUE(doc.warnings.empty());
}

TEST(StructuralParserTest, FileScopedNamespaceNestedTypesAndRecords) {
    auto doc = StructuralParser::parse(R"(namespace Acme.Orders;

public class Outer
{
    public class Inner { }
    public enum State { Open, Closed = 2 }
}
public record OrderDto(int Id, string Name);
public interface IOrderRepository { Task<Order> Find(int id); }
public struct Point { public int X; public int Y; }
)");

    ASSERT_TRUE(doc.namespace_name.has_value());
    EXPECT_EQ(*doc.namespace_name, "Acme.Orders");
    ASSERT_EQ(doc.declarations.size(), 6u);

    EXPECT_EQ(doc.declarations[0].name, "Outer");
    EXPECT_EQ(doc.declarations[1].name, "Inner");
    EXPECT_EQ(doc.declarations[1].containing_type, "Outer");
    EXPECT_EQ(doc.declarations[2].name, "State");
    EXPECT_EQ(doc.declarations[2].kind, TypeKind::Enum);
    EXPECT_EQ(doc.declarations[2].count_members(MemberKind::EnumValue), 2u);

    const auto& dto = doc.declarations[3];
    EXPECT_EQ(dto.name, "OrderDto");
    EXPECT_EQ(dto.kind, TypeKind::Record);
    EXPECT_EQ(dto.span.start_line, 8);
    EXPECT_EQ(dto.span.end_line, 8);
    ASSERT_EQ(dto.count_members(MemberKind::Property), 2u);
    EXPECT_EQ(dto.members[0].name, "Id");
    EXPECT_EQ(dto.members[0].return_type, "int");

    const auto& repo = doc.declarations[4];
    EXPECT_EQ(repo.kind, TypeKind::Interface);
    const Member* find = find_member(repo, "Find");
    ASSERT_NE(find, nullptr);
    EXPECT_FALSE(find->has_body);

    EXPECT_EQ(doc.declarations[5].kind, TypeKind::Struct);
    EXPECT_EQ(doc.declarations[5].count_members(MemberKind::Field), 2u);

    for (const auto& d : doc.declarations) EXPECT_EQ(d.namespace_name, "Acme.Orders");
}

TEST(StructuralParserTest, BlockNamespacesNestQualifiedNames) {
    auto doc = StructuralParser::parse(R"(namespace Outer
{
    namespace Inner
    {
        class A { }
    }
    class B { }
}
class C { }
)");

    ASSERT_TRUE(doc.namespace_name.has_value());
    EXPECT_EQ(*doc.namespace_name, "Outer");
    ASSERT_EQ(doc.declarations.size(), 3u);
    EXPECT_EQ(doc.declarations[0].namespace_name, "Outer.Inner");
    EXPECT_EQ(doc.declarations[1].namespace_name, "Outer");
    EXPECT_EQ(doc.declarations[2].namespace_name, "");
}

TEST(StructuralParserTest, GenericParametersBaseListAndConstraints) {
    auto doc = StructuralParser::parse(
        "public class Repo<T, TKey> : BaseRepo<T>, IRepo<T> where T : class, new() { }\n");

    ASSERT_EQ(doc.declarations.size(), 1u);
    const auto& repo = doc.declarations[0];
    EXPECT_EQ(repo.name, "Repo");
    EXPECT_EQ(repo.generic_parameters, (std::vector<std::string>{"T", "TKey"}));
    EXPECT_EQ(repo.base_types, (std::vector<std::string>{"BaseRepo<T>", "IRepo<T>"}));
}

TEST(StructuralParserTest, SummarySkipsAttributeLines) {
    auto doc = StructuralParser::parse(R"(/// <summary>Gets &lt;things&gt;.</summary>
[ApiController]
[Route("api/[controller]")]
public class ThingsController : ControllerBase { }
)");

    ASSERT_EQ(doc.declarations.size(), 1u);
    const auto& ctrl = doc.declarations[0];
    EXPECT_EQ(ctrl.span.start_line, 4);
    ASSERT_TRUE(ctrl.summary.has_value());
    EXPECT_EQ(*ctrl.summary, "Gets <things>.");
    EXPECT_EQ(ctrl.base_types, (std::vector<std::string>{"ControllerBase"}));
}

TEST(StructuralParserTest, NonAsciiDocCommentsKeepTheirBytes) {
    auto doc = StructuralParser::parse("/// <Summary>Caf\xC3\xA9 \xC3\x9C" "bersicht</Summary>\n"
                                       "public class Menu { }\n");

    ASSERT_EQ(doc.declarations.size(), 1u);
    ASSERT_TRUE(doc.declarations[0].summary.has_value());
    EXPECT_EQ(*doc.declarations[0].summary, "Caf\xC3\xA9 \xC3\x9C" "bersicht");
    EXPECT_TRUE(doc.metrics.has_xml_docs);
}

// ============================================================================
// Members
// ============================================================================

TEST(StructuralParserTest, ExpressionBodiesIndexersEventsAndInitializers) {
    auto doc = StructuralParser::parse(R"(public class E
{
    public int Count => _items.Count;
    public string this[int index] { get { return _items[index]; } set { } }
    public event EventHandler Changed;
    public int Double(int x) => x * 2;
    public List<int> Items { get; init; } = new();
    public delegate void Notify(string msg);
    private int a = 1, b;
}
)");

    ASSERT_EQ(doc.declarations.size(), 1u);
    const auto& e = doc.declarations[0];

    const Member* count = find_member(e, "Count");
    ASSERT_NE(count, nullptr);
    EXPECT_EQ(count->kind, MemberKind::Property);
    EXPECT_TRUE(count->has_getter);
    EXPECT_FALSE(count->has_setter);

    const Member* indexer = find_member(e, "this");
    ASSERT_NE(indexer, nullptr);
    EXPECT_EQ(indexer->kind, MemberKind::Property);
    ASSERT_EQ(indexer->parameters.size(), 1u);
    EXPECT_EQ(indexer->parameters[0].name, "index");
    EXPECT_TRUE(indexer->has_setter);

    const Member* changed = find_member(e, "Changed");
    ASSERT_NE(changed, nullptr);
    EXPECT_EQ(changed->kind, MemberKind::Event);

    const Member* twice = find_member(e, "Double");
    ASSERT_NE(twice, nullptr);
    EXPECT_EQ(twice->kind, MemberKind::Method);
    EXPECT_TRUE(twice->has_nontrivial_body);

    const Member* items = find_member(e, "Items");
    ASSERT_NE(items, nullptr);
    EXPECT_EQ(items->return_type, "List<int>");
    EXPECT_TRUE(items->has_setter);

    const Member* notify = find_member(e, "Notify");
    ASSERT_NE(notify, nullptr);
    EXPECT_EQ(notify->kind, MemberKind::Delegate);

    EXPECT_NE(find_member(e, "a"), nullptr);
    EXPECT_NE(find_member(e, "b"), nullptr);
    EXPECT_EQ(e.count_members(MemberKind::Field), 2u);
}

TEST(StructuralParserTest, EmptyMethodBodyIsTrivial) {
    auto doc = StructuralParser::parse(R"(class A
{
    public void Empty() { }
    public void Busy() { Console.WriteLine(); }
    public abstract void Abstract();
}
)");

    ASSERT_EQ(doc.declarations.size(), 1u);
    const auto& a = doc.declarations[0];
    EXPECT_TRUE(find_member(a, "Empty")->has_body);
    EXPECT_FALSE(find_member(a, "Empty")->has_nontrivial_body);
    EXPECT_TRUE(find_member(a, "Busy")->has_nontrivial_body);
    EXPECT_FALSE(find_member(a, "Abstract")->has_body);
}

// ============================================================================
// Recovery
// ============================================================================

TEST(StructuralParserTest, StrayClosingBraceBecomesWarning) {
    auto doc = StructuralParser::parse(R"(public class A
{
}
}
public class B { }
)");

    ASSERT_EQ(doc.declarations.size(), 2u);
    EXPECT_EQ(doc.declarations[0].name, "A");
    EXPECT_EQ(doc.declarations[1].name, "B");
    ASSERT_EQ(doc.warnings.size(), 1u);
    EXPECT_EQ(doc.warnings[0].start_line, 4);
    EXPECT_TRUE(has_warning_containing(doc, "unmatched"));
}

TEST(StructuralParserTest, UnclosedBodyClosesAtEndOfFile) {
    auto doc = StructuralParser::parse(R"(public class A
{
    public void M() {
)");

    ASSERT_EQ(doc.declarations.size(), 1u);
    EXPECT_EQ(doc.declarations[0].name, "A");
    EXPECT_EQ(doc.declarations[0].span.end_line, 3);
    EXPECT_FALSE(doc.warnings.empty());
    EXPECT_TRUE(has_warning_containing(doc, "never closed"));
}

TEST(StructuralParserTest, UnterminatedStringAndCommentAreReported) {
    auto doc = StructuralParser::parse("class A\n{\n    string s = \"abc\n}\n/* never closed\n");

    ASSERT_EQ(doc.declarations.size(), 1u);
    EXPECT_TRUE(has_warning_containing(doc, "unterminated string"));
    EXPECT_TRUE(has_warning_containing(doc, "unterminated block comment"));
}

TEST(StructuralParserTest, TypeKeywordWithoutNameIsReported) {
    auto doc = StructuralParser::parse("public class\n{\n}\npublic class Ok { }\n");

    ASSERT_EQ(doc.declarations.size(), 1u);
    EXPECT_EQ(doc.declarations[0].name, "Ok");
    EXPECT_TRUE(has_warning_containing(doc, "without a type name"));
}

// ============================================================================
// Metrics
// ============================================================================

TEST(StructuralParserTest, LineMetricsAndComplexity) {
    auto doc = StructuralParser::parse(R"(/// <summary>x</summary>
public class C
{
    // comment

    public void M() { if (a) {} for (;;) {} while (b) {} }
}
)");

    EXPECT_EQ(doc.metrics.total_lines, 7);
    EXPECT_EQ(doc.metrics.code_lines, 4);
    EXPECT_EQ(doc.metrics.comment_lines, 2);
    EXPECT_EQ(doc.metrics.blank_lines, 1);
    EXPECT_TRUE(doc.metrics.has_xml_docs);
    EXPECT_EQ(doc.metrics.branch_points, 3);
    EXPECT_EQ(doc.metrics.complexity(), "Low");
}

TEST(StructuralParserTest, MaskKeepsOffsetsAndNewlines) {
    std::string src = "var s = \"a\\\"b\"; // tail\nint x;\n";
    auto masked = mask_source(src);

    ASSERT_EQ(masked.text.size(), src.size());
    EXPECT_EQ(masked.line_count, 2);
    EXPECT_EQ(masked.text.find("tail"), std::string::npos);
    EXPECT_EQ(masked.text[src.find('\n')], '\n');
    EXPECT_EQ(masked.text.substr(src.find("int")), "int x;\n");
    EXPECT_EQ(masked.text[src.find('"')], kStringMark);
}
