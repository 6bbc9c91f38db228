#include "source_provider.hpp"
#include "errors.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <unistd.h>

using namespace sharpmap;
using sharpmap::testing::TempTree;

namespace {

std::vector<std::string> paths_of(const std::vector<SourceFile>& files) {
    std::vector<std::string> out;
    for (const auto& f : files) out.push_back(f.relative_path);
    return out;
}

ErrorCode read_error(const fs::path& path) {
    try {
        SourceProvider::read_file(path);
    } catch (const AnalysisError& e) {
        return e.code();
    }
    ADD_FAILURE() << "read_file did not throw for " << path;
    return ErrorCode::InvalidArgument;
}

} // namespace

// ============================================================================
// read_file
// ============================================================================

TEST(SourceProviderTest, ReadsPlainUtf8) {
    TempTree tree;
    auto path = tree.write("A.cs", "class A { } // caf\xC3\xA9\n");
    auto text = SourceProvider::read_file(path);
    EXPECT_EQ(text.encoding, SourceEncoding::Utf8);
    EXPECT_EQ(text.content, "class A { } // caf\xC3\xA9\n");
    EXPECT_EQ(text.size, text.content.size());
}

TEST(SourceProviderTest, StripsUtf8Bom) {
    TempTree tree;
    auto path = tree.write("A.cs", "\xEF\xBB\xBFnamespace X;");
    auto text = SourceProvider::read_file(path);
    EXPECT_EQ(text.encoding, SourceEncoding::Utf8Bom);
    EXPECT_EQ(text.content, "namespace X;");
    EXPECT_EQ(text.size, 15u);
}

TEST(SourceProviderTest, DecodesUtf16WithBom) {
    std::string le("\xFF\xFE" "c\0l\0a\0s\0s\0", 12);
    std::string be("\xFE\xFF" "\0c\0l\0a\0s\0s", 12);
    SourceEncoding enc;
    EXPECT_EQ(SourceProvider::decode(le, enc), "class");
    EXPECT_EQ(enc, SourceEncoding::Utf16LE);
    EXPECT_EQ(SourceProvider::decode(be, enc), "class");
    EXPECT_EQ(enc, SourceEncoding::Utf16BE);

    // U+1F600 as a surrogate pair.
    std::string pair("\xFF\xFE" "\x3D\xD8\x00\xDE", 6);
    EXPECT_EQ(SourceProvider::decode(pair, enc), "\xF0\x9F\x98\x80");
}

TEST(SourceProviderTest, FallsBackToWindows1252) {
    SourceEncoding enc;
    // "caf\xE9" is Latin-1 e-acute, 0x80 is the euro sign in Windows-1252.
    EXPECT_EQ(SourceProvider::decode("caf\xE9 \x80", enc), "caf\xC3\xA9 \xE2\x82\xAC");
    EXPECT_EQ(enc, SourceEncoding::Windows1252);
}

TEST(SourceProviderTest, MissingFileAndDirectoryAreNotFound) {
    TempTree tree;
    tree.mkdir("Folder");
    EXPECT_EQ(read_error(tree.path() / "Missing.cs"), ErrorCode::NotFound);
    EXPECT_EQ(read_error(tree.path() / "Folder"), ErrorCode::NotFound);
}

TEST(SourceProviderTest, UnreadableFileIsPermissionDenied) {
    if (geteuid() == 0) GTEST_SKIP() << "permission bits do not apply to root";
    TempTree tree;
    auto path = tree.write("Locked.cs", "class Locked { }");
    fs::permissions(path, fs::perms::none);
    EXPECT_EQ(read_error(path), ErrorCode::PermissionDenied);
    fs::permissions(path, fs::perms::owner_all);
}

TEST(SourceProviderTest, OversizedFileIsRejected) {
    TempTree tree;
    auto path = tree.write("Big.cs", std::string(64, 'x'));
    try {
        SourceProvider::read_file(path, 16);
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidArgument);
    }
}

// ============================================================================
// list_files
// ============================================================================

TEST(SourceProviderTest, ListsMatchingFilesInPathOrder) {
    TempTree tree;
    tree.write("src/Zeta.cs", "");
    tree.write("src/Alpha.cs", "");
    tree.write("Beta.CS", "");
    tree.write("README.md", "");
    tree.write("src/Sub/Gamma.cs", "");

    auto files = SourceProvider::list_files(tree.path(), {"cs"}, PathRules());
    EXPECT_EQ(paths_of(files),
              (std::vector<std::string>{"Beta.CS", "src/Alpha.cs", "src/Sub/Gamma.cs", "src/Zeta.cs"}));
    EXPECT_FALSE(files[0].fingerprint.empty());
}

TEST(SourceProviderTest, ExcludedDirectoriesAreNotEntered) {
    TempTree tree;
    tree.write("App.cs", "");
    tree.write("bin/Debug/Gen.cs", "");
    tree.write("obj/Tmp.cs", "");
    tree.write("vendor/drop/Lib.cs", "");
    tree.write("vendor/keep/Lib.cs", "");

    PathRules rules({"bin", "obj", "vendor"}, {"vendor/keep"});
    auto files = SourceProvider::list_files(tree.path(), {".cs"}, rules);
    EXPECT_EQ(paths_of(files), (std::vector<std::string>{"App.cs", "vendor/keep/Lib.cs"}));
}

TEST(SourceProviderTest, NonAsciiExtensionsDoNotMatch) {
    TempTree tree;
    tree.write("A.cs", "");
    tree.write("B.\xC3\x9C" "cs", "");
    tree.write("C.c\xC5\x9B", "");
    EXPECT_EQ(paths_of(SourceProvider::list_files(tree.path(), {"cs"}, PathRules())),
              (std::vector<std::string>{"A.cs"}));
}

TEST(SourceProviderTest, EmptyExtensionListAdmitsEverything) {
    TempTree tree;
    tree.write("a.txt", "");
    tree.write("b.cs", "");
    EXPECT_EQ(SourceProvider::list_files(tree.path(), {}, PathRules()).size(), 2u);
}

TEST(SourceProviderTest, MissingRootIsNotFound) {
    TempTree tree;
    try {
        SourceProvider::list_files(tree.path() / "nope", {"cs"}, PathRules());
        FAIL() << "expected AnalysisError";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }
}

TEST(SourceProviderTest, ManifestTracksFingerprints) {
    TempTree tree;
    tree.write("A.cs", "class A { }");
    auto before = SourceProvider::build_manifest(SourceProvider::list_files(tree.path(), {"cs"}, PathRules()));
    tree.write("A.cs", "class A { int x; }");
    auto after = SourceProvider::build_manifest(SourceProvider::list_files(tree.path(), {"cs"}, PathRules()));
    ASSERT_EQ(before.size(), 1u);
    EXPECT_NE(before.at("A.cs"), after.at("A.cs"));
}

TEST(SourceProviderTest, IsInsideComparesWholeSegments) {
    EXPECT_TRUE(is_inside("/a/b/c.cs", "/a/b"));
    EXPECT_TRUE(is_inside("/a/b", "/a/b"));
    EXPECT_FALSE(is_inside("/a/bc/d.cs", "/a/b"));
    EXPECT_FALSE(is_inside("/a/b/../../x", "/a/b"));
}
