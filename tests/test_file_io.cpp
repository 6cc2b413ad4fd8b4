/**
 * @file test_file_io.cpp
 * @brief Unit tests for document and patch files (GoogleTest)
 *
 * Tests cover:
 * - JSON and TOML loading, format detection by extension
 * - Patch files
 * - Writing JSON and TOML, and what TOML cannot hold
 */

#include <gtest/gtest.h>
#include "jpatch/FileIO.hpp"
#include "jpatch/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using namespace jpatch;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII helper for temporary files
 */
class TempFile {
public:
    TempFile(const std::string& content, const std::string& extension = ".json")
        : path_(fs::temp_directory_path() /
                ("jpatch_test_" + std::to_string(std::rand()) + extension)) {
        if (!content.empty()) {
            std::ofstream out(path_);
            out << content;
        }
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

namespace {
    Element parse(const char* text) {
        return Element::from_json(Json::parse(text));
    }
}

// ============================================================================
// Extensions
// ============================================================================

TEST(FileExtension, Lowercased) {
    EXPECT_EQ(file_extension("a/b/doc.JSON"), ".json");
    EXPECT_EQ(file_extension("conf.toml"), ".toml");
    EXPECT_EQ(file_extension("noext"), "");
}

// ============================================================================
// Loading
// ============================================================================

TEST(LoadDocument, Json) {
    TempFile file(R"({"name": "svc", "ports": [80, 443]})");
    EXPECT_EQ(load_document(file.path()), parse(R"({"name": "svc", "ports": [80, 443]})"));
}

TEST(LoadDocument, JsonScalarRoot) {
    TempFile file("\"just a string\"");
    EXPECT_EQ(load_document(file.path()), Element("just a string"));
}

TEST(LoadDocument, Toml) {
    TempFile file(
        "title = \"demo\"\n"
        "ratio = 0.5\n"
        "enabled = true\n"
        "released = 1979-05-27\n"
        "\n"
        "[server]\n"
        "host = \"localhost\"\n"
        "ports = [80, 443]\n", ".toml");

    Element doc = load_document(file.path());
    EXPECT_EQ(doc, parse(R"({
        "title": "demo",
        "ratio": 0.5,
        "enabled": true,
        "released": "1979-05-27",
        "server": {"host": "localhost", "ports": [80, 443]}
    })"));
}

TEST(LoadDocument, MissingFile) {
    EXPECT_THROW(load_document("/nonexistent/path/doc.json"), FileNotFoundError);
    try {
        read_text_file("/nonexistent/x.json");
        FAIL() << "Expected FileNotFoundError";
    } catch (const FileNotFoundError& e) {
        EXPECT_EQ(e.path(), "/nonexistent/x.json");
    }
}

TEST(LoadDocument, InvalidJson) {
    TempFile file("{\"a\": ");
    try {
        load_document(file.path());
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_EQ(e.source(), file.path());
    }
}

TEST(LoadDocument, InvalidToml) {
    TempFile file("key = = 1\n", ".toml");
    try {
        load_document(file.path());
        FAIL() << "Expected DocumentParseError";
    } catch (const DocumentParseError& e) {
        EXPECT_NE(e.details().find("line 1"), std::string::npos);
    }
}

TEST(LoadDocument, UnsupportedExtension) {
    TempFile file("a: 1\n", ".yaml");
    EXPECT_THROW(load_document(file.path()), UnsupportedFormatError);
}

TEST(LoadPatch, ReadsOperations) {
    TempFile file(R"([{"op": "add", "path": "/a", "value": 1}, {"op": "remove", "path": "/b"}])");
    Patch patch = load_patch(file.path());
    ASSERT_EQ(patch.size(), 2u);
    EXPECT_EQ(patch.operations()[1], Operation::remove(Pointer::parse("/b")));
}

TEST(LoadPatch, Errors) {
    TempFile bad_json("[{]");
    EXPECT_THROW(load_patch(bad_json.path()), DocumentParseError);

    TempFile not_array(R"({"op": "add"})");
    EXPECT_THROW(load_patch(not_array.path()), InvalidPatchFormat);

    EXPECT_THROW(load_patch("/nonexistent/patch.json"), FileNotFoundError);
}

// ============================================================================
// Writing
// ============================================================================

TEST(WriteDocument, JsonIndented) {
    TempFile out("", ".json");
    write_document(out.path(), parse(R"({"a": 1})"));
    EXPECT_EQ(read_text_file(out.path()), "{\n  \"a\": 1\n}\n");
}

TEST(WriteDocument, JsonCompactScalar) {
    TempFile out("", ".json");
    write_document(out.path(), Element(false), {-1});
    EXPECT_EQ(read_text_file(out.path()), "false\n");
}

TEST(WriteDocument, TomlReloads) {
    Element doc = parse(R"({
        "name": "svc",
        "limits": {"cpu": 1.5, "mem": 512},
        "tags": ["a", "b"],
        "nested": {"deep": {"on": true}}
    })");

    TempFile out("", ".toml");
    write_document(out.path(), doc);
    EXPECT_EQ(load_document(out.path()), doc);
}

TEST(WriteDocument, UnsupportedExtension) {
    TempFile out("", ".xml");
    EXPECT_THROW(write_document(out.path(), parse("{}")), UnsupportedFormatError);
}

TEST(TomlString, RequiresTableRoot) {
    EXPECT_THROW(to_toml_string(parse("[1, 2]")), UnsupportedFormatError);
    EXPECT_THROW(to_toml_string(Element(1)), UnsupportedFormatError);
}

TEST(TomlString, NullIsRejected) {
    try {
        to_toml_string(parse(R"({"a": {"b": [1, null]}})"));
        FAIL() << "Expected UnsupportedFormatError";
    } catch (const UnsupportedFormatError& e) {
        EXPECT_NE(std::string(e.what()).find("/a/b/1"), std::string::npos);
    }
}

TEST(TomlString, ContainsMembers) {
    std::string text = to_toml_string(parse(R"({"port": 8080, "server": {"host": "h"}})"));
    EXPECT_NE(text.find("port = 8080"), std::string::npos);
    EXPECT_NE(text.find("[server]"), std::string::npos);
}
