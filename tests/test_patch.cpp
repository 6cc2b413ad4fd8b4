/**
 * @file test_patch.cpp
 * @brief Unit tests for patch documents (GoogleTest)
 *
 * Tests cover:
 * - Decoding patch documents
 * - The examples of RFC 6902 Appendix A
 * - All-or-nothing apply() and per-operation apply_in_place()
 * - Index of the failing operation on errors
 * - Applying relative to a subtree
 */

#include <gtest/gtest.h>
#include "jpatch/Patch.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Serialize.hpp"

using namespace jpatch;

namespace {
    Element parse(const char* text) {
        return Element::from_json(Json::parse(text));
    }

    /**
     * @brief Apply patch text to document text and return the result
     */
    Element run(const char* document, const char* patch) {
        return Patch::parse(patch).apply(parse(document));
    }
}

// ============================================================================
// Decoding
// ============================================================================

TEST(PatchDecode, Empty) {
    Patch patch = Patch::parse("[]");
    EXPECT_TRUE(patch.empty());
    EXPECT_EQ(patch.apply(parse(R"({"a": 1})")), parse(R"({"a": 1})"));
}

TEST(PatchDecode, KeepsOrder) {
    Patch patch = Patch::parse(R"([
        {"op": "add", "path": "/a", "value": 1},
        {"op": "remove", "path": "/a"},
        {"op": "test", "path": "", "value": {}}
    ])");
    ASSERT_EQ(patch.size(), 3u);
    EXPECT_EQ(patch.operations()[0].type, OperationType::Add);
    EXPECT_EQ(patch.operations()[1].type, OperationType::Remove);
    EXPECT_EQ(patch.operations()[2].type, OperationType::Test);
}

TEST(PatchDecode, ToJsonRoundTrip) {
    Json source = Json::parse(R"([
        {"op": "copy", "from": "/a", "path": "/b"},
        {"op": "replace", "path": "/b", "value": [true, null]}
    ])");
    EXPECT_EQ(Patch::from_json(source).to_json(), source);
}

TEST(PatchDecode, MustBeArray) {
    EXPECT_THROW(Patch::parse(R"({"op": "add", "path": "/a", "value": 1})"), InvalidPatchFormat);
    EXPECT_THROW(Patch::parse("null"), InvalidPatchFormat);
    EXPECT_THROW(Patch::parse("[1]"), InvalidPatchFormat);
}

TEST(PatchDecode, InvalidJson) {
    EXPECT_THROW(Patch::parse("[{"), DocumentParseError);
}

TEST(PatchDecode, ErrorsNameTheOperationIndex) {
    try {
        Patch::parse(R"([{"op": "remove", "path": "/a"}, {"op": "jump", "path": "/b"}])");
        FAIL() << "Expected UnknownPatchOperation";
    } catch (const UnknownPatchOperation& e) {
        EXPECT_EQ(e.index(), 1u);
    }
}

// ============================================================================
// RFC 6902 Appendix A
// ============================================================================

TEST(PatchRfcExamples, AddObjectMember) {
    EXPECT_EQ(run(R"({"foo": "bar"})",
                  R"([{"op": "add", "path": "/baz", "value": "qux"}])"),
              parse(R"({"baz": "qux", "foo": "bar"})"));
}

TEST(PatchRfcExamples, AddArrayElement) {
    EXPECT_EQ(run(R"({"foo": ["bar", "baz"]})",
                  R"([{"op": "add", "path": "/foo/1", "value": "qux"}])"),
              parse(R"({"foo": ["bar", "qux", "baz"]})"));
}

TEST(PatchRfcExamples, RemoveObjectMember) {
    EXPECT_EQ(run(R"({"baz": "qux", "foo": "bar"})",
                  R"([{"op": "remove", "path": "/baz"}])"),
              parse(R"({"foo": "bar"})"));
}

TEST(PatchRfcExamples, RemoveArrayElement) {
    EXPECT_EQ(run(R"({"foo": ["bar", "qux", "baz"]})",
                  R"([{"op": "remove", "path": "/foo/1"}])"),
              parse(R"({"foo": ["bar", "baz"]})"));
}

TEST(PatchRfcExamples, ReplaceValue) {
    EXPECT_EQ(run(R"({"baz": "qux", "foo": "bar"})",
                  R"([{"op": "replace", "path": "/baz", "value": "boo"}])"),
              parse(R"({"baz": "boo", "foo": "bar"})"));
}

TEST(PatchRfcExamples, MoveValue) {
    EXPECT_EQ(run(R"({"foo": {"bar": "baz", "waldo": "fred"}, "qux": {"corge": "grault"}})",
                  R"([{"op": "move", "from": "/foo/waldo", "path": "/qux/thud"}])"),
              parse(R"({"foo": {"bar": "baz"}, "qux": {"corge": "grault", "thud": "fred"}})"));
}

TEST(PatchRfcExamples, MoveArrayElement) {
    EXPECT_EQ(run(R"({"foo": ["all", "grass", "cows", "eat"]})",
                  R"([{"op": "move", "from": "/foo/1", "path": "/foo/3"}])"),
              parse(R"({"foo": ["all", "cows", "eat", "grass"]})"));
}

TEST(PatchRfcExamples, TestSuccess) {
    EXPECT_EQ(run(R"({"baz": "qux", "foo": ["a", 2, "c"]})",
                  R"([{"op": "test", "path": "/baz", "value": "qux"},
                      {"op": "test", "path": "/foo/1", "value": 2}])"),
              parse(R"({"baz": "qux", "foo": ["a", 2, "c"]})"));
}

TEST(PatchRfcExamples, TestFailure) {
    EXPECT_THROW(run(R"({"baz": "qux"})",
                     R"([{"op": "test", "path": "/baz", "value": "bar"}])"),
                 PatchTestFailed);
}

TEST(PatchRfcExamples, AddNestedMemberObject) {
    EXPECT_EQ(run(R"({"foo": "bar"})",
                  R"([{"op": "add", "path": "/child", "value": {"grandchild": {}}}])"),
              parse(R"({"foo": "bar", "child": {"grandchild": {}}})"));
}

TEST(PatchRfcExamples, IgnoreUnrecognizedElements) {
    EXPECT_EQ(run(R"({"foo": "bar"})",
                  R"([{"op": "add", "path": "/baz", "value": "qux", "xyz": 123}])"),
              parse(R"({"foo": "bar", "baz": "qux"})"));
}

TEST(PatchRfcExamples, AddToNonexistentTarget) {
    EXPECT_THROW(run(R"({"foo": "bar"})",
                     R"([{"op": "add", "path": "/baz/bat", "value": "qux"}])"),
                 ReferencesNonexistentValue);
}

TEST(PatchRfcExamples, EscapeOrdering) {
    EXPECT_NO_THROW(run(R"({"/": 9, "~1": 10})",
                        R"([{"op": "test", "path": "/~01", "value": 10}])"));
}

TEST(PatchRfcExamples, ComparingStringsAndNumbers) {
    EXPECT_THROW(run(R"({"/": 9, "~1": 10})",
                     R"([{"op": "test", "path": "/~01", "value": "10"}])"),
                 PatchTestFailed);
}

TEST(PatchRfcExamples, AddArrayValue) {
    EXPECT_EQ(run(R"({"foo": ["bar"]})",
                  R"([{"op": "add", "path": "/foo/-", "value": ["abc", "def"]}])"),
              parse(R"({"foo": ["bar", ["abc", "def"]]})"));
}

// ============================================================================
// Scenarios
// ============================================================================

TEST(PatchScenario, AddMember) {
    EXPECT_EQ(run(R"({"a": 1})", R"([{"op": "add", "path": "/b", "value": 2}])"),
              parse(R"({"a": 1, "b": 2})"));
}

TEST(PatchScenario, AppendToArray) {
    EXPECT_EQ(run(R"({"a": [1, 2, 3]})", R"([{"op": "add", "path": "/a/-", "value": 4}])"),
              parse(R"({"a": [1, 2, 3, 4]})"));
}

TEST(PatchScenario, RemoveNested) {
    EXPECT_EQ(run(R"({"a": {"b": 1}})", R"([{"op": "remove", "path": "/a/b"}])"),
              parse(R"({"a": {}})"));
}

TEST(PatchScenario, MoveMember) {
    EXPECT_EQ(run(R"({"a": 1, "b": 2})", R"([{"op": "move", "from": "/a", "path": "/c"}])"),
              parse(R"({"b": 2, "c": 1})"));
}

TEST(PatchScenario, TestScalarDocument) {
    try {
        run(R"("x")", R"([{"op": "test", "path": "", "value": "y"}])");
        FAIL() << "Expected PatchTestFailed";
    } catch (const PatchTestFailed& e) {
        EXPECT_EQ(e.expected(), Json("y"));
        ASSERT_TRUE(e.found().has_value());
        EXPECT_EQ(*e.found(), Json("x"));
        EXPECT_EQ(e.operation_index(), std::optional<std::size_t>(0));
    }
}

TEST(PatchScenario, LeadingZeroIndex) {
    EXPECT_THROW(run(R"({"a": [1, 2]})", R"([{"op": "replace", "path": "/a/01", "value": 0}])"),
                 ReferencesNonexistentValue);
    EXPECT_THROW(run(R"({"a": [1, 2]})", R"([{"op": "add", "path": "/a/01", "value": 0}])"),
                 ReferencesNonexistentValue);
}

TEST(PatchScenario, LaterOperationsSeeEarlierResults) {
    EXPECT_EQ(run(R"({})", R"([
                  {"op": "add", "path": "/list", "value": []},
                  {"op": "add", "path": "/list/-", "value": {"id": 1}},
                  {"op": "copy", "from": "/list/0", "path": "/list/-"},
                  {"op": "replace", "path": "/list/1/id", "value": 2},
                  {"op": "test", "path": "/list/0/id", "value": 1}
              ])"),
              parse(R"({"list": [{"id": 1}, {"id": 2}]})"));
}

TEST(PatchScenario, ReplaceRootWithScalar) {
    Element result = run(R"({"a": 1})", R"([{"op": "replace", "path": "", "value": 7}])");
    EXPECT_EQ(result, Element(7));
    EXPECT_EQ(serialize(result), "7");
}

// ============================================================================
// Atomicity
// ============================================================================

TEST(PatchAtomicity, ApplyNeverTouchesInput) {
    Element input = parse(R"({"a": {"b": [1, 2]}, "c": 3})");
    Patch patch = Patch::parse(R"([
        {"op": "add", "path": "/a/b/-", "value": 3},
        {"op": "remove", "path": "/c"}
    ])");

    Element output = patch.apply(input);
    EXPECT_EQ(input, parse(R"({"a": {"b": [1, 2]}, "c": 3})"));
    EXPECT_EQ(output, parse(R"({"a": {"b": [1, 2, 3]}})"));
}

TEST(PatchAtomicity, ApplyIsAllOrNothing) {
    Element input = parse(R"({"a": 1})");
    Patch patch = Patch::parse(R"([
        {"op": "add", "path": "/b", "value": 2},
        {"op": "remove", "path": "/a"},
        {"op": "remove", "path": "/missing"}
    ])");

    try {
        patch.apply(input);
        FAIL() << "Expected ReferencesNonexistentValue";
    } catch (const ReferencesNonexistentValue& e) {
        EXPECT_EQ(e.operation_index(), std::optional<std::size_t>(2));
        EXPECT_EQ(e.path(), "/missing");
    }
    EXPECT_EQ(input, parse(R"({"a": 1})"));
}

TEST(PatchAtomicity, FailedTestHasIndex) {
    Patch patch = Patch::parse(R"([
        {"op": "test", "path": "/a", "value": 1},
        {"op": "test", "path": "/a", "value": 2}
    ])");
    try {
        patch.apply(parse(R"({"a": 1})"));
        FAIL() << "Expected PatchTestFailed";
    } catch (const PatchError& e) {
        EXPECT_EQ(e.operation_index(), std::optional<std::size_t>(1));
    }
}

TEST(PatchAtomicity, ApplyInPlaceKeepsEarlierOperations) {
    Element document = parse(R"({"a": 1})");
    Patch patch = Patch::parse(R"([
        {"op": "add", "path": "/b", "value": 2},
        {"op": "move", "from": "/a", "path": "/c/d"},
        {"op": "add", "path": "/e", "value": 3}
    ])");

    try {
        patch.apply_in_place(document);
        FAIL() << "Expected ReferencesNonexistentValue";
    } catch (const ReferencesNonexistentValue& e) {
        EXPECT_EQ(e.operation_index(), std::optional<std::size_t>(1));
    }
    // The failed move itself left nothing behind
    EXPECT_EQ(document, parse(R"({"a": 1, "b": 2})"));
}

TEST(PatchAtomicity, ApplyInPlaceSuccess) {
    Element document = parse(R"({"a": [1]})");
    Element snapshot = document;
    Patch::parse(R"([{"op": "add", "path": "/a/0", "value": 0}])").apply_in_place(document);
    EXPECT_EQ(document, parse(R"({"a": [0, 1]})"));
    EXPECT_EQ(snapshot, parse(R"({"a": [1]})"));
}

TEST(PatchAtomicity, PatchCanBeReused) {
    Patch patch = Patch::parse(R"([{"op": "add", "path": "/n/-", "value": {"k": 1}}])");
    Element once = patch.apply(parse(R"({"n": []})"));
    Element twice = patch.apply(once);
    EXPECT_EQ(once, parse(R"({"n": [{"k": 1}]})"));
    EXPECT_EQ(twice, parse(R"({"n": [{"k": 1}, {"k": 1}]})"));
    // The patch's own value is never written through
    EXPECT_EQ(*patch.operations()[0].value, parse(R"({"k": 1})"));
}

// ============================================================================
// Options
// ============================================================================

TEST(PatchOptions, RelativeTo) {
    ApplyOptions options;
    options.relative_to = Pointer::parse("/config");

    Patch patch = Patch::parse(R"([
        {"op": "replace", "path": "/port", "value": 8080},
        {"op": "copy", "from": "/port", "path": "/backup"}
    ])");
    Element result = patch.apply(parse(R"({"config": {"port": 80}, "port": 1})"), options);
    EXPECT_EQ(result, parse(R"({"config": {"port": 8080, "backup": 8080}, "port": 1})"));
}

TEST(PatchOptions, OnAppliedReportsEachSuccess) {
    std::vector<std::size_t> indices;
    std::vector<std::string> paths;
    ApplyOptions options;
    options.relative_to = Pointer::parse("/cfg");
    options.on_applied = [&](std::size_t index, const Operation& op) {
        indices.push_back(index);
        paths.push_back(op.path.str());
    };

    Patch patch = Patch::parse(R"([
        {"op": "add", "path": "/a", "value": 1},
        {"op": "add", "path": "/b", "value": 2},
        {"op": "remove", "path": "/missing"},
        {"op": "add", "path": "/c", "value": 3}
    ])");
    EXPECT_THROW(patch.apply(parse(R"({"cfg": {}})"), options), ReferencesNonexistentValue);
    EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1}));
    EXPECT_EQ(paths, (std::vector<std::string>{"/cfg/a", "/cfg/b"}));

    indices.clear();
    Element document = parse(R"({"cfg": {}})");
    EXPECT_THROW(patch.apply_in_place(document, options), ReferencesNonexistentValue);
    EXPECT_EQ(indices, (std::vector<std::size_t>{0, 1}));
}

TEST(PatchOptions, RelativeToMissingSubtree) {
    ApplyOptions options;
    options.relative_to = Pointer::parse("/nope");
    Patch patch = Patch::parse(R"([{"op": "add", "path": "/a", "value": 1}])");
    EXPECT_THROW(patch.apply(parse("{}"), options), ReferencesNonexistentValue);
}

// ============================================================================
// apply_patch
// ============================================================================

TEST(PatchJson, ApplyPatchOnDecodedJson) {
    Json result = apply_patch(Json::parse(R"({"a": 1})"),
                              Json::parse(R"([{"op": "add", "path": "/b", "value": [1]}])"));
    EXPECT_EQ(result, Json::parse(R"({"a": 1, "b": [1]})"));
}

TEST(PatchJson, ApplyPatchKeepsMemberOrder) {
    Json result = apply_patch(Json::parse(R"({"z": 1, "a": 2})"),
                              Json::parse(R"([{"op": "add", "path": "/m", "value": 3}])"));
    EXPECT_EQ(result.dump(), R"({"z":1,"a":2,"m":3})");
}
