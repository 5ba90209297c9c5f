#include "doc/Document.hpp"
#include "doc/Parser.hpp"
#include "core/Errors.hpp"

#include <gtest/gtest.h>

#include <string>

static doc::Document with_id(const std::string& id) {
    doc::Document d;
    d.source_path = "x.adoc";
    d.attributes["id"] = id;
    return d;
}

static std::string id_error(const std::string& id) {
    try {
        with_id(id).validate_id_format();
    } catch (const core::InvalidIdFormat& e) {
        return e.what();
    }
    return "";
}

TEST(DocumentTest, RequiredStructureNeedsAllThreeAttributes) {
    doc::Document d;
    d.attributes = {{"type", "story"}, {"id", "a"}, {"schema-version", "1.0"}};
    EXPECT_TRUE(d.has_required_structure());

    for (const char* key : {"type", "id", "schema-version"}) {
        doc::Document missing = d;
        missing.attributes.erase(key);
        EXPECT_FALSE(missing.has_required_structure()) << key;
    }
}

TEST(DocumentTest, AttributeAccessors) {
    doc::Document d;
    d.attributes = {{"type", "story"}, {"id", "a"}};
    EXPECT_EQ(d.document_type(), std::optional<std::string>("story"));
    EXPECT_EQ(d.document_id(), std::optional<std::string>("a"));
    EXPECT_FALSE(d.schema_version().has_value());
}

TEST(DocumentTest, ValidIdsPass) {
    EXPECT_NO_THROW(with_id("my-id").validate_id_format());
    EXPECT_NO_THROW(with_id("a1-b2-c3").validate_id_format());
    EXPECT_NO_THROW(with_id("x").validate_id_format());
}

TEST(DocumentTest, InvalidIdsFailForDistinctReasons) {
    const std::string leading = id_error("-bad");
    const std::string trailing = id_error("bad-");
    const std::string doubled = id_error("ba--d");
    const std::string charset = id_error("Bad_ID");

    EXPECT_NE(leading.find("start or end with a hyphen"), std::string::npos) << leading;
    EXPECT_NE(trailing.find("start or end with a hyphen"), std::string::npos) << trailing;
    EXPECT_NE(doubled.find("consecutive hyphens"), std::string::npos) << doubled;
    EXPECT_NE(charset.find("only lowercase letters, numbers, and hyphens"), std::string::npos) << charset;
}

TEST(DocumentTest, MissingIdIsInvalid) {
    doc::Document d;
    EXPECT_THROW(d.validate_id_format(), core::InvalidIdFormat);
    EXPECT_THROW(with_id("").validate_id_format(), core::InvalidIdFormat);
}

TEST(DocumentTest, AbstractStopsAtBlankLine) {
    doc::Document d;
    d.content = "= T\n[abstract]\nFirst line.\nSecond line.\n\nNot abstract.\n";
    ASSERT_TRUE(d.abstract_content().has_value());
    EXPECT_EQ(*d.abstract_content(), "First line.\nSecond line.");
}

TEST(DocumentTest, AbstractSkipsLeadingBlankLines) {
    doc::Document d;
    d.content = "  [abstract]  \n\n\nOnly line.\n== Next\n";
    EXPECT_EQ(d.abstract_content(), std::optional<std::string>("Only line."));
}

TEST(DocumentTest, AbstractStopsAtHeadingOrMarker) {
    doc::Document d;
    d.content = "[abstract]\nSummary.\n[NOTE]\nAside.\n";
    EXPECT_EQ(d.abstract_content(), std::optional<std::string>("Summary."));

    d.content = "[abstract]\n== Heading\ntext\n";
    EXPECT_FALSE(d.abstract_content().has_value());
}

TEST(DocumentTest, NoAbstractMarkerMeansNone) {
    doc::Document d;
    d.content = "= T\nJust text.\n";
    EXPECT_FALSE(d.abstract_content().has_value());
}

TEST(DocumentTest, ExtractsInternalAndExternalReferences) {
    doc::Document d;
    d.content =
        "intro\n"
        "See xref:story:login-flow[] and xref:epic:auth[Auth].\n"
        "Upstream xref:github.com/org/repo#adr:token-format@v1.2[] here.\n"
        "Mixed xref:task:t-1 and xref:other/repo#story:x[].\n";

    const auto refs = d.extract_cross_references();
    ASSERT_EQ(refs.size(), 5u);

    EXPECT_EQ(refs[0].kind, "story");
    EXPECT_EQ(refs[0].id, "login-flow");
    EXPECT_EQ(refs[0].source_line, 2);
    EXPECT_FALSE(refs[0].is_external);

    EXPECT_EQ(refs[1].kind, "epic");
    EXPECT_EQ(refs[1].id, "auth");

    EXPECT_TRUE(refs[2].is_external);
    EXPECT_EQ(refs[2].kind, "adr");
    EXPECT_EQ(refs[2].id, "token-format");
    EXPECT_EQ(refs[2].repository, std::optional<std::string>("github.com/org/repo"));
    EXPECT_EQ(refs[2].version, std::optional<std::string>("v1.2"));
    EXPECT_EQ(refs[2].source_line, 3);

    // internal matches of a line come before its external ones
    EXPECT_FALSE(refs[3].is_external);
    EXPECT_EQ(refs[3].id, "t-1");
    EXPECT_TRUE(refs[4].is_external);
    EXPECT_EQ(refs[4].id, "x");
    EXPECT_FALSE(refs[4].version.has_value());
    EXPECT_EQ(refs[4].source_line, 4);
}

TEST(DocumentTest, ExtractsChecklistItems) {
    doc::Document d;
    d.content = "== Tasks\n* [ ] write tests\n  * [x]   ship it  \n* not a task\n- [x] wrong bullet\n";

    const auto items = d.extract_checklist_items();
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].text, "write tests");
    EXPECT_FALSE(items[0].checked);
    EXPECT_EQ(items[0].source_line, 2);
    EXPECT_EQ(items[1].text, "ship it");
    EXPECT_TRUE(items[1].checked);
    EXPECT_EQ(items[1].source_line, 3);
}

TEST(DocumentTest, SectionsWithTitle) {
    const doc::Document d = doc::parse_content("= T\n== Notes\na\n=== Notes\nb\n== Other\n", "x.adoc");
    const auto notes = d.sections_with_title("Notes");
    ASSERT_EQ(notes.size(), 2u);
    EXPECT_EQ(notes[0]->level, 2);
    EXPECT_EQ(notes[1]->level, 3);
    EXPECT_TRUE(d.sections_with_title("Missing").empty());
}

TEST(DocumentTest, ChecklistNearMisses) {
    doc::Document d;
    d.content = "*[x] no space\n* [y] bad mark\n* [x]\n* [ ]x glued\n\t* [x] tabbed\n";

    const auto items = d.extract_checklist_items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].text, "tabbed");
    EXPECT_EQ(items[0].source_line, 5);
}

TEST(DocumentTest, ReferenceLabelsAreSkipped) {
    doc::Document d;
    d.content = "xref:story:a[see xref:story:b] then xref:Bad:c and xref:story:[] and xref:story:d\n";

    const auto refs = d.extract_cross_references();
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].id, "a");
    EXPECT_EQ(refs[1].id, "d");
}

TEST(DocumentTest, ExternalVersionNeedsText) {
    doc::Document d;
    d.content = "xref:org/repo#story:a@[] and xref:org/repo#story:b@main\n";

    const auto refs = d.extract_cross_references();
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_FALSE(refs[0].version.has_value());
    EXPECT_EQ(refs[1].version, std::optional<std::string>("main"));
}

TEST(DocumentTest, VeryLongLinesExtract) {
    const std::string huge(200000, 'a');
    doc::Document d;
    d.content = "* [x] " + huge + "\n"
                "xref:" + huge + "\n"
                "xref:story:" + huge + "[]\n"
                "xref:" + huge + "#story:far@v1[]\n";

    const auto items = d.extract_checklist_items();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].text, huge);

    const auto refs = d.extract_cross_references();
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[0].id, huge);
    EXPECT_FALSE(refs[0].is_external);
    EXPECT_TRUE(refs[1].is_external);
    EXPECT_EQ(refs[1].repository->size(), huge.size());
    EXPECT_EQ(refs[1].id, "far");
}
