#include "lint/Linter.hpp"
#include "TestSupport.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using testsupport::TempDir;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::string task_doc(const std::string& id, const std::string& body = "") {
    return "= Task " + id + "\n:type: task\n:id: " + id + "\n:schema-version: 1.0\n\n== Body\n" + body + "\n";
}

bool has_rule(const std::vector<lint::ValidationError>& v, const std::string& rule) {
    return std::any_of(v.begin(), v.end(), [&](const lint::ValidationError& e) { return e.rule == rule; });
}

class LinterTest : public ::testing::Test {
protected:
    void SetUp() override {
        testsupport::write_schema_dir(m_dir, {{"story", testsupport::story_schema()}, {"task", json{{"type", "object"}}}});
        m_loader = std::make_unique<schema::SchemaLoader>(m_dir.path() / "schema", testsupport::fake_engine());
        m_loader->load();
    }

    lint::LinterConfig config(int jobs = 2) const {
        lint::LinterConfig cfg;
        cfg.schema_path = m_dir.path() / "schema";
        cfg.jobs = jobs;
        return cfg;
    }

    TempDir m_dir{"linter"};
    std::unique_ptr<schema::SchemaLoader> m_loader;
};

}  // namespace

TEST_F(LinterTest, EmptyInputGivesNoResults) {
    lint::Linter linter(config(), *m_loader);
    EXPECT_TRUE(linter.lint_files({}).empty());
}

TEST_F(LinterTest, DuplicateIdsFlagBothFiles) {
    const fs::path a = m_dir.write("docs/a.adoc", task_doc("dup"));
    const fs::path b = m_dir.write("docs/b.adoc", task_doc("dup"));

    lint::Linter linter(config(), *m_loader);
    auto results = linter.lint_files({a, b});
    ASSERT_EQ(results.size(), 2u);

    for (size_t i = 0; i < 2; ++i) {
        const auto& r = results[i];
        const fs::path& other = i == 0 ? b : a;
        EXPECT_FALSE(r.valid);
        ASSERT_EQ(r.errors.size(), 1u);
        EXPECT_EQ(r.errors[0].kind, lint::ErrorKind::IdConflict);
        EXPECT_NE(r.errors[0].message.find(other.string()), std::string::npos) << r.errors[0].message;
    }
}

TEST_F(LinterTest, DuplicateCheckCanBeDisabled) {
    const fs::path a = m_dir.write("a.adoc", task_doc("dup"));
    const fs::path b = m_dir.write("b.adoc", task_doc("dup"));

    auto cfg = config();
    cfg.rules.check_id_uniqueness = false;
    lint::Linter linter(cfg, *m_loader);
    for (const auto& r : linter.lint_files({a, b})) EXPECT_TRUE(r.valid);
}

TEST_F(LinterTest, ForwardReferencesResolveAcrossTheBatch) {
    const fs::path a = m_dir.write("a.adoc", task_doc("first", "Needs xref:task:second[]."));
    const fs::path b = m_dir.write("b.adoc", task_doc("second", "Back to xref:task:first[the first]."));

    lint::Linter linter(config(1), *m_loader);
    auto results = linter.lint_files({a, b});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].valid);
    EXPECT_TRUE(results[1].valid);
}

TEST_F(LinterTest, DanglingReferenceFailsOnlyReferrer) {
    const fs::path a = m_dir.write("a.adoc", task_doc("first", "Needs xref:task:ghost[]."));
    const fs::path b = m_dir.write("b.adoc", task_doc("second"));

    lint::Linter linter(config(), *m_loader);
    auto results = linter.lint_files({a, b});
    EXPECT_FALSE(results[0].valid);
    EXPECT_TRUE(has_rule(results[0].errors, lint::rules::kReferenceIntegrity));
    EXPECT_TRUE(results[1].valid);
}

TEST_F(LinterTest, ReferenceCheckCanBeDisabled) {
    const fs::path a = m_dir.write("a.adoc", task_doc("first", "Needs xref:task:ghost[]."));

    auto cfg = config();
    cfg.rules.validate_references = false;
    lint::Linter linter(cfg, *m_loader);
    EXPECT_TRUE(linter.lint_file(a).valid);
}

TEST_F(LinterTest, ExternalReferenceIsWarningOnly) {
    const fs::path a = m_dir.write("a.adoc", task_doc("first", "See xref:other/repo#story:login@main[]."));

    lint::Linter linter(config(), *m_loader);
    auto r = linter.lint_file(a);
    EXPECT_TRUE(r.valid);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_TRUE(has_rule(r.warnings, lint::rules::kExternalReference));
}

TEST_F(LinterTest, UnreadableFileBecomesParseErrorResult) {
    const fs::path good = m_dir.write("good.adoc", task_doc("good"));
    const fs::path missing = m_dir.path() / "missing.adoc";

    lint::Linter linter(config(), *m_loader);
    auto results = linter.lint_files({missing, good});
    ASSERT_EQ(results.size(), 2u);

    EXPECT_EQ(results[0].source_path, missing.string());
    EXPECT_FALSE(results[0].valid);
    ASSERT_EQ(results[0].errors.size(), 1u);
    EXPECT_EQ(results[0].errors[0].kind, lint::ErrorKind::Format);
    EXPECT_EQ(results[0].errors[0].rule, std::optional<std::string>(lint::rules::kFileParsing));
    EXPECT_EQ(results[0].errors[0].message.rfind("Failed to parse file: ", 0), 0u);

    EXPECT_TRUE(results[1].valid);
}

TEST_F(LinterTest, ResultsKeepInputOrderWithManyWorkers) {
    std::vector<fs::path> files;
    for (int i = 0; i < 40; ++i) {
        files.push_back(m_dir.write("many/doc-" + std::to_string(i) + ".adoc", task_doc("doc-" + std::to_string(i))));
    }

    lint::Linter linter(config(8), *m_loader);
    auto results = linter.lint_files(files);
    ASSERT_EQ(results.size(), files.size());
    for (size_t i = 0; i < files.size(); ++i) {
        EXPECT_EQ(results[i].source_path, files[i].string());
        EXPECT_EQ(results[i].document_id, std::optional<std::string>("doc-" + std::to_string(i)));
        EXPECT_TRUE(results[i].valid);
    }
}

TEST_F(LinterTest, FindFilesHonoursExcludes) {
    m_dir.write("tree/a.adoc", task_doc("a"));
    m_dir.write("tree/node_modules/b.adoc", task_doc("b"));
    m_dir.write("tree/c.tmp.adoc", task_doc("c"));
    m_dir.write("tree/readme.md", "# no");

    lint::Linter linter(config(), *m_loader);
    auto files = linter.find_files({(m_dir.path() / "tree").string()});
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename(), "a.adoc");
}

TEST_F(LinterTest, HugeDocumentDoesNotDisturbTheBatch) {
    const std::string huge(200000, 'a');
    std::string big = "= Big\n:type: task\n:id: big\n:schema-version: 1.0\n:description: " + huge + "\n\n== Body\n";
    big += "* [ ] " + huge + "\n";
    big += "xref:" + huge + "\n";
    for (int i = 0; i < 5000; ++i) big += "line " + std::to_string(i) + " see xref:task:good[]\n";

    const fs::path a = m_dir.write("big.adoc", big);
    const fs::path b = m_dir.write("good.adoc", task_doc("good"));
    const fs::path c = m_dir.write("dangling.adoc", task_doc("dangling", "xref:task:" + huge + "[]"));

    lint::Linter linter(config(), *m_loader);
    auto results = linter.lint_files({a, b, c});
    ASSERT_EQ(results.size(), 3u);

    EXPECT_TRUE(results[0].valid);
    EXPECT_EQ(results[0].document_id, std::optional<std::string>("big"));
    EXPECT_TRUE(results[1].valid);

    EXPECT_FALSE(results[2].valid);
    ASSERT_EQ(results[2].errors.size(), 1u);
    EXPECT_EQ(results[2].errors[0].rule, std::optional<std::string>(lint::rules::kReferenceIntegrity));
}

TEST_F(LinterTest, BinaryFileYieldsItsOwnResult) {
    std::string junk;
    for (int i = 0; i < 100000; ++i) junk.push_back(static_cast<char>(i % 256));
    const fs::path a = m_dir.write("junk.adoc", junk);
    const fs::path b = m_dir.write("good.adoc", task_doc("good"));

    lint::Linter linter(config(), *m_loader);
    auto results = linter.lint_files({a, b});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].valid);
    EXPECT_TRUE(has_rule(results[0].errors, lint::rules::kRequireStructure));
    EXPECT_TRUE(results[1].valid);
}
