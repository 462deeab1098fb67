#include <gtest/gtest.h>

#include "TemplateEditor.hpp"
#include "test_fake_document.hpp"

#include <memory>

using namespace fieldedit;
using fieldedit::test::FakeDocument;

namespace {

const RGBColor kRed{0.9, 0.0, 0.0};

class ReplacementExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    auto doc = std::make_unique<FakeDocument>();
    doc->addRun(0, "{{a}}", {10, 10, 50, 20}, kRed);
    doc->addRun(0, "{{b}}", {10, 30, 50, 40}, kRed);
    fake = doc.get();
    editor = std::make_unique<TemplateEditor>(std::move(doc));
  }

  const EditOutcome *outcomeFor(const ReplacementReport &report,
                                const std::string &key) const {
    for (const EditOutcome &outcome : report.outcomes) {
      if (outcome.key == key) {
        return &outcome;
      }
    }
    return nullptr;
  }

  const std::string keyA = "p0_x10y10a50b20_{{a}}";
  const std::string keyB = "p0_x10y30a50b40_{{b}}";
  FakeDocument *fake = nullptr;
  std::unique_ptr<TemplateEditor> editor;
};

} // anonymous namespace

TEST_F(ReplacementExecutorTest, RemovesEverythingBeforeInserting) {
  ReplacementReport report =
      editor->replaceTemplates({{keyA, "Alice"}, {keyB, "Bob"}});

  ASSERT_TRUE(report.success) << report.errorMessage;
  EXPECT_EQ(report.requested, 2u);
  EXPECT_EQ(report.applied, 2u);

  std::vector<std::string> expected{"redact:0", "redact:0", "styled:0:Alice",
                                    "styled:0:Bob", "save"};
  EXPECT_EQ(fake->calls, expected);
  EXPECT_TRUE(fake->lastPreserveGraphics);
}

TEST_F(ReplacementExecutorTest, InsertsWithRunFontAndRequestedColor) {
  RGBColor blue{0.0, 0.0, 1.0};
  ReplacementReport report = editor->replaceTemplates({{keyA, "Alice"}}, blue);

  ASSERT_EQ(report.applied, 1u);
  ASSERT_EQ(fake->insertedFonts.size(), 1u);
  EXPECT_EQ(fake->insertedFonts[0], "Helvetica");
  EXPECT_DOUBLE_EQ(fake->insertedSizes[0], 12.0);
  EXPECT_DOUBLE_EQ(fake->insertedColors[0].b, 1.0);
  EXPECT_DOUBLE_EQ(fake->styledBoxes[0].x1, 10.0);
}

TEST_F(ReplacementExecutorTest, FallsBackToPlainText) {
  fake->styledSucceeds = false;

  ReplacementReport report = editor->replaceTemplates({{keyA, "Alice"}});

  EXPECT_EQ(report.applied, 1u);
  const EditOutcome *outcome = outcomeFor(report, keyA);
  ASSERT_NE(outcome, nullptr);
  EXPECT_EQ(outcome->status, EditStatus::AppliedWithFallback);

  // Baseline at 80% of the box height from its top
  ASSERT_EQ(fake->plainOrigins.size(), 1u);
  EXPECT_DOUBLE_EQ(fake->plainOrigins[0].first, 10.0);
  EXPECT_DOUBLE_EQ(fake->plainOrigins[0].second, 18.0);
  EXPECT_EQ(fake->insertedFonts.back(), "Helvetica");
}

TEST_F(ReplacementExecutorTest, ReportsInsertFailure) {
  fake->styledSucceeds = false;
  fake->plainSucceeds = false;

  ReplacementReport report = editor->replaceTemplates({{keyA, "Alice"}});

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.applied, 0u);
  const EditOutcome *outcome = outcomeFor(report, keyA);
  ASSERT_NE(outcome, nullptr);
  EXPECT_EQ(outcome->status, EditStatus::SkippedInsertFailed);
  EXPECT_FALSE(outcome->detail.empty());

  // The original was removed, so the document still changed
  EXPECT_EQ(fake->saveCount, 1);
}

TEST_F(ReplacementExecutorTest, SkipsRunThatCannotBeLocated) {
  fake->setOccurrences(0, "{{a}}", {{200, 200, 240, 210}});

  ReplacementReport report = editor->replaceTemplates({{keyA, "Alice"}});

  EXPECT_EQ(report.applied, 0u);
  const EditOutcome *outcome = outcomeFor(report, keyA);
  ASSERT_NE(outcome, nullptr);
  EXPECT_EQ(outcome->status, EditStatus::SkippedNotLocated);
  EXPECT_TRUE(fake->calls.empty());
}

TEST_F(ReplacementExecutorTest, UsesOccurrenceNearestTheRun) {
  fake->setOccurrences(0, "{{a}}",
                       {{300, 300, 340, 310}, {11, 10.5, 51, 20.5}});

  editor->replaceTemplates({{keyA, "Alice"}});

  ASSERT_EQ(fake->redactedRegions.size(), 1u);
  EXPECT_DOUBLE_EQ(fake->redactedRegions[0].x1, 11.0);
  EXPECT_DOUBLE_EQ(fake->redactedRegions[0].y1, 10.5);
}

TEST_F(ReplacementExecutorTest, PicksClosestOfSeveralOccurrences) {
  // Both hits are within tolerance of the run; the second is exact
  fake->setOccurrences(0, "{{a}}", {{10, 18, 50, 28}, {10, 10, 50, 20}});

  editor->replaceTemplates({{keyA, "Alice"}});

  ASSERT_EQ(fake->redactedRegions.size(), 1u);
  EXPECT_DOUBLE_EQ(fake->redactedRegions[0].y1, 10.0);
}

TEST_F(ReplacementExecutorTest, SkipsWhenRedactionRemovesNothing) {
  fake->redactSucceeds = false;

  ReplacementReport report = editor->replaceTemplates({{keyA, "Alice"}});

  EXPECT_EQ(report.applied, 0u);
  EXPECT_EQ(outcomeFor(report, keyA)->status,
            EditStatus::SkippedRedactionFailed);
  EXPECT_EQ(fake->saveCount, 0);
}

TEST_F(ReplacementExecutorTest, UnmatchedKeyIsSkipped) {
  ReplacementReport report = editor->replaceTemplates(
      {{keyA, "Alice"}, {"p0_x300y300a340b310_{{gone}}", "x"}});

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.requested, 2u);
  EXPECT_EQ(report.applied, 1u);
  EXPECT_EQ(report.outcomes.size(), 2u);
  EXPECT_EQ(outcomeFor(report, "p0_x300y300a340b310_{{gone}}")->status,
            EditStatus::SkippedNoMatch);
}

TEST_F(ReplacementExecutorTest, MalformedKeyIsSkipped) {
  ReplacementReport report =
      editor->replaceTemplates({{keyA, "Alice"}, {"not a key", "x"}});

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.applied, 1u);
  EXPECT_EQ(outcomeFor(report, "not a key")->status,
            EditStatus::SkippedMalformedKey);
}

TEST_F(ReplacementExecutorTest, EmptyRequestFails) {
  ReplacementReport report = editor->replaceTemplates({});

  EXPECT_FALSE(report.success);
  EXPECT_FALSE(report.errorMessage.empty());
  EXPECT_TRUE(fake->calls.empty());
}

TEST_F(ReplacementExecutorTest, EmptyValueOnlyRemoves) {
  ReplacementReport report = editor->replaceTemplates({{keyA, ""}});

  EXPECT_EQ(report.applied, 1u);
  std::vector<std::string> expected{"redact:0", "save"};
  EXPECT_EQ(fake->calls, expected);
}

TEST_F(ReplacementExecutorTest, ClosedEditorReportsError) {
  editor->close();
  EXPECT_FALSE(editor->isOpen());

  ReplacementReport report = editor->replaceTemplates({{keyA, "Alice"}});
  EXPECT_FALSE(report.success);
  EXPECT_NE(report.errorMessage.find("closed"), std::string::npos);
}

TEST(RemoveTemplatesTest, StripsPlaceholdersAndKeepsRemainder) {
  auto doc = std::make_unique<FakeDocument>();
  doc->addRun(0, "Total: {{amount}}", {10, 10, 120, 20}, kRed, "Courier", 10.0);
  doc->addRun(0, "{{name}}", {10, 30, 60, 40});
  doc->addRun(0, "Plain text", {10, 50, 60, 60});
  FakeDocument *fake = doc.get();
  TemplateEditor editor(std::move(doc));

  RemovalReport report = editor.removeTemplates();

  ASSERT_TRUE(report.success) << report.errorMessage;
  EXPECT_EQ(report.removed, 2u);
  EXPECT_EQ(report.reinserted, 1u);
  ASSERT_EQ(report.texts.size(), 2u);
  EXPECT_EQ(report.texts[0], "Total: {{amount}}");

  std::vector<std::string> expected{"redact:0", "redact:0", "styled:0:Total:",
                                    "save"};
  EXPECT_EQ(fake->calls, expected);
  EXPECT_EQ(fake->insertedFonts[0], "Courier");
  EXPECT_DOUBLE_EQ(fake->insertedColors[0].r, 0.9);
}

TEST(RemoveTemplatesTest, NothingToRemoveLeavesDocumentAlone) {
  auto doc = std::make_unique<FakeDocument>();
  doc->addRun(0, "Plain text", {10, 50, 60, 60});
  FakeDocument *fake = doc.get();
  TemplateEditor editor(std::move(doc));

  RemovalReport report = editor.removeTemplates();

  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.removed, 0u);
  EXPECT_EQ(fake->saveCount, 0);
}

TEST(RemoveTemplatesTest, InvalidPatternIsReported) {
  TemplateEditor editor(std::make_unique<FakeDocument>());

  RemovalReport report = editor.removeTemplates("([");
  EXPECT_FALSE(report.success);
  EXPECT_FALSE(report.errorMessage.empty());
}

TEST(TemplateEditorTest, GetAllTemplatesReturnsSortedUniqueTexts) {
  auto doc = std::make_unique<FakeDocument>();
  doc->addRun(0, "{{b}}", {10, 10, 50, 20});
  doc->addRun(0, "{{a}}", {10, 30, 50, 40});
  doc->addRun(0, "{{b}}", {10, 50, 50, 60});
  doc->addRun(0, "Name:", {10, 70, 50, 80});
  TemplateEditor editor(std::move(doc));

  std::vector<std::string> templates =
      editor.getAllTemplates(kPlaceholderPattern);
  std::vector<std::string> expected{"{{a}}", "{{b}}"};
  EXPECT_EQ(templates, expected);
}

TEST(TemplateEditorTest, MissingFileThrows) {
  EXPECT_THROW(TemplateEditor("/nonexistent/form.pdf"), DocumentError);
}

TEST(TemplateEditorTest, ExtractThenReplaceRedField) {
  auto doc = std::make_unique<FakeDocument>();
  doc->addRun(0, "Name:", {0, 10, 9, 20});
  doc->addRun(0, "{{name}}", {10, 10, 60, 20}, RGBColor{0.8, 0.1, 0.1});
  FakeDocument *fake = doc.get();
  TemplateEditor editor(std::move(doc));

  std::vector<TextRun> fields = editor.findTemplates(ColorFilter::Red);
  ASSERT_EQ(fields.size(), 1u);
  EXPECT_EQ(fields[0].key, "p0_x10y10a60b20_{{name}}");

  ReplacementReport report = editor.replaceTemplates({{fields[0].key, "Alice"}});
  EXPECT_TRUE(report.success);
  EXPECT_EQ(report.applied, 1u);
  ASSERT_EQ(fake->redactedRegions.size(), 1u);
  EXPECT_DOUBLE_EQ(fake->redactedRegions[0].x1, 10.0);
  ASSERT_EQ(fake->styledBoxes.size(), 1u);
  EXPECT_DOUBLE_EQ(fake->styledBoxes[0].x2, 60.0);
}

TEST(TemplateEditorTest, NearbyIdenticalFieldsAreReplacedSeparately) {
  auto doc = std::make_unique<FakeDocument>();
  doc->addRun(0, "___", {10, 95, 40, 102});
  doc->addRun(0, "___", {10, 103, 40, 110});
  FakeDocument *fake = doc.get();
  TemplateEditor editor(std::move(doc));

  ReplacementReport report =
      editor.replaceTemplates({{"p0_x10y95a40b102____", "row95"},
                               {"p0_x10y103a40b110____", "row103"}});

  ASSERT_TRUE(report.success) << report.errorMessage;
  EXPECT_EQ(report.applied, 2u);

  // Each field is removed once, at its own position
  ASSERT_EQ(fake->redactedRegions.size(), 2u);
  EXPECT_DOUBLE_EQ(fake->redactedRegions[0].y1, 95.0);
  EXPECT_DOUBLE_EQ(fake->redactedRegions[1].y1, 103.0);

  std::vector<std::string> expected{"redact:0", "redact:0", "styled:0:row95",
                                    "styled:0:row103", "save"};
  EXPECT_EQ(fake->calls, expected);
  ASSERT_EQ(fake->styledBoxes.size(), 2u);
  EXPECT_DOUBLE_EQ(fake->styledBoxes[0].y1, 95.0);
  EXPECT_DOUBLE_EQ(fake->styledBoxes[1].y1, 103.0);
}
