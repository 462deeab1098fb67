#include <gtest/gtest.h>

#include "TemplateEngine.hpp"
#include "test_fake_document.hpp"

using namespace fieldedit;
using fieldedit::test::FakeDocument;

namespace {

const RGBColor kRed{0.8, 0.1, 0.1};
const RGBColor kOrange{0.6, 0.4, 0.1};

} // anonymous namespace

TEST(RunExtractorTest, RedTest) {
  EXPECT_TRUE(isRedColor(kRed));
  EXPECT_FALSE(isRedColor(kOrange));
  EXPECT_FALSE(isRedColor(RGBColor()));
  EXPECT_FALSE(isRedColor(RGBColor{0.5, 0.0, 0.0}));
}

TEST(RunExtractorTest, BuildsKeysFromPageBoxAndTrimmedText) {
  FakeDocument doc(2);
  doc.addRun(1, "  {{name}} ", {10.0, 10.0, 60.0, 20.0}, kRed, "Arial", 11.0);

  std::vector<TextRun> runs = extractRuns(doc);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].key, "p1_x10y10a60b20_{{name}}");
  EXPECT_EQ(runs[0].page, 1);
  EXPECT_EQ(runs[0].text, "{{name}}");
  EXPECT_EQ(runs[0].fontFamily, "Arial");
  EXPECT_DOUBLE_EQ(runs[0].fontSize, 11.0);
  EXPECT_DOUBLE_EQ(runs[0].color.r, 0.8);
}

TEST(RunExtractorTest, SkipsBlankRuns) {
  FakeDocument doc;
  doc.addRun(0, "   ", {0, 0, 10, 10});
  doc.addRun(0, "", {0, 0, 10, 10});
  doc.addRun(0, "x", {0, 0, 10, 10});

  EXPECT_EQ(extractRuns(doc).size(), 1u);
}

TEST(RunExtractorTest, MissingFontIsUnknown) {
  FakeDocument doc;
  doc.addRun(0, "x", {0, 0, 10, 10}, RGBColor(), "");

  std::vector<TextRun> runs = extractRuns(doc);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].fontFamily, "Unknown");
}

TEST(RunExtractorTest, RedFilterKeepsOnlyRedRuns) {
  FakeDocument doc;
  doc.addRun(0, "Name:", {10, 10, 40, 20});
  doc.addRun(0, "{{name}}", {50, 10, 90, 20}, kRed);
  doc.addRun(0, "Note", {10, 30, 40, 40}, kOrange);

  std::vector<TextRun> runs = extractRuns(doc, ColorFilter::Red);
  ASSERT_EQ(runs.size(), 1u);
  EXPECT_EQ(runs[0].text, "{{name}}");

  EXPECT_EQ(extractRuns(doc, ColorFilter::None).size(), 3u);
}

TEST(RunExtractorTest, KeepsDocumentOrderUnlessSorted) {
  FakeDocument doc(2);
  doc.addRun(1, "second page", {0, 0, 10, 10});
  doc.addRun(0, "right", {50, 100.6, 60, 110});
  doc.addRun(0, "left", {5, 100.4, 15, 110});
  doc.addRun(0, "top", {80, 20, 90, 30});

  std::vector<TextRun> unsorted = extractRuns(doc);
  ASSERT_EQ(unsorted.size(), 4u);
  EXPECT_EQ(unsorted[0].text, "right");
  EXPECT_EQ(unsorted[3].text, "second page");

  std::vector<TextRun> sorted = extractRuns(doc, ColorFilter::None, true);
  ASSERT_EQ(sorted.size(), 4u);
  EXPECT_EQ(sorted[0].text, "top");
  EXPECT_EQ(sorted[1].text, "left");
  EXPECT_EQ(sorted[2].text, "right");
  EXPECT_EQ(sorted[3].text, "second page");
}

TEST(RunExtractorTest, SortSeparatesRowsByRoundedTop) {
  std::vector<TextRun> runs(2);
  runs[0].text = "lower";
  runs[0].bbox = {1, 100.6, 10, 110};
  runs[1].text = "upper";
  runs[1].bbox = {5, 100.4, 15, 110};

  // 100.6 rounds to 101 and 100.4 to 100, so x does not decide here
  sortByPosition(runs);
  EXPECT_EQ(runs[0].text, "upper");
  EXPECT_EQ(runs[1].text, "lower");
}
