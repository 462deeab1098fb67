#include <gtest/gtest.h>

#include "MappingFile.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace fieldedit;

namespace {

class MappingFileTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = std::filesystem::temp_directory_path() /
          ("fieldedit_mapping_" + std::to_string(::getpid()));
    std::filesystem::create_directories(dir);
  }

  void TearDown() override {
    std::error_code ignored;
    std::filesystem::remove_all(dir, ignored);
  }

  std::string writeFile(const std::string &name, const std::string &content) {
    std::filesystem::path path = dir / name;
    std::ofstream out(path, std::ios::binary);
    out << content;
    return path.string();
  }

  std::filesystem::path dir;
};

} // anonymous namespace

TEST(MappingLineTest, QuotesControlCharacters) {
  EXPECT_EQ(quoteScalar("a\"b\\c"), "\"a\\\"b\\\\c\"");
  EXPECT_EQ(quoteScalar("x\ty\n"), "\"x\\ty\\n\"");
  EXPECT_EQ(quoteScalar(std::string("\x01", 1)), "\"\\x01\"");
}

TEST(MappingLineTest, ParsesQuotedAndPlainScalars) {
  MappingEntry entry;
  bool hasValue = false;

  ASSERT_TRUE(parseMappingLine("\"p0_x1y2a3b4_{{a}}\": \"Alice\"", entry,
                               hasValue));
  EXPECT_TRUE(hasValue);
  EXPECT_EQ(entry.key, "p0_x1y2a3b4_{{a}}");
  EXPECT_EQ(entry.value, "Alice");

  ASSERT_TRUE(parseMappingLine("name: Bob Smith  ", entry, hasValue));
  EXPECT_EQ(entry.key, "name");
  EXPECT_EQ(entry.value, "Bob Smith");

  ASSERT_TRUE(parseMappingLine("'it''s': 'x: y'", entry, hasValue));
  EXPECT_EQ(entry.key, "it's");
  EXPECT_EQ(entry.value, "x: y");
}

TEST(MappingLineTest, NullValuesHaveNoValue) {
  MappingEntry entry;
  bool hasValue = true;

  ASSERT_TRUE(parseMappingLine("city:", entry, hasValue));
  EXPECT_FALSE(hasValue);
  ASSERT_TRUE(parseMappingLine("city: ~", entry, hasValue));
  EXPECT_FALSE(hasValue);
  ASSERT_TRUE(parseMappingLine("city: null", entry, hasValue));
  EXPECT_FALSE(hasValue);

  ASSERT_TRUE(parseMappingLine("city: \"\"", entry, hasValue));
  EXPECT_TRUE(hasValue);
  EXPECT_EQ(entry.value, "");
}

TEST(MappingLineTest, DecodesUnicodeEscapes) {
  MappingEntry entry;
  bool hasValue = false;

  ASSERT_TRUE(parseMappingLine("name: \"Ren\\u00e9e\"", entry, hasValue));
  EXPECT_EQ(entry.value, "Ren\xc3\xa9" "e");

  ASSERT_TRUE(parseMappingLine("name: \"\\u65E5\\U0001F600\"", entry, hasValue));
  EXPECT_EQ(entry.value, "\xe6\x97\xa5\xf0\x9f\x98\x80");

  ASSERT_TRUE(parseMappingLine("name: \"a\\_b\\Nc\\ed\"", entry, hasValue));
  EXPECT_EQ(entry.value, "a\xc2\xa0" "b\xc2\x85" "c\x1b" "d");
}

TEST(MappingLineTest, RejectsUnknownOrShortEscapes) {
  MappingEntry entry;
  bool hasValue = false;

  EXPECT_FALSE(parseMappingLine("name: \"\\q\"", entry, hasValue));
  EXPECT_FALSE(parseMappingLine("name: \"\\u00e\"", entry, hasValue));
  EXPECT_FALSE(parseMappingLine("name: \"\\uD800\"", entry, hasValue));
}

TEST(MappingLineTest, CommentsAndBlanksAreIgnored) {
  MappingEntry entry;
  bool hasValue = false;

  ASSERT_TRUE(parseMappingLine("", entry, hasValue));
  EXPECT_TRUE(entry.key.empty());
  ASSERT_TRUE(parseMappingLine("   # note", entry, hasValue));
  EXPECT_TRUE(entry.key.empty());
}

TEST(MappingLineTest, RejectsMalformedLines) {
  MappingEntry entry;
  bool hasValue = false;

  EXPECT_FALSE(parseMappingLine("no separator", entry, hasValue));
  EXPECT_FALSE(parseMappingLine("\"unterminated: x", entry, hasValue));
  EXPECT_FALSE(parseMappingLine("\"key\" x", entry, hasValue));
}

TEST_F(MappingFileTest, RoundTripsAwkwardText) {
  std::vector<MappingEntry> entries{
      {"p0_x10y10a60b20_{{name}}", "{{name}}"},
      {"p0_x10y30a60b40_a\\nb", "quote \" and\nnewline \\ slash"},
      {"p1_x1y2a3b4_x", "tab\there"}};

  std::string path = (dir / "form.yaml").string();
  std::string error;
  ASSERT_TRUE(writeMappingFile(path, entries, error)) << error;

  MappingFile file = readMappingFile(path);
  ASSERT_TRUE(file.success) << file.errorMessage;
  ASSERT_EQ(file.entries.size(), 3u);
  EXPECT_EQ(file.entries[0].key, "p0_x10y10a60b20_{{name}}");

  ReplacementRequest request = toReplacementRequest(file.entries);
  for (const MappingEntry &entry : entries) {
    EXPECT_EQ(request[entry.key], entry.value) << entry.key;
  }
}

TEST_F(MappingFileTest, CountsNullAndMalformedLines) {
  std::string path = writeFile("edited.yaml", "# fields\n"
                                              "\"p0_x1y2a3b4_a\": \"A\"\n"
                                              "\"p0_x1y6a3b8_b\":\n"
                                              "garbage line\n"
                                              "\n");

  MappingFile file = readMappingFile(path);
  ASSERT_TRUE(file.success);
  ASSERT_EQ(file.entries.size(), 1u);
  EXPECT_EQ(file.nullEntries, 1u);
  EXPECT_EQ(file.malformedLines, 1u);
}

TEST_F(MappingFileTest, MissingFileFails) {
  MappingFile file = readMappingFile((dir / "absent.yaml").string());
  EXPECT_FALSE(file.success);
  EXPECT_FALSE(file.errorMessage.empty());
}

TEST_F(MappingFileTest, AliasOverlayResolvesNames) {
  std::string pdf = (dir / "invoice.pdf").string();
  EXPECT_EQ(aliasFilePath(pdf), (dir / "invoice.alias.yaml").string());

  writeFile("invoice.alias.yaml", "\"p0_x10y10a60b20_{{name}}\": \"name\"\n"
                                  "\"p0_x10y30a60b40_{{city}}\": city\n");

  std::map<std::string, std::string> aliases = loadAliasMap(pdf);
  ASSERT_EQ(aliases.size(), 2u);
  EXPECT_EQ(aliases["name"], "p0_x10y10a60b20_{{name}}");

  ReplacementRequest request = resolveAliases(
      {{"name", "Alice"}, {"p0_x1y2a3b4_raw", "kept"}}, aliases);
  EXPECT_EQ(request["p0_x10y10a60b20_{{name}}"], "Alice");
  EXPECT_EQ(request["p0_x1y2a3b4_raw"], "kept");
  EXPECT_EQ(request.count("name"), 0u);
}

TEST_F(MappingFileTest, MissingOverlayIsEmpty) {
  EXPECT_TRUE(loadAliasMap((dir / "plain.pdf").string()).empty());
}

TEST(FieldListTest, UsesAliasWhereKnown) {
  std::vector<TextRun> runs(2);
  runs[0].key = "p0_x10y10a60b20_{{name}}";
  runs[0].text = "{{name}}";
  runs[1].key = "p0_x10y30a60b40_{{city}}";
  runs[1].text = "{{city}}";

  std::vector<std::string> lines =
      formatFieldList(runs, {{"name", "p0_x10y10a60b20_{{name}}"}});
  ASSERT_EQ(lines.size(), 2u);
  EXPECT_EQ(lines[0], "name: \"{{name}}\"");
  EXPECT_EQ(lines[1], "p0_x10y30a60b40_{{city}}: \"{{city}}\"");
}
