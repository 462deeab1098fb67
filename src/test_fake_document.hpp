#ifndef FIELD_EDIT_TEST_FAKE_DOCUMENT_HPP
#define FIELD_EDIT_TEST_FAKE_DOCUMENT_HPP

#include "Document.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace fieldedit {
namespace test {

// Scripted Document: returns canned runs and records every edit call
class FakeDocument : public Document {
public:
  explicit FakeDocument(int pages = 1)
      : m_path("fake.pdf"), m_pages(static_cast<std::size_t>(pages)) {}

  void addRun(int page, const std::string &text, const BoundingBox &bbox,
              const RGBColor &color = RGBColor(),
              const std::string &font = "Helvetica", double size = 12.0) {
    PageTextRun run;
    run.text = text;
    run.bbox = bbox;
    run.fontFamily = font;
    run.fontSize = size;
    run.color = color;
    m_pages[static_cast<std::size_t>(page)].push_back(run);
  }

  // Overrides what findText() reports for a string on a page
  void setOccurrences(int page, const std::string &literal,
                      std::vector<BoundingBox> boxes) {
    m_occurrences[std::make_pair(page, literal)] = std::move(boxes);
  }

  const std::string &path() const override { return m_path; }
  bool isOpen() const override { return m_open; }
  int pageCount() const override { return static_cast<int>(m_pages.size()); }

  std::vector<PageTextRun> textRuns(int page) const override {
    return m_pages[static_cast<std::size_t>(page)];
  }

  // By default every run whose text equals the literal is an occurrence
  std::vector<BoundingBox> findText(int page,
                                    const std::string &literal) const override {
    auto it = m_occurrences.find(std::make_pair(page, literal));
    if (it != m_occurrences.end()) {
      return it->second;
    }
    std::vector<BoundingBox> boxes;
    for (const PageTextRun &run : m_pages[static_cast<std::size_t>(page)]) {
      if (run.text == literal) {
        boxes.push_back(run.bbox);
      }
    }
    return boxes;
  }

  bool redactRegion(int page, const BoundingBox &region,
                    bool preserveNonTextGraphics) override {
    calls.push_back("redact:" + std::to_string(page));
    redactedRegions.push_back(region);
    lastPreserveGraphics = preserveNonTextGraphics;
    return redactSucceeds;
  }

  bool insertStyledText(int page, const BoundingBox &box,
                        const std::string &text, const std::string &fontFamily,
                        double fontSize, const RGBColor &color,
                        double /*baselineRatio*/) override {
    calls.push_back("styled:" + std::to_string(page) + ":" + text);
    if (!styledSucceeds) {
      return false;
    }
    styledBoxes.push_back(box);
    insertedFonts.push_back(fontFamily);
    insertedSizes.push_back(fontSize);
    insertedColors.push_back(color);
    return true;
  }

  bool insertPlainText(int page, double x, double y, const std::string &text,
                       double /*fontSize*/, const std::string &fontName,
                       const RGBColor &color) override {
    calls.push_back("plain:" + std::to_string(page) + ":" + text);
    if (!plainSucceeds) {
      return false;
    }
    plainOrigins.emplace_back(x, y);
    insertedFonts.push_back(fontName);
    insertedColors.push_back(color);
    return true;
  }

  void save() override {
    calls.push_back("save");
    saveCount++;
  }

  void close() override { m_open = false; }

  bool redactSucceeds = true;
  bool styledSucceeds = true;
  bool plainSucceeds = true;

  std::vector<std::string> calls;
  std::vector<BoundingBox> redactedRegions;
  std::vector<BoundingBox> styledBoxes;
  std::vector<std::pair<double, double>> plainOrigins;
  std::vector<std::string> insertedFonts;
  std::vector<double> insertedSizes;
  std::vector<RGBColor> insertedColors;
  bool lastPreserveGraphics = false;
  int saveCount = 0;

private:
  std::string m_path;
  std::vector<std::vector<PageTextRun>> m_pages;
  std::map<std::pair<int, std::string>, std::vector<BoundingBox>>
      m_occurrences;
  bool m_open = true;
};

} // namespace test
} // namespace fieldedit

#endif // FIELD_EDIT_TEST_FAKE_DOCUMENT_HPP
