#include "TemplateEngine.hpp"

#include <algorithm>
#include <cmath>

namespace fieldedit {

bool isRedColor(const RGBColor &color) {
  return color.r > 0.5 && color.g < 0.3 && color.b < 0.3;
}

std::string trimText(const std::string &text) {
  const char *whitespace = " \t\n\r\f\v";
  std::string::size_type first = text.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return std::string();
  }
  std::string::size_type last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

std::vector<TextRun> extractRuns(const Document &document, ColorFilter filter,
                                 bool sortRuns) {
  std::vector<TextRun> results;

  int pageCount = document.pageCount();
  for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
    for (const PageTextRun &raw : document.textRuns(pageIndex)) {
      std::string text = trimText(raw.text);
      if (text.empty()) {
        continue;
      }

      if (filter == ColorFilter::Red && !isRedColor(raw.color)) {
        continue;
      }

      TextRun run;
      run.key = encodeKey(pageIndex, raw.bbox, text);
      run.page = pageIndex;
      run.bbox = raw.bbox;
      run.text = text;
      run.fontFamily = raw.fontFamily.empty() ? "Unknown" : raw.fontFamily;
      run.fontSize = raw.fontSize;
      run.color = raw.color;
      results.push_back(run);
    }
  }

  if (sortRuns && !results.empty()) {
    sortByPosition(results);
  }

  return results;
}

void sortByPosition(std::vector<TextRun> &runs) {
  std::stable_sort(runs.begin(), runs.end(),
                   [](const TextRun &a, const TextRun &b) {
                     if (a.page != b.page) {
                       return a.page < b.page;
                     }
                     double rowA = std::round(a.bbox.y1);
                     double rowB = std::round(b.bbox.y1);
                     if (rowA != rowB) {
                       return rowA < rowB;
                     }
                     return a.bbox.x1 < b.bbox.x1;
                   });
}

} // namespace fieldedit
