#include "TemplateEngine.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace fieldedit {

const char *editStatusName(EditStatus status) {
  switch (status) {
  case EditStatus::Applied:
    return "applied";
  case EditStatus::AppliedWithFallback:
    return "applied (fallback font)";
  case EditStatus::SkippedMalformedKey:
    return "skipped: malformed key";
  case EditStatus::SkippedNoMatch:
    return "skipped: no matching run";
  case EditStatus::SkippedNotLocated:
    return "skipped: text not located";
  case EditStatus::SkippedRedactionFailed:
    return "skipped: redaction failed";
  case EditStatus::SkippedInsertFailed:
    return "skipped: insertion failed";
  }
  return "unknown";
}

bool isApplied(EditStatus status) {
  return status == EditStatus::Applied ||
         status == EditStatus::AppliedWithFallback;
}

namespace {

// Group items by page, keeping their relative order within a page
template <typename T, typename PageOf>
std::map<int, std::vector<const T *>> groupByPage(const std::vector<T> &items,
                                                  PageOf pageOf) {
  std::map<int, std::vector<const T *>> pages;
  for (const T &item : items) {
    pages[pageOf(item)].push_back(&item);
  }
  return pages;
}

std::ostream &operator<<(std::ostream &out, const BoundingBox &box) {
  return out << "(" << box.x1 << ", " << box.y1 << ", " << box.x2 << ", "
             << box.y2 << ")";
}

// Find the on-page occurrence of the run text closest to where it was
// extracted. Geometry may have moved slightly since extraction.
bool locateOccurrence(const Document &document, const MatchedEdit &edit,
                      double tolerance, BoundingBox &located) {
  std::vector<BoundingBox> instances =
      document.findText(edit.page, edit.originalText);

  bool found = false;
  double best = 0.0;
  for (const BoundingBox &instance : instances) {
    if (!boxesWithinTolerance(instance, edit.rect, tolerance)) {
      continue;
    }
    double distance = boxDistance(instance, edit.rect);
    if (!found || distance < best) {
      located = instance;
      best = distance;
      found = true;
    }
  }
  return found;
}

EditStatus insertText(Document &document, int page, const BoundingBox &rect,
                      const std::string &text, const std::string &fontFamily,
                      double fontSize, const RGBColor &color,
                      const EditorConfig &config, std::string &detail) {
  if (text.empty()) {
    return EditStatus::Applied;
  }

  if (document.insertStyledText(page, rect, text, fontFamily, fontSize, color,
                                config.baselineRatio)) {
    if (config.verbose) {
      std::cerr << "DEBUG:   Inserted '" << text << "' with font "
                << fontFamily << std::endl;
    }
    return EditStatus::Applied;
  }

  if (config.verbose) {
    std::cerr << "DEBUG:   Font " << fontFamily << " unusable, trying "
              << config.fallbackFont << std::endl;
  }

  double baseline = rect.y1 + rect.height() * config.baselineRatio;
  if (document.insertPlainText(page, rect.x1, baseline, text, fontSize,
                               config.fallbackFont, color)) {
    return EditStatus::AppliedWithFallback;
  }

  detail = "text cannot be written with " + fontFamily + " or " +
           config.fallbackFont;
  return EditStatus::SkippedInsertFailed;
}

} // anonymous namespace

std::size_t applyEdits(Document &document,
                       const std::vector<MatchedEdit> &edits,
                       const RGBColor &textColor, const EditorConfig &config,
                       std::vector<EditOutcome> &outcomes) {
  std::size_t applied = 0;
  bool modified = false;

  auto pages =
      groupByPage(edits, [](const MatchedEdit &edit) { return edit.page; });

  for (const auto &entry : pages) {
    int page = entry.first;
    const std::vector<const MatchedEdit *> &pageEdits = entry.second;

    if (config.verbose) {
      std::cerr << "DEBUG: Applying " << pageEdits.size()
                << " replacements on page " << page << std::endl;
    }

    // Phase 1: remove every original before inserting anything, so a new
    // string can never be picked up by a later removal on the same page
    std::vector<std::pair<const MatchedEdit *, BoundingBox>> removed;
    for (const MatchedEdit *edit : pageEdits) {
      BoundingBox located;
      if (!locateOccurrence(document, *edit, config.matchTolerance,
                            located)) {
        std::cerr << "WARNING: No occurrence of '" << edit->originalText
                  << "' near " << edit->rect << " on page " << page
                  << std::endl;
        outcomes.push_back({edit->key, EditStatus::SkippedNotLocated,
                            "no occurrence within tolerance"});
        continue;
      }

      if (config.verbose) {
        std::cerr << "DEBUG: Removing " << edit->key << " at " << located
                  << std::endl;
      }

      if (!document.redactRegion(page, located, config.preserveGraphics)) {
        std::cerr << "WARNING: Redaction removed nothing for '"
                  << edit->originalText << "' on page " << page << std::endl;
        outcomes.push_back({edit->key, EditStatus::SkippedRedactionFailed,
                            "no text removed at " + edit->key});
        continue;
      }

      modified = true;
      removed.emplace_back(edit, located);
    }

    // Phase 2: insert the replacements
    for (const auto &item : removed) {
      const MatchedEdit &edit = *item.first;
      const BoundingBox &rect = item.second;

      if (config.verbose) {
        std::cerr << "DEBUG: Inserting '" << edit.replacement << "' at "
                  << rect << std::endl;
      }

      std::string detail;
      EditStatus status =
          insertText(document, page, rect, edit.replacement, edit.fontFamily,
                     edit.fontSize, textColor, config, detail);
      if (!isApplied(status)) {
        std::cerr << "WARNING: Could not insert replacement for " << edit.key
                  << ": " << detail << std::endl;
      } else {
        applied++;
      }
      outcomes.push_back({edit.key, status, detail});
    }
  }

  if (modified) {
    document.save();
  }

  return applied;
}

RemovalReport removeMatching(Document &document, const std::regex &pattern,
                             const EditorConfig &config) {
  RemovalReport report;
  auto startTime = std::chrono::high_resolution_clock::now();

  std::vector<TextRun> runs = extractRuns(document);
  auto pages = groupByPage(runs, [](const TextRun &run) { return run.page; });

  for (const auto &entry : pages) {
    int page = entry.first;

    // Same two phases as applyEdits
    std::vector<std::pair<const TextRun *, std::string>> remainders;
    for (const TextRun *run : entry.second) {
      if (!std::regex_search(run->text, pattern)) {
        continue;
      }

      if (!document.redactRegion(page, run->bbox, config.preserveGraphics)) {
        std::cerr << "WARNING: Redaction removed nothing for '" << run->text
                  << "' on page " << page << std::endl;
        continue;
      }

      report.removed++;
      report.texts.push_back(run->text);
      remainders.emplace_back(
          run, trimText(std::regex_replace(run->text, pattern, "")));
    }

    for (const auto &item : remainders) {
      const TextRun &run = *item.first;
      const std::string &remainder = item.second;
      if (remainder.empty()) {
        continue;
      }

      if (config.verbose) {
        std::cerr << "DEBUG: Keeping '" << remainder << "' from '" << run.text
                  << "'" << std::endl;
      }

      std::string detail;
      EditStatus status =
          insertText(document, page, run.bbox, remainder, run.fontFamily,
                     run.fontSize, run.color, config, detail);
      if (isApplied(status)) {
        report.reinserted++;
      } else {
        std::cerr << "WARNING: Could not restore '" << remainder
                  << "': " << detail << std::endl;
      }
    }
  }

  if (report.removed > 0) {
    document.save();
  }

  report.success = true;

  auto endTime = std::chrono::high_resolution_clock::now();
  report.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return report;
}

} // namespace fieldedit
