#include "TemplateEditor.hpp"

#include "MappingFile.hpp"
#include "PDFDocument.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <regex>
#include <set>

namespace fieldedit {

const char *const kPlaceholderPattern = R"(\{\{.*?\}\})";

TemplateEditor::TemplateEditor(const std::string &pdfPath,
                               const EditorConfig &config)
    : m_document(), m_config(config) {
  if (!std::filesystem::exists(pdfPath)) {
    throw DocumentError("PDF file not found: " + pdfPath);
  }
  m_document = std::make_unique<PDFDocument>(pdfPath);
}

TemplateEditor::TemplateEditor(std::unique_ptr<Document> document,
                               const EditorConfig &config)
    : m_document(std::move(document)), m_config(config) {
  if (!m_document) {
    throw DocumentError("TemplateEditor requires a document");
  }
}

TemplateEditor::~TemplateEditor() { close(); }

TemplateEditor::TemplateEditor(TemplateEditor &&other) noexcept
    : m_document(std::move(other.m_document)),
      m_config(std::move(other.m_config)) {}

TemplateEditor &TemplateEditor::operator=(TemplateEditor &&other) noexcept {
  if (this != &other) {
    close();
    m_document = std::move(other.m_document);
    m_config = std::move(other.m_config);
  }
  return *this;
}

void TemplateEditor::close() {
  if (m_document && m_document->isOpen()) {
    m_document->close();
  }
}

bool TemplateEditor::isOpen() const {
  return m_document && m_document->isOpen();
}

Document &TemplateEditor::document() { return openDocument(); }

const EditorConfig &TemplateEditor::getConfig() const { return m_config; }

Document &TemplateEditor::openDocument() const {
  if (!isOpen()) {
    throw DocumentError("Document is closed");
  }
  return *m_document;
}

std::vector<TextRun> TemplateEditor::findTemplates(ColorFilter filter,
                                                   bool sortByPosition) const {
  std::vector<TextRun> runs =
      extractRuns(openDocument(), filter, sortByPosition);

  if (m_config.verbose) {
    std::cerr << "DEBUG: Found " << runs.size() << " text runs in "
              << m_document->path() << std::endl;
  }
  return runs;
}

std::vector<std::string>
TemplateEditor::getAllTemplates(const std::string &pattern) const {
  std::regex regex(pattern);
  std::set<std::string> templates;
  for (const TextRun &run : extractRuns(openDocument())) {
    if (std::regex_search(run.text, regex)) {
      templates.insert(run.text);
    }
  }
  return std::vector<std::string>(templates.begin(), templates.end());
}

ReplacementReport
TemplateEditor::replaceTemplates(const ReplacementRequest &replacements,
                                 const RGBColor &textColor) {
  ReplacementReport report;
  report.requested = replacements.size();

  auto startTime = std::chrono::high_resolution_clock::now();

  if (replacements.empty()) {
    report.errorMessage = "No replacement values given";
    return report;
  }

  try {
    Document &doc = openDocument();

    // Decode every key up front; a bad key only loses its own entry
    std::vector<ReplacementTarget> targets;
    for (const auto &entry : replacements) {
      try {
        targets.push_back({entry.first, decodeKey(entry.first), entry.second});
      } catch (const MalformedKeyError &e) {
        std::cerr << "WARNING: Skipping invalid key " << entry.first << ": "
                  << e.what() << std::endl;
        report.outcomes.push_back(
            {entry.first, EditStatus::SkippedMalformedKey, e.what()});
      }
    }

    std::vector<std::vector<TextRun>> pageRuns(
        static_cast<std::size_t>(doc.pageCount()));
    for (TextRun &run : extractRuns(doc)) {
      pageRuns[static_cast<std::size_t>(run.page)].push_back(std::move(run));
    }

    std::vector<MatchedEdit> edits;
    std::set<std::string> matchedKeys;
    for (std::size_t page = 0; page < pageRuns.size(); page++) {
      for (MatchedEdit &edit :
           matchRuns(static_cast<int>(page), pageRuns[page], targets,
                     m_config.matchTolerance)) {
        matchedKeys.insert(edit.key);
        edits.push_back(std::move(edit));
      }
    }

    for (const ReplacementTarget &target : targets) {
      if (matchedKeys.count(target.key) == 0) {
        std::cerr << "WARNING: Field no longer present: " << target.key
                  << std::endl;
        report.outcomes.push_back(
            {target.key, EditStatus::SkippedNoMatch, "no run matches the key"});
      }
    }

    report.applied =
        applyEdits(doc, edits, textColor, m_config, report.outcomes);
    report.success = true;

    if (m_config.verbose) {
      std::cerr << "DEBUG: Replaced " << report.applied << " of "
                << report.requested << " elements" << std::endl;
    }
  } catch (const std::exception &e) {
    report.errorMessage = std::string("Error replacing templates: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  report.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return report;
}

RemovalReport TemplateEditor::removeTemplates(const std::string &pattern) {
  RemovalReport report;
  try {
    std::regex regex(pattern);
    report = removeMatching(openDocument(), regex, m_config);
  } catch (const std::exception &e) {
    report.success = false;
    report.errorMessage = std::string("Error removing templates: ") + e.what();
  }
  return report;
}

bool TemplateEditor::saveMapping(const std::vector<TextRun> &runs,
                                 const std::string &mappingPath) const {
  if (runs.empty()) {
    std::cerr << "ERROR: No templates found in PDF" << std::endl;
    return false;
  }

  std::vector<MappingEntry> entries;
  entries.reserve(runs.size());
  for (const TextRun &run : runs) {
    entries.push_back({run.key, run.text});
  }

  std::string error;
  if (!writeMappingFile(mappingPath, entries, error)) {
    std::cerr << "ERROR: Could not save mapping file: " << error << std::endl;
    return false;
  }

  if (m_config.verbose) {
    std::cerr << "DEBUG: Template mapping saved to: " << mappingPath
              << std::endl;
  }
  return true;
}

} // namespace fieldedit
