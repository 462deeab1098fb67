#ifndef FIELD_EDIT_TEMPLATE_EDITOR_HPP
#define FIELD_EDIT_TEMPLATE_EDITOR_HPP

#include "Document.hpp"
#include "TemplateEngine.hpp"

#include <memory>
#include <string>
#include <vector>

namespace fieldedit {

/// Pattern matching unresolved "{{...}}" placeholders
extern const char *const kPlaceholderPattern;

/**
 * @brief Locates and replaces template fields in a PDF
 *
 * Owns one open document for its lifetime and closes it on destruction,
 * including when an operation throws. Replacement and removal save the file
 * and reopen it, so runs returned by findTemplates() must not be reused for
 * geometry after either call.
 *
 * Example usage:
 * @code
 * fieldedit::TemplateEditor editor("form.pdf");
 * auto fields = editor.findTemplates(fieldedit::ColorFilter::Red, true);
 * fieldedit::ReplacementRequest request;
 * request[fields.front().key] = "Alice";
 * auto report = editor.replaceTemplates(request);
 * std::cout << report.applied << " of " << report.requested << std::endl;
 * @endcode
 */
class TemplateEditor {
public:
  /**
   * @brief Open a PDF file
   * @param pdfPath Path to the PDF
   * @param config Processing options
   * @throws DocumentError if the file is missing or cannot be opened
   */
  explicit TemplateEditor(const std::string &pdfPath,
                          const EditorConfig &config = EditorConfig());

  /**
   * @brief Work on an already opened document
   * @param document Document to take ownership of (must not be null)
   * @param config Processing options
   */
  TemplateEditor(std::unique_ptr<Document> document,
                 const EditorConfig &config = EditorConfig());

  ~TemplateEditor();

  TemplateEditor(const TemplateEditor &) = delete;
  TemplateEditor &operator=(const TemplateEditor &) = delete;

  TemplateEditor(TemplateEditor &&other) noexcept;
  TemplateEditor &operator=(TemplateEditor &&other) noexcept;

  /**
   * @brief List the text runs of the document
   * @param filter Colour class to keep
   * @param sortByPosition Sort by page, line and x position
   * @return Runs with their keys
   */
  std::vector<TextRun> findTemplates(ColorFilter filter = ColorFilter::None,
                                     bool sortByPosition = false) const;

  /**
   * @brief Unique run texts containing a match of a regular expression
   * @param pattern ECMAScript regular expression
   * @return Sorted unique texts
   */
  std::vector<std::string> getAllTemplates(const std::string &pattern = ".*") const;

  /**
   * @brief Replace fields identified by their keys
   *
   * Keys that do not decode and keys that match no run are skipped and
   * reported; they do not fail the pass.
   *
   * @param replacements Key to new value
   * @param textColor Colour of the inserted text
   * @return Report with one outcome per request entry
   */
  ReplacementReport replaceTemplates(const ReplacementRequest &replacements,
                                     const RGBColor &textColor = RGBColor());

  /**
   * @brief Remove every occurrence of a pattern, keeping surrounding text
   * @param pattern ECMAScript regular expression
   * @return Sweep report
   */
  RemovalReport removeTemplates(const std::string &pattern = kPlaceholderPattern);

  /**
   * @brief Write runs to a mapping file (key to quoted text)
   * @return true if the file was written; false when runs is empty, in
   *         which case nothing is written
   */
  bool saveMapping(const std::vector<TextRun> &runs,
                   const std::string &mappingPath) const;

  /// Close the document. Safe to call more than once.
  void close();

  /// Whether the document is open
  bool isOpen() const;

  /// Access the underlying document
  Document &document();

  /// Get the current configuration
  const EditorConfig &getConfig() const;

private:
  Document &openDocument() const;

  std::unique_ptr<Document> m_document; ///< Open document, null once moved
  EditorConfig m_config;                ///< Current configuration
};

} // namespace fieldedit

#endif // FIELD_EDIT_TEMPLATE_EDITOR_HPP
