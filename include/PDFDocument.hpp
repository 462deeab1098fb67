#ifndef FIELD_EDIT_PDF_DOCUMENT_HPP
#define FIELD_EDIT_PDF_DOCUMENT_HPP

#include "Document.hpp"

#include <memory>
#include <set>
#include <string>
#include <vector>

// Poppler (read side)
#include <poppler-document.h>

class GlobalParamsIniter;
class PDFDoc;

// qpdf (write side)
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageObjectHelper.hh>

namespace fieldedit {

/**
 * @brief Document backed by a PDF file
 *
 * Text, fonts and search come from Poppler: poppler-cpp for words and
 * search, the core library for glyph fill colours. Edits are applied to a
 * qpdf copy of the same file and written back by save().
 */
class PDFDocument : public Document {
public:
  /**
   * @brief Open a PDF
   * @throws DocumentError if the file cannot be parsed or is encrypted
   */
  explicit PDFDocument(const std::string &path);
  ~PDFDocument() override;

  PDFDocument(const PDFDocument &) = delete;
  PDFDocument &operator=(const PDFDocument &) = delete;

  const std::string &path() const override { return m_path; }
  bool isOpen() const override;
  int pageCount() const override;

  std::vector<PageTextRun> textRuns(int page) const override;
  std::vector<BoundingBox> findText(int page,
                                    const std::string &literal) const override;

  bool redactRegion(int page, const BoundingBox &region,
                    bool preserveNonTextGraphics) override;
  bool insertStyledText(int page, const BoundingBox &box,
                        const std::string &text, const std::string &fontFamily,
                        double fontSize, const RGBColor &color,
                        double baselineRatio) override;
  bool insertPlainText(int page, double x, double y, const std::string &text,
                       double fontSize, const std::string &fontName,
                       const RGBColor &color) override;

  void save() override;
  void close() override;

  /// Whether edits are pending
  bool isModified() const { return m_modified; }

private:
  void open();
  void release() noexcept;
  void checkPage(int page) const;
  QPDFPageObjectHelper &qpdfPage(int page);

  // Name of a usable font resource whose /BaseFont is fontFamily, or ""
  std::string findFontResource(QPDFPageObjectHelper &page,
                               const std::string &fontFamily) const;
  // Add a standard font resource to the page and return its name
  std::string addStandardFont(QPDFPageObjectHelper &page,
                              const std::string &fontName);
  // Append "BT ... ET" drawing text with its baseline origin at (x, y)
  void appendText(int page, const std::string &resourceName, double x,
                  double y, const std::string &encoded, double fontSize,
                  const RGBColor &color);

  std::string m_path;
  std::unique_ptr<GlobalParamsIniter> m_globalParams;
  std::unique_ptr<PDFDoc> m_core;
  std::unique_ptr<poppler::document> m_poppler;
  std::unique_ptr<QPDF> m_qpdf;
  std::vector<QPDFPageObjectHelper> m_pages;
  std::set<int> m_wrappedPages;
  bool m_modified = false;
};

} // namespace fieldedit

#endif // FIELD_EDIT_PDF_DOCUMENT_HPP
