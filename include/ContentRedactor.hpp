#ifndef FIELD_EDIT_CONTENT_REDACTOR_HPP
#define FIELD_EDIT_CONTENT_REDACTOR_HPP

#include "FieldKey.hpp"

#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFTokenizer.hh>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fieldedit {

/**
 * @brief PDF transformation matrix [a b c d e f]
 *
 * Points are row vectors, so a.multiply(b) applies a first, then b.
 */
struct Matrix {
  double a = 1.0, b = 0.0, c = 0.0, d = 1.0, e = 0.0, f = 0.0;

  Matrix() = default;
  Matrix(double a, double b, double c, double d, double e, double f)
      : a(a), b(b), c(c), d(d), e(e), f(f) {}

  static Matrix translation(double tx, double ty) {
    return Matrix(1.0, 0.0, 0.0, 1.0, tx, ty);
  }

  Matrix multiply(const Matrix &other) const;
  void transform(double x, double y, double &tx, double &ty) const;
};

/**
 * @brief Mapping between PDF user space and top-left page space
 *
 * Page space is the coordinate system of Poppler's text output at 72 dpi:
 * origin at the top-left of the displayed crop box, y growing downwards,
 * with the page /Rotate applied.
 */
class PageGeometry {
public:
  /**
   * @param llx, lly, urx, ury Visible box in user space
   * @param rotation Page rotation, a multiple of 90
   */
  PageGeometry(double llx, double lly, double urx, double ury, int rotation);

  /// Geometry of a page: crop box clipped to the media box, plus /Rotate
  static PageGeometry fromPage(QPDFPageObjectHelper &page);

  void toPage(double ux, double uy, double &px, double &py) const;
  void toUser(double px, double py, double &ux, double &uy) const;

  /// Normalised rotation: 0, 90, 180 or 270
  int rotation() const { return m_rotation; }

private:
  double m_llx, m_lly, m_urx, m_ury;
  int m_rotation;
};

/**
 * @brief Glyph advances of one font, in 1/1000 text space units
 */
class FontMetrics {
public:
  FontMetrics() = default;

  /// Read /Widths (simple fonts) or /W and /DW (Type0 fonts)
  static FontMetrics fromFont(QPDFObjectHandle font);

  /// Whether character codes are two bytes wide
  bool twoByte() const { return m_twoByte; }

  /// Advance of a character code
  double width(int code) const;

private:
  bool m_twoByte = false;
  int m_firstChar = 0;
  std::vector<double> m_widths;
  double m_missingWidth = 500.0;
  std::map<int, double> m_cidWidths;
};

/**
 * @brief Token filter that removes the glyphs drawn inside page regions
 *
 * Tracks the graphics and text state of a content stream. A text-showing
 * operator whose glyphs all fall inside a region is replaced by a pure
 * displacement, so text that follows on the same line does not move. One
 * with only some glyphs inside is rewritten as a TJ array that skips them.
 * Paths, images, shadings and XObject invocations are passed through.
 *
 * A glyph is inside a region when the centre of its box (half its advance,
 * 0.3 em above the baseline) maps into it. Text inside form XObjects is
 * not visited.
 */
class ContentRedactor : public QPDFObjectHandle::TokenFilter {
public:
  /**
   * @param resources Page /Resources, used to look fonts up
   * @param geometry Mapping from user space to page space
   * @param regions Rectangles in page space
   */
  ContentRedactor(QPDFObjectHandle resources, const PageGeometry &geometry,
                  std::vector<BoundingBox> regions);

  void handleToken(QPDFTokenizer::Token const &token) override;
  void handleEOF() override;

  /// Number of glyphs removed so far
  std::size_t removedGlyphs() const { return m_removedGlyphs; }

private:
  struct GraphicsState {
    Matrix ctm;
    std::string fontName;
    double fontSize = 0.0;
    double charSpacing = 0.0;
    double wordSpacing = 0.0;
    double horizontalScaling = 1.0;
    double leading = 0.0;
    double rise = 0.0;
  };

  // Operand of a text operator, flattened; arrays become open/close marks
  struct Operand {
    enum Kind { Number, String, Name, ArrayOpen, ArrayClose, Other };
    Kind kind;
    double number;
    std::string value;
  };

  std::vector<Operand> operands() const;
  bool showText(const std::vector<Operand> &items, std::string &rewritten);
  const FontMetrics &currentFont();
  bool insideRegion(double x, double y) const;
  void nextLine();
  void flushPending();

  QPDFObjectHandle m_resources;
  PageGeometry m_geometry;
  std::vector<BoundingBox> m_regions;

  std::vector<QPDFTokenizer::Token> m_pending;
  std::vector<GraphicsState> m_stack;
  GraphicsState m_state;
  Matrix m_textMatrix;
  Matrix m_lineMatrix;
  std::map<std::string, FontMetrics> m_fonts;
  std::size_t m_removedGlyphs = 0;
};

} // namespace fieldedit

#endif // FIELD_EDIT_CONTENT_REDACTOR_HPP
