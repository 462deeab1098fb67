#include "ContentRedactor.hpp"

#include <qpdf/QUtil.hh>

#include <algorithm>
#include <cstdlib>
#include <utility>

namespace fieldedit {

// ---------------------------------------------------------------------------
// Matrix
// ---------------------------------------------------------------------------

Matrix Matrix::multiply(const Matrix &o) const {
  return Matrix(a * o.a + b * o.c, a * o.b + b * o.d, c * o.a + d * o.c,
                c * o.b + d * o.d, e * o.a + f * o.c + o.e,
                e * o.b + f * o.d + o.f);
}

void Matrix::transform(double x, double y, double &tx, double &ty) const {
  tx = a * x + c * y + e;
  ty = b * x + d * y + f;
}

// ---------------------------------------------------------------------------
// PageGeometry
// ---------------------------------------------------------------------------

PageGeometry::PageGeometry(double llx, double lly, double urx, double ury,
                           int rotation)
    : m_llx(std::min(llx, urx)), m_lly(std::min(lly, ury)),
      m_urx(std::max(llx, urx)), m_ury(std::max(lly, ury)), m_rotation(0) {
  int normalized = ((rotation % 360) + 360) % 360;
  m_rotation = (normalized / 90) * 90;
}

PageGeometry PageGeometry::fromPage(QPDFPageObjectHelper &page) {
  QPDFObjectHandle::Rectangle media =
      page.getMediaBox().getArrayAsRectangle();
  QPDFObjectHandle::Rectangle crop = page.getCropBox().getArrayAsRectangle();

  double mllx = std::min(media.llx, media.urx);
  double mlly = std::min(media.lly, media.ury);
  double murx = std::max(media.llx, media.urx);
  double mury = std::max(media.lly, media.ury);
  if (murx <= mllx || mury <= mlly) {
    // US Letter, the PDF default
    mllx = 0.0;
    mlly = 0.0;
    murx = 612.0;
    mury = 792.0;
  }

  // Poppler clips the crop box to the media box
  double llx = std::max(mllx, std::min(crop.llx, crop.urx));
  double lly = std::max(mlly, std::min(crop.lly, crop.ury));
  double urx = std::min(murx, std::max(crop.llx, crop.urx));
  double ury = std::min(mury, std::max(crop.lly, crop.ury));
  if (urx <= llx || ury <= lly) {
    llx = mllx;
    lly = mlly;
    urx = murx;
    ury = mury;
  }

  int rotation = 0;
  QPDFObjectHandle rotate = page.getAttribute("/Rotate", false);
  if (rotate.isInteger()) {
    rotation = static_cast<int>(rotate.getIntValue());
  }

  return PageGeometry(llx, lly, urx, ury, rotation);
}

void PageGeometry::toPage(double ux, double uy, double &px,
                          double &py) const {
  switch (m_rotation) {
  case 90:
    px = uy - m_lly;
    py = ux - m_llx;
    break;
  case 180:
    px = m_urx - ux;
    py = uy - m_lly;
    break;
  case 270:
    px = m_ury - uy;
    py = m_urx - ux;
    break;
  default:
    px = ux - m_llx;
    py = m_ury - uy;
    break;
  }
}

void PageGeometry::toUser(double px, double py, double &ux,
                          double &uy) const {
  switch (m_rotation) {
  case 90:
    ux = py + m_llx;
    uy = px + m_lly;
    break;
  case 180:
    ux = m_urx - px;
    uy = py + m_lly;
    break;
  case 270:
    ux = m_urx - py;
    uy = m_ury - px;
    break;
  default:
    ux = px + m_llx;
    uy = m_ury - py;
    break;
  }
}

// ---------------------------------------------------------------------------
// FontMetrics
// ---------------------------------------------------------------------------

FontMetrics FontMetrics::fromFont(QPDFObjectHandle font) {
  FontMetrics metrics;
  if (!font.isDictionary()) {
    return metrics;
  }

  QPDFObjectHandle subtype = font.getKey("/Subtype");
  if (subtype.isName() && subtype.getName() == "/Type0") {
    // Assumes a two-byte CMap such as Identity-H, where code == CID
    metrics.m_twoByte = true;
    metrics.m_missingWidth = 1000.0;

    QPDFObjectHandle descendants = font.getKey("/DescendantFonts");
    if (!descendants.isArray() || descendants.getArrayNItems() < 1) {
      return metrics;
    }
    QPDFObjectHandle cidFont = descendants.getArrayItem(0);
    if (!cidFont.isDictionary()) {
      return metrics;
    }

    QPDFObjectHandle dw = cidFont.getKey("/DW");
    if (dw.isNumber()) {
      metrics.m_missingWidth = dw.getNumericValue();
    }

    QPDFObjectHandle w = cidFont.getKey("/W");
    if (!w.isArray()) {
      return metrics;
    }

    // [c [w1 w2 ...]] or [cFirst cLast w]
    int n = w.getArrayNItems();
    int i = 0;
    while (i + 1 < n) {
      QPDFObjectHandle first = w.getArrayItem(i);
      QPDFObjectHandle next = w.getArrayItem(i + 1);
      if (!first.isInteger()) {
        break;
      }
      int cid = static_cast<int>(first.getIntValue());

      if (next.isArray()) {
        int count = next.getArrayNItems();
        for (int j = 0; j < count; j++) {
          QPDFObjectHandle width = next.getArrayItem(j);
          if (width.isNumber()) {
            metrics.m_cidWidths[cid + j] = width.getNumericValue();
          }
        }
        i += 2;
      } else if (next.isInteger() && i + 2 < n) {
        int last = static_cast<int>(next.getIntValue());
        QPDFObjectHandle width = w.getArrayItem(i + 2);
        if (width.isNumber() && last >= cid && last - cid <= 0xFFFF) {
          for (int c = cid; c <= last; c++) {
            metrics.m_cidWidths[c] = width.getNumericValue();
          }
        }
        i += 3;
      } else {
        break;
      }
    }
    return metrics;
  }

  // Simple font. Standard 14 fonts often carry no /Widths; 500 is a
  // rough average for proportional faces.
  QPDFObjectHandle baseFont = font.getKey("/BaseFont");
  if (baseFont.isName() &&
      baseFont.getName().find("Courier") != std::string::npos) {
    metrics.m_missingWidth = 600.0;
  }

  QPDFObjectHandle descriptor = font.getKey("/FontDescriptor");
  if (descriptor.isDictionary()) {
    QPDFObjectHandle missing = descriptor.getKey("/MissingWidth");
    if (missing.isNumber() && missing.getNumericValue() > 0.0) {
      metrics.m_missingWidth = missing.getNumericValue();
    }
  }

  QPDFObjectHandle firstChar = font.getKey("/FirstChar");
  if (firstChar.isInteger()) {
    metrics.m_firstChar = static_cast<int>(firstChar.getIntValue());
  }

  QPDFObjectHandle widths = font.getKey("/Widths");
  if (widths.isArray()) {
    int n = widths.getArrayNItems();
    metrics.m_widths.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; i++) {
      QPDFObjectHandle width = widths.getArrayItem(i);
      metrics.m_widths.push_back(width.isNumber() ? width.getNumericValue()
                                                  : metrics.m_missingWidth);
    }
  }

  return metrics;
}

double FontMetrics::width(int code) const {
  if (m_twoByte) {
    auto it = m_cidWidths.find(code);
    return it != m_cidWidths.end() ? it->second : m_missingWidth;
  }

  int index = code - m_firstChar;
  if (index >= 0 && index < static_cast<int>(m_widths.size())) {
    return m_widths[static_cast<std::size_t>(index)];
  }
  return m_missingWidth;
}

// ---------------------------------------------------------------------------
// ContentRedactor
// ---------------------------------------------------------------------------

ContentRedactor::ContentRedactor(QPDFObjectHandle resources,
                                 const PageGeometry &geometry,
                                 std::vector<BoundingBox> regions)
    : m_resources(resources), m_geometry(geometry),
      m_regions(std::move(regions)) {}

void ContentRedactor::handleToken(QPDFTokenizer::Token const &token) {
  if (token.getType() != QPDFTokenizer::tt_word) {
    m_pending.push_back(token);
    return;
  }

  const std::string &op = token.getValue();
  std::string rewritten;
  bool rewrite = false;

  std::vector<Operand> args = operands();
  std::vector<double> numbers;
  std::vector<Operand> strings;
  for (const Operand &arg : args) {
    if (arg.kind == Operand::Number) {
      numbers.push_back(arg.number);
    } else if (arg.kind == Operand::String) {
      strings.push_back(arg);
    }
  }

  if (op == "q") {
    m_stack.push_back(m_state);
  } else if (op == "Q") {
    if (!m_stack.empty()) {
      m_state = m_stack.back();
      m_stack.pop_back();
    }
  } else if (op == "cm" && numbers.size() >= 6) {
    Matrix m(numbers[0], numbers[1], numbers[2], numbers[3], numbers[4],
             numbers[5]);
    m_state.ctm = m.multiply(m_state.ctm);
  } else if (op == "BT") {
    m_textMatrix = Matrix();
    m_lineMatrix = Matrix();
  } else if (op == "Tf" && !numbers.empty()) {
    for (const Operand &arg : args) {
      if (arg.kind == Operand::Name) {
        m_state.fontName = arg.value;
      }
    }
    m_state.fontSize = numbers.back();
  } else if (op == "Tc" && !numbers.empty()) {
    m_state.charSpacing = numbers[0];
  } else if (op == "Tw" && !numbers.empty()) {
    m_state.wordSpacing = numbers[0];
  } else if (op == "Tz" && !numbers.empty()) {
    m_state.horizontalScaling = numbers[0] / 100.0;
  } else if (op == "TL" && !numbers.empty()) {
    m_state.leading = numbers[0];
  } else if (op == "Ts" && !numbers.empty()) {
    m_state.rise = numbers[0];
  } else if ((op == "Td" || op == "TD") && numbers.size() >= 2) {
    if (op == "TD") {
      m_state.leading = -numbers[1];
    }
    m_lineMatrix =
        Matrix::translation(numbers[0], numbers[1]).multiply(m_lineMatrix);
    m_textMatrix = m_lineMatrix;
  } else if (op == "Tm" && numbers.size() >= 6) {
    m_lineMatrix = Matrix(numbers[0], numbers[1], numbers[2], numbers[3],
                          numbers[4], numbers[5]);
    m_textMatrix = m_lineMatrix;
  } else if (op == "T*") {
    nextLine();
  } else if (op == "Tj") {
    rewrite = showText(strings, rewritten);
  } else if (op == "TJ") {
    std::vector<Operand> items;
    for (const Operand &arg : args) {
      if (arg.kind == Operand::Number || arg.kind == Operand::String) {
        items.push_back(arg);
      }
    }
    rewrite = showText(items, rewritten);
  } else if (op == "'") {
    nextLine();
    rewrite = showText(strings, rewritten);
    if (rewrite) {
      rewritten = "T* " + rewritten;
    }
  } else if (op == "\"" && numbers.size() >= 2) {
    m_state.wordSpacing = numbers[0];
    m_state.charSpacing = numbers[1];
    nextLine();
    rewrite = showText(strings, rewritten);
    if (rewrite) {
      rewritten = formatCoordinate(numbers[0]) + " Tw " +
                  formatCoordinate(numbers[1]) + " Tc T* " + rewritten;
    }
  }

  if (rewrite) {
    m_pending.clear();
    write("\n" + rewritten + "\n");
  } else {
    flushPending();
    writeToken(token);
  }
}

void ContentRedactor::handleEOF() { flushPending(); }

void ContentRedactor::flushPending() {
  for (const QPDFTokenizer::Token &token : m_pending) {
    writeToken(token);
  }
  m_pending.clear();
}

std::vector<ContentRedactor::Operand> ContentRedactor::operands() const {
  std::vector<Operand> items;
  for (const QPDFTokenizer::Token &token : m_pending) {
    switch (token.getType()) {
    case QPDFTokenizer::tt_integer:
    case QPDFTokenizer::tt_real:
      items.push_back(
          {Operand::Number, std::strtod(token.getValue().c_str(), nullptr),
           token.getValue()});
      break;
    case QPDFTokenizer::tt_string:
      items.push_back({Operand::String, 0.0, token.getValue()});
      break;
    case QPDFTokenizer::tt_name:
      items.push_back({Operand::Name, 0.0, token.getValue()});
      break;
    case QPDFTokenizer::tt_array_open:
      items.push_back({Operand::ArrayOpen, 0.0, std::string()});
      break;
    case QPDFTokenizer::tt_array_close:
      items.push_back({Operand::ArrayClose, 0.0, std::string()});
      break;
    case QPDFTokenizer::tt_space:
    case QPDFTokenizer::tt_comment:
      break;
    default:
      items.push_back({Operand::Other, 0.0, token.getValue()});
      break;
    }
  }
  return items;
}

void ContentRedactor::nextLine() {
  m_lineMatrix =
      Matrix::translation(0.0, -m_state.leading).multiply(m_lineMatrix);
  m_textMatrix = m_lineMatrix;
}

const FontMetrics &ContentRedactor::currentFont() {
  auto it = m_fonts.find(m_state.fontName);
  if (it != m_fonts.end()) {
    return it->second;
  }

  QPDFObjectHandle font = QPDFObjectHandle::newNull();
  if (m_resources.isDictionary()) {
    QPDFObjectHandle fonts = m_resources.getKey("/Font");
    if (fonts.isDictionary() && fonts.hasKey(m_state.fontName)) {
      font = fonts.getKey(m_state.fontName);
    }
  }

  return m_fonts.emplace(m_state.fontName, FontMetrics::fromFont(font))
      .first->second;
}

bool ContentRedactor::insideRegion(double x, double y) const {
  for (const BoundingBox &region : m_regions) {
    if (x >= region.x1 && x <= region.x2 && y >= region.y1 &&
        y <= region.y2) {
      return true;
    }
  }
  return false;
}

bool ContentRedactor::showText(const std::vector<Operand> &items,
                               std::string &rewritten) {
  struct Piece {
    bool isNumber;
    double amount; // TJ adjustment, or glyph advance in text space
    std::string bytes;
    bool removed;
  };

  const FontMetrics &font = currentFont();
  const double size = m_state.fontSize;
  const double hscale = m_state.horizontalScaling;
  const double scale = size * hscale;
  const std::size_t step = font.twoByte() ? 2 : 1;

  std::vector<Piece> pieces;
  bool anyRemoved = false;

  for (const Operand &item : items) {
    if (item.kind == Operand::Number) {
      double tx = -item.number / 1000.0 * scale;
      m_textMatrix = Matrix::translation(tx, 0.0).multiply(m_textMatrix);
      pieces.push_back({true, item.number, std::string(), false});
      continue;
    }

    const std::string &bytes = item.value;
    for (std::size_t i = 0; i < bytes.size(); i += step) {
      std::string glyph = bytes.substr(i, step);
      int code = 0;
      for (char c : glyph) {
        code = (code << 8) | static_cast<unsigned char>(c);
      }
      double w0 = font.width(code) / 1000.0;

      Matrix rendering = Matrix(scale, 0.0, 0.0, size, 0.0, m_state.rise)
                             .multiply(m_textMatrix)
                             .multiply(m_state.ctm);
      double ux = 0.0, uy = 0.0, px = 0.0, py = 0.0;
      rendering.transform(w0 / 2.0, 0.3, ux, uy);
      m_geometry.toPage(ux, uy, px, py);
      bool removed = insideRegion(px, py);

      double spacing = m_state.charSpacing;
      if (step == 1 && code == 32) {
        spacing += m_state.wordSpacing;
      }
      double advance = (w0 * size + spacing) * hscale;
      m_textMatrix = Matrix::translation(advance, 0.0).multiply(m_textMatrix);

      pieces.push_back({false, advance, glyph, removed});
      if (removed) {
        anyRemoved = true;
        m_removedGlyphs++;
      }
    }
  }

  if (!anyRemoved) {
    return false;
  }

  // Kept glyphs stay as strings; removed ones become displacement so the
  // text matrix ends where the original operator left it
  std::string array = "[";
  std::string kept;
  double skip = 0.0;
  auto flushKept = [&]() {
    if (!kept.empty()) {
      array += "<" + QUtil::hex_encode(kept) + ">";
      kept.clear();
    }
  };
  auto flushSkip = [&]() {
    if (skip != 0.0) {
      array += " " + formatCoordinate(skip) + " ";
      skip = 0.0;
    }
  };

  for (const Piece &piece : pieces) {
    if (piece.isNumber) {
      flushKept();
      skip += piece.amount;
    } else if (piece.removed) {
      flushKept();
      if (scale != 0.0) {
        skip -= piece.amount / scale * 1000.0;
      }
    } else {
      flushSkip();
      kept += piece.bytes;
    }
  }
  flushKept();
  flushSkip();
  array += "] TJ";

  rewritten = array;
  return true;
}

} // namespace fieldedit
