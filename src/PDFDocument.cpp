#include "PDFDocument.hpp"

#include "ContentRedactor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <system_error>

#include <unistd.h>

// Poppler C++ wrapper
#include <poppler-page.h>

// Poppler core, for per-glyph colours
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <goo/GooString.h>

// qpdf
#include <qpdf/Buffer.hh>
#include <qpdf/Pl_Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>

namespace fieldedit {

namespace {

// Collects the fill colour of every glyph drawn on a page
class GlyphColorOutputDev : public OutputDev {
public:
  struct Sample {
    double x; // glyph centre, top-left page space
    double y;
    RGBColor color;
  };

  const std::vector<Sample> &getSamples() const { return samples; }

  bool upsideDown() override { return true; }
  bool useDrawChar() override { return true; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return false; }

  void drawChar(GfxState *state, double x, double y, double dx, double dy,
                double /*originX*/, double /*originY*/, CharCode /*code*/,
                int /*nBytes*/, const Unicode * /*u*/, int /*uLen*/) override {
    Sample sample;
    state->transform(x + dx / 2.0, y + dy / 2.0, &sample.x, &sample.y);

    GfxRGB rgb;
    state->getFillRGB(&rgb);
    sample.color.r = colToDbl(rgb.r);
    sample.color.g = colToDbl(rgb.g);
    sample.color.b = colToDbl(rgb.b);

    samples.push_back(sample);
  }

private:
  std::vector<Sample> samples;
};

bool sameColor(const RGBColor &a, const RGBColor &b) {
  return std::fabs(a.r - b.r) < 0.01 && std::fabs(a.g - b.g) < 0.01 &&
         std::fabs(a.b - b.b) < 0.01;
}

RGBColor colorInside(const std::vector<GlyphColorOutputDev::Sample> &samples,
                     const BoundingBox &box) {
  for (const auto &sample : samples) {
    if (sample.x >= box.x1 - 1.0 && sample.x <= box.x2 + 1.0 &&
        sample.y >= box.y1 - 1.0 && sample.y <= box.y2 + 1.0) {
      return sample.color;
    }
  }
  return RGBColor();
}

std::string toUtf8(const poppler::ustring &text) {
  poppler::byte_array bytes = text.to_utf8();
  return std::string(bytes.begin(), bytes.end());
}

bool isStandardFont(const std::string &name) {
  static const char *const kStandardFonts[] = {
      "Times-Roman",  "Times-Bold",        "Times-Italic",
      "Times-BoldItalic", "Helvetica",     "Helvetica-Bold",
      "Helvetica-Oblique", "Helvetica-BoldOblique", "Courier",
      "Courier-Bold", "Courier-Oblique",   "Courier-BoldOblique",
      "Symbol",       "ZapfDingbats"};
  for (const char *font : kStandardFonts) {
    if (name == font) {
      return true;
    }
  }
  return false;
}

// "ABCDEF+Name": the font only carries the glyphs it was subset to
bool isSubsetName(const std::string &name) {
  if (name.size() < 7 || name[6] != '+') {
    return false;
  }
  for (int i = 0; i < 6; i++) {
    if (!std::isupper(static_cast<unsigned char>(name[i]))) {
      return false;
    }
  }
  return true;
}

// Whether WinAnsi-encoded bytes draw the intended characters with this font
bool hasWinAnsiEncoding(QPDFObjectHandle font, const std::string &baseFont) {
  // Symbolic standard fonts draw their own glyph sets whatever the encoding
  if (baseFont == "Symbol" || baseFont == "ZapfDingbats") {
    return false;
  }

  QPDFObjectHandle encoding = font.getKey("/Encoding");
  if (encoding.isName()) {
    return encoding.getName() == "/WinAnsiEncoding";
  }
  if (encoding.isDictionary()) {
    QPDFObjectHandle base = encoding.getKey("/BaseEncoding");
    return base.isName() && base.getName() == "/WinAnsiEncoding" &&
           !encoding.hasKey("/Differences");
  }
  // Standard fonts without /Encoding use StandardEncoding, which agrees
  // with WinAnsi on printable ASCII
  return encoding.isNull() && isStandardFont(baseFont);
}

} // anonymous namespace

PDFDocument::PDFDocument(const std::string &path) : m_path(path) { open(); }

PDFDocument::~PDFDocument() { release(); }

void PDFDocument::open() {
  m_poppler.reset(poppler::document::load_from_file(m_path));
  if (!m_poppler) {
    throw DocumentError("Failed to load PDF file: " + m_path);
  }
  if (m_poppler->is_locked()) {
    release();
    throw DocumentError("PDF is encrypted: " + m_path);
  }

  // Required before using the core API
  m_globalParams = std::make_unique<GlobalParamsIniter>(nullptr);

  auto fileName = std::make_unique<GooString>(m_path);
  m_core.reset(new PDFDoc(std::move(fileName)));
  if (!m_core->isOk()) {
    release();
    throw DocumentError("Failed to load PDF file: " + m_path);
  }

  m_qpdf = std::make_unique<QPDF>();
  try {
    m_qpdf->processFile(m_path.c_str());
    m_pages = QPDFPageDocumentHelper(*m_qpdf).getAllPages();
  } catch (const std::exception &e) {
    release();
    throw DocumentError(std::string("Failed to parse PDF for editing: ") +
                        e.what());
  }

  if (static_cast<int>(m_pages.size()) != m_poppler->pages()) {
    std::cerr << "WARNING: Page count mismatch in " << m_path << " ("
              << m_poppler->pages() << " vs " << m_pages.size() << ")"
              << std::endl;
  }

  m_wrappedPages.clear();
  m_modified = false;
}

void PDFDocument::release() noexcept {
  m_pages.clear();
  m_qpdf.reset();
  m_core.reset();
  m_globalParams.reset();
  m_poppler.reset();
}

bool PDFDocument::isOpen() const { return m_poppler != nullptr; }

void PDFDocument::close() {
  release();
  m_wrappedPages.clear();
  m_modified = false;
}

int PDFDocument::pageCount() const {
  if (!isOpen()) {
    throw DocumentError("Document is closed");
  }
  return m_poppler->pages();
}

void PDFDocument::checkPage(int page) const {
  if (page < 0 || page >= pageCount()) {
    throw DocumentError("Page " + std::to_string(page) + " out of range in " +
                        m_path);
  }
}

QPDFPageObjectHelper &PDFDocument::qpdfPage(int page) {
  checkPage(page);
  if (page >= static_cast<int>(m_pages.size())) {
    throw DocumentError("Page " + std::to_string(page) +
                        " is not editable in " + m_path);
  }
  return m_pages[static_cast<std::size_t>(page)];
}

std::vector<PageTextRun> PDFDocument::textRuns(int page) const {
  checkPage(page);

  std::vector<PageTextRun> runs;
  std::unique_ptr<poppler::page> popplerPage(m_poppler->create_page(page));
  if (!popplerPage) {
    std::cerr << "WARNING: Failed to create page " << (page + 1) << std::endl;
    return runs;
  }

  std::vector<poppler::text_box> words =
      popplerPage->text_list(poppler::page::text_list_include_font);

  // Same crop box origin as text_list
  GlyphColorOutputDev colors;
  m_core->displayPage(&colors, page + 1, 72.0, 72.0, 0,
                      false,  // useMediaBox
                      false,  // crop
                      false); // printing

  // Consecutive words with one style on one line form a run
  bool spaceAfter = false;
  int rotation = 0;
  for (poppler::text_box &word : words) {
    std::string text = toUtf8(word.text());
    if (text.empty()) {
      continue;
    }

    poppler::rectf rect = word.bbox();
    BoundingBox box{rect.left(), rect.top(), rect.right(), rect.bottom()};

    PageTextRun next;
    next.text = text;
    next.bbox = box;
    next.fontFamily = word.get_font_name();
    if (next.fontFamily == "*ignored*") {
      next.fontFamily.clear();
    }
    double size = word.get_font_size();
    next.fontSize = size > 0.0 ? size : box.height();
    next.color = colorInside(colors.getSamples(), box);

    if (!runs.empty()) {
      PageTextRun &current = runs.back();
      double gap = box.x1 - current.bbox.x2;
      bool sameLine = std::fabs(box.y1 - current.bbox.y1) <
                      0.5 * std::max(box.height(), current.bbox.height());
      if (next.fontFamily == current.fontFamily &&
          std::fabs(next.fontSize - current.fontSize) < 0.01 &&
          sameColor(next.color, current.color) &&
          word.rotation() == rotation && sameLine && gap >= -0.5 &&
          gap < current.fontSize) {
        current.text += (spaceAfter ? " " : "") + text;
        current.bbox.x1 = std::min(current.bbox.x1, box.x1);
        current.bbox.y1 = std::min(current.bbox.y1, box.y1);
        current.bbox.x2 = std::max(current.bbox.x2, box.x2);
        current.bbox.y2 = std::max(current.bbox.y2, box.y2);
        spaceAfter = word.has_space_after();
        continue;
      }
    }

    runs.push_back(next);
    spaceAfter = word.has_space_after();
    rotation = word.rotation();
  }

  return runs;
}

std::vector<BoundingBox>
PDFDocument::findText(int page, const std::string &literal) const {
  checkPage(page);

  std::vector<BoundingBox> hits;
  if (literal.empty()) {
    return hits;
  }

  std::unique_ptr<poppler::page> popplerPage(m_poppler->create_page(page));
  if (!popplerPage) {
    return hits;
  }

  poppler::ustring needle =
      poppler::ustring::from_utf8(literal.c_str(), static_cast<int>(literal.size()));
  poppler::rectf rect;
  poppler::page::search_direction_enum direction =
      poppler::page::search_from_top;

  // Bound the loop in case the engine keeps returning the same hit
  const std::size_t kMaxHits = 10000;
  while (hits.size() < kMaxHits &&
         popplerPage->search(needle, rect, direction, poppler::case_sensitive)) {
    hits.push_back({rect.left(), rect.top(), rect.right(), rect.bottom()});
    direction = poppler::page::search_next_result;
  }

  return hits;
}

bool PDFDocument::redactRegion(int page, const BoundingBox &region,
                               bool preserveNonTextGraphics) {
  try {
    QPDFPageObjectHelper &helper = qpdfPage(page);
    PageGeometry geometry = PageGeometry::fromPage(helper);

    ContentRedactor redactor(helper.getAttribute("/Resources", false),
                             geometry, {region});
    Pl_Buffer buffer("redacted page content");
    helper.filterContents(&redactor, &buffer);

    if (redactor.removedGlyphs() == 0) {
      return false;
    }

    std::unique_ptr<Buffer> data(buffer.getBuffer());
    std::string content(reinterpret_cast<const char *>(data->getBuffer()),
                        data->getSize());

    // Isolate the original graphics state from anything appended later
    if (m_wrappedPages.insert(page).second) {
      content = "q\n" + content + "\nQ\n";
    }

    if (!preserveNonTextGraphics) {
      double ux1, uy1, ux2, uy2;
      geometry.toUser(region.x1, region.y1, ux1, uy1);
      geometry.toUser(region.x2, region.y2, ux2, uy2);
      double x = std::min(ux1, ux2);
      double y = std::min(uy1, uy2);
      content += "q 1 1 1 rg " + formatCoordinate(x) + " " +
                 formatCoordinate(y) + " " +
                 formatCoordinate(std::fabs(ux2 - ux1)) + " " +
                 formatCoordinate(std::fabs(uy2 - uy1)) + " re f Q\n";
    }

    helper.getObjectHandle().replaceKey(
        "/Contents", QPDFObjectHandle::newStream(m_qpdf.get(), content));
    m_modified = true;
    return true;
  } catch (const std::exception &e) {
    std::cerr << "ERROR: Redaction failed on page " << (page + 1) << ": "
              << e.what() << std::endl;
    return false;
  }
}

std::string PDFDocument::findFontResource(QPDFPageObjectHelper &page,
                                          const std::string &fontFamily) const {
  if (fontFamily.empty() || isSubsetName(fontFamily)) {
    return std::string();
  }

  QPDFObjectHandle resources = page.getAttribute("/Resources", false);
  if (!resources.isDictionary()) {
    return std::string();
  }
  QPDFObjectHandle fonts = resources.getKey("/Font");
  if (!fonts.isDictionary()) {
    return std::string();
  }

  for (const std::string &name : fonts.getKeys()) {
    QPDFObjectHandle font = fonts.getKey(name);
    if (!font.isDictionary()) {
      continue;
    }
    QPDFObjectHandle baseFont = font.getKey("/BaseFont");
    QPDFObjectHandle subtype = font.getKey("/Subtype");
    if (!baseFont.isName() || baseFont.getName() != "/" + fontFamily ||
        !subtype.isName()) {
      continue;
    }
    if (subtype.getName() != "/Type1" && subtype.getName() != "/TrueType") {
      continue;
    }
    if (hasWinAnsiEncoding(font, fontFamily)) {
      return name;
    }
  }
  return std::string();
}

std::string PDFDocument::addStandardFont(QPDFPageObjectHelper &page,
                                         const std::string &fontName) {
  QPDFObjectHandle pageObject = page.getObjectHandle();
  QPDFObjectHandle resources = page.getAttribute("/Resources", true);
  if (!resources.isDictionary()) {
    resources = QPDFObjectHandle::newDictionary();
    pageObject.replaceKey("/Resources", resources);
  }

  QPDFObjectHandle fonts = resources.getKey("/Font");
  if (!fonts.isDictionary()) {
    fonts = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/Font", fonts);
  }

  std::string resourceName = "/FE_";
  for (char c : fontName) {
    resourceName += std::isalnum(static_cast<unsigned char>(c)) ? c : '_';
  }

  if (!fonts.hasKey(resourceName)) {
    QPDFObjectHandle font = QPDFObjectHandle::newDictionary();
    font.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
    font.replaceKey("/Subtype", QPDFObjectHandle::newName("/Type1"));
    font.replaceKey("/BaseFont", QPDFObjectHandle::newName("/" + fontName));
    font.replaceKey("/Encoding",
                    QPDFObjectHandle::newName("/WinAnsiEncoding"));
    fonts.replaceKey(resourceName, m_qpdf->makeIndirectObject(font));
  }
  return resourceName;
}

void PDFDocument::appendText(int page, const std::string &resourceName,
                             double x, double y, const std::string &encoded,
                             double fontSize, const RGBColor &color) {
  QPDFPageObjectHelper &helper = qpdfPage(page);
  PageGeometry geometry = PageGeometry::fromPage(helper);

  // Text space axes: +x along the page, +y up the page
  double ox, oy, ax, ay, bx, by;
  geometry.toUser(x, y, ox, oy);
  geometry.toUser(x + 1.0, y, ax, ay);
  geometry.toUser(x, y - 1.0, bx, by);

  if (m_wrappedPages.insert(page).second) {
    helper.addPageContents(QPDFObjectHandle::newStream(m_qpdf.get(), "q\n"),
                           true);
    helper.addPageContents(QPDFObjectHandle::newStream(m_qpdf.get(), "\nQ\n"),
                           false);
  }

  std::string content = "q\nBT\n" + resourceName + " " +
                        formatCoordinate(fontSize) + " Tf\n" +
                        formatCoordinate(color.r) + " " +
                        formatCoordinate(color.g) + " " +
                        formatCoordinate(color.b) + " rg\n" +
                        formatCoordinate(ax - ox) + " " +
                        formatCoordinate(ay - oy) + " " +
                        formatCoordinate(bx - ox) + " " +
                        formatCoordinate(by - oy) + " " +
                        formatCoordinate(ox) + " " + formatCoordinate(oy) +
                        " Tm\n<" + QUtil::hex_encode(encoded) + "> Tj\nET\nQ\n";

  helper.addPageContents(QPDFObjectHandle::newStream(m_qpdf.get(), content),
                         false);
  m_modified = true;
}

bool PDFDocument::insertStyledText(int page, const BoundingBox &box,
                                   const std::string &text,
                                   const std::string &fontFamily,
                                   double fontSize, const RGBColor &color,
                                   double baselineRatio) {
  if (text.empty()) {
    return true;
  }

  try {
    QPDFPageObjectHelper &helper = qpdfPage(page);
    std::string resourceName = findFontResource(helper, fontFamily);
    if (resourceName.empty()) {
      return false;
    }

    std::string encoded;
    if (!QUtil::utf8_to_win_ansi(text, encoded, '?')) {
      return false;
    }

    double baseline = box.y1 + box.height() * baselineRatio;
    appendText(page, resourceName, box.x1, baseline, encoded, fontSize,
               color);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "ERROR: Styled insertion failed on page " << (page + 1)
              << ": " << e.what() << std::endl;
    return false;
  }
}

bool PDFDocument::insertPlainText(int page, double x, double y,
                                  const std::string &text, double fontSize,
                                  const std::string &fontName,
                                  const RGBColor &color) {
  if (text.empty()) {
    return true;
  }

  try {
    QPDFPageObjectHelper &helper = qpdfPage(page);

    std::string encoded;
    if (!QUtil::utf8_to_win_ansi(text, encoded, '?')) {
      return false;
    }

    std::string resourceName = addStandardFont(helper, fontName);
    appendText(page, resourceName, x, y, encoded, fontSize, color);
    return true;
  } catch (const std::exception &e) {
    std::cerr << "ERROR: Text insertion failed on page " << (page + 1) << ": "
              << e.what() << std::endl;
    return false;
  }
}

void PDFDocument::save() {
  if (!isOpen()) {
    throw DocumentError("Document is closed");
  }

  // Write beside the original so the final rename stays on one filesystem
  std::string tempPath = m_path + ".tmp" + std::to_string(::getpid());
  try {
    QPDFWriter writer(*m_qpdf, tempPath.c_str());
    writer.setStreamDataMode(qpdf_s_preserve);
    writer.write();
  } catch (const std::exception &e) {
    std::error_code ignored;
    std::filesystem::remove(tempPath, ignored);
    throw DocumentError(std::string("Failed to write PDF: ") + e.what());
  }

  release();

  std::error_code ec;
  std::filesystem::rename(tempPath, m_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tempPath, ignored);
    open();
    throw DocumentError("Failed to replace " + m_path + ": " + ec.message());
  }

  open();
}

} // namespace fieldedit
