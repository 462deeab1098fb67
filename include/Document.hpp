#ifndef FIELD_EDIT_DOCUMENT_HPP
#define FIELD_EDIT_DOCUMENT_HPP

#include "FieldKey.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace fieldedit {

/**
 * @brief RGB colour with components normalised to 0-1
 */
struct RGBColor {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
};

/**
 * @brief One styled text run as reported by the document engine
 */
struct PageTextRun {
  std::string text;        ///< Run text (UTF-8, untrimmed)
  BoundingBox bbox;        ///< Run rectangle, top-left origin
  std::string fontFamily;  ///< Font name as stored in the document
  double fontSize = 12.0;  ///< Font size in points
  RGBColor color;          ///< Fill colour of the run
};

/**
 * @brief Error raised when a document cannot be opened, saved or used
 */
class DocumentError : public std::runtime_error {
public:
  explicit DocumentError(const std::string &message)
      : std::runtime_error(message) {}
};

/**
 * @brief Interface to the engine that reads and edits a fixed-layout document
 *
 * An implementation is open from construction until close(). Every
 * coordinate is in page space with a top-left origin. Reads reflect the
 * document as it was last opened or saved; edits become visible to reads
 * only after save().
 *
 * Implementations are not thread safe. A handle must be used by one caller
 * at a time.
 */
class Document {
public:
  virtual ~Document() = default;

  /// Path of the file backing this document
  virtual const std::string &path() const = 0;

  /// Whether the handle is still open
  virtual bool isOpen() const = 0;

  /// Number of pages
  virtual int pageCount() const = 0;

  /**
   * @brief Styled text runs of a page, in layout order
   * @param page 0-indexed page number
   */
  virtual std::vector<PageTextRun> textRuns(int page) const = 0;

  /**
   * @brief Rectangles of every exact occurrence of a literal string
   * @param page 0-indexed page number
   * @param literal Text to search for (case sensitive)
   */
  virtual std::vector<BoundingBox> findText(int page,
                                            const std::string &literal) const = 0;

  /**
   * @brief Remove the text drawn inside a rectangle
   * @param page 0-indexed page number
   * @param region Rectangle to blank
   * @param preserveNonTextGraphics Keep paths and images in the region
   * @return true if any text was removed
   */
  virtual bool redactRegion(int page, const BoundingBox &region,
                            bool preserveNonTextGraphics) = 0;

  /**
   * @brief Insert text inside a rectangle using the named font
   *
   * The text starts at the left edge of the box with its baseline at
   * baselineRatio of the box height from the top.
   *
   * @return false if the font or the text cannot be used
   */
  virtual bool insertStyledText(int page, const BoundingBox &box,
                                const std::string &text,
                                const std::string &fontFamily, double fontSize,
                                const RGBColor &color,
                                double baselineRatio) = 0;

  /**
   * @brief Insert text at a baseline origin with a standard font
   * @return false if the text cannot be encoded for the font
   */
  virtual bool insertPlainText(int page, double x, double y,
                               const std::string &text, double fontSize,
                               const std::string &fontName,
                               const RGBColor &color) = 0;

  /**
   * @brief Persist pending edits over the original file and reopen it
   * @throws DocumentError if writing or replacing the file fails
   */
  virtual void save() = 0;

  /// Release the document. Further calls other than isOpen() throw.
  virtual void close() = 0;
};

} // namespace fieldedit

#endif // FIELD_EDIT_DOCUMENT_HPP
