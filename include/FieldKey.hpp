#ifndef FIELD_EDIT_FIELD_KEY_HPP
#define FIELD_EDIT_FIELD_KEY_HPP

#include <stdexcept>
#include <string>

namespace fieldedit {

/**
 * @brief Axis-aligned rectangle in page space
 *
 * Coordinates use Poppler's text coordinate system: origin at the top-left
 * corner of the crop box, 72 units per inch, y growing downwards.
 */
struct BoundingBox {
  double x1 = 0.0; ///< Left edge
  double y1 = 0.0; ///< Top edge
  double x2 = 0.0; ///< Right edge
  double y2 = 0.0; ///< Bottom edge

  double width() const { return x2 - x1; }
  double height() const { return y2 - y1; }
};

/**
 * @brief Decoded form of a FieldKey
 */
struct FieldKey {
  int page = 0;     ///< 0-indexed page number
  BoundingBox bbox; ///< Rounded bounding box of the field
  std::string text; ///< Unescaped field text
};

/**
 * @brief Thrown by decodeKey() when a key string cannot be parsed
 */
class MalformedKeyError : public std::invalid_argument {
public:
  explicit MalformedKeyError(const std::string &key,
                             const std::string &reason);

  /// The offending key
  const std::string &key() const { return m_key; }

private:
  std::string m_key;
};

/**
 * @brief Round a coordinate to the 3 decimal places kept in a key
 */
double roundCoordinate(double value);

/**
 * @brief Format a coordinate the way it appears in a key
 *
 * The value is rounded to 3 decimals and written without trailing zeros,
 * so 10.0 becomes "10" and 10.250 becomes "10.25".
 */
std::string formatCoordinate(double value);

/**
 * @brief Escape control characters and quotes for storage in a key
 *
 * Replaces, in order, backslash, newline, carriage return, tab, double quote
 * and single quote with their two-character escape sequences.
 */
std::string escapeText(const std::string &text);

/**
 * @brief Inverse of escapeText()
 *
 * Unknown escape sequences and a trailing lone backslash are kept verbatim.
 */
std::string unescapeText(const std::string &text);

/**
 * @brief Build the identifier of a text run
 *
 * Produces "p{page}_x{x1}y{y1}a{x2}b{y2}_{escapedText}".
 *
 * @param page 0-indexed page number
 * @param bbox Bounding box of the run
 * @param text Run text (trimmed)
 * @return Key string
 */
std::string encodeKey(int page, const BoundingBox &bbox,
                      const std::string &text);

/**
 * @brief Parse a key produced by encodeKey()
 *
 * The coordinate header is read left to right with a strict number grammar,
 * so everything after the underscore that terminates the "b" value is text,
 * whatever characters the text contains. Keys without the "p{page}_" prefix
 * are accepted and decode to page 0.
 *
 * @param key Key string
 * @return Decoded page, bounding box and unescaped text
 * @throws MalformedKeyError if a marker is missing or a number does not parse
 */
FieldKey decodeKey(const std::string &key);

} // namespace fieldedit

#endif // FIELD_EDIT_FIELD_KEY_HPP
