#include "FieldKey.hpp"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <sstream>

namespace fieldedit {

MalformedKeyError::MalformedKeyError(const std::string &key,
                                     const std::string &reason)
    : std::invalid_argument("Invalid key format: " + key + " (" + reason +
                            ")"),
      m_key(key) {}

double roundCoordinate(double value) {
  return std::round(value * 1000.0) / 1000.0;
}

std::string formatCoordinate(double value) {
  std::ostringstream out;
  out.imbue(std::locale::classic());
  out << std::fixed << std::setprecision(3) << roundCoordinate(value);
  std::string text = out.str();

  // Drop trailing zeros, then a dangling decimal point
  std::string::size_type dot = text.find('.');
  if (dot != std::string::npos) {
    std::string::size_type last = text.find_last_not_of('0');
    text.erase(last + 1);
    if (text.back() == '.') {
      text.pop_back();
    }
  }

  if (text == "-0") {
    text = "0";
  }
  return text;
}

std::string escapeText(const std::string &text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    switch (c) {
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '"':
      escaped += "\\\"";
      break;
    case '\'':
      escaped += "\\'";
      break;
    default:
      escaped += c;
      break;
    }
  }
  return escaped;
}

std::string unescapeText(const std::string &text) {
  // Single left-to-right pass: a sequential replace would turn an escaped
  // backslash followed by 'n' into a newline.
  std::string unescaped;
  unescaped.reserve(text.size());
  for (std::string::size_type i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c != '\\' || i + 1 >= text.size()) {
      unescaped += c;
      continue;
    }

    char next = text[i + 1];
    switch (next) {
    case 'n':
      unescaped += '\n';
      break;
    case 'r':
      unescaped += '\r';
      break;
    case 't':
      unescaped += '\t';
      break;
    case '"':
    case '\'':
    case '\\':
      unescaped += next;
      break;
    default:
      unescaped += c;
      unescaped += next;
      break;
    }
    ++i;
  }
  return unescaped;
}

std::string encodeKey(int page, const BoundingBox &bbox,
                      const std::string &text) {
  std::string key = "p" + std::to_string(page) + "_";
  key += "x" + formatCoordinate(bbox.x1);
  key += "y" + formatCoordinate(bbox.y1);
  key += "a" + formatCoordinate(bbox.x2);
  key += "b" + formatCoordinate(bbox.y2);
  key += "_" + escapeText(text);
  return key;
}

namespace {

class KeyParser {
public:
  explicit KeyParser(const std::string &key) : m_key(key), m_pos(0) {}

  bool peek(char marker) const {
    return m_pos < m_key.size() && m_key[m_pos] == marker;
  }

  void expect(char marker) {
    if (!peek(marker)) {
      throw MalformedKeyError(m_key, std::string("missing '") + marker +
                                         "' at offset " +
                                         std::to_string(m_pos));
    }
    ++m_pos;
  }

  int parsePage() {
    std::string::size_type start = m_pos;
    while (m_pos < m_key.size() &&
           std::isdigit(static_cast<unsigned char>(m_key[m_pos]))) {
      ++m_pos;
    }
    if (m_pos == start) {
      throw MalformedKeyError(m_key, "page number is not an integer");
    }
    try {
      return std::stoi(m_key.substr(start, m_pos - start));
    } catch (const std::out_of_range &) {
      throw MalformedKeyError(m_key, "page number out of range");
    }
  }

  // [-]digits[.digits][e[+-]digits]
  double parseNumber(const char *label) {
    std::string::size_type start = m_pos;
    if (peek('-') || peek('+')) {
      ++m_pos;
    }
    std::string::size_type digits = skipDigits();
    if (peek('.')) {
      ++m_pos;
      digits += skipDigits();
    }
    if (digits == 0) {
      throw MalformedKeyError(m_key, std::string("coordinate '") + label +
                                         "' is not a number");
    }
    if (peek('e') || peek('E')) {
      std::string::size_type mark = m_pos++;
      if (peek('-') || peek('+')) {
        ++m_pos;
      }
      if (skipDigits() == 0) {
        m_pos = mark;
      }
    }

    std::istringstream in(m_key.substr(start, m_pos - start));
    in.imbue(std::locale::classic());
    double value = 0.0;
    in >> value;
    if (in.fail()) {
      throw MalformedKeyError(m_key, std::string("coordinate '") + label +
                                         "' is not a number");
    }
    return value;
  }

  std::string rest() const { return m_key.substr(m_pos); }

private:
  std::string::size_type skipDigits() {
    std::string::size_type start = m_pos;
    while (m_pos < m_key.size() &&
           std::isdigit(static_cast<unsigned char>(m_key[m_pos]))) {
      ++m_pos;
    }
    return m_pos - start;
  }

  const std::string &m_key;
  std::string::size_type m_pos;
};

} // anonymous namespace

FieldKey decodeKey(const std::string &key) {
  KeyParser parser(key);
  FieldKey decoded;

  if (parser.peek('p')) {
    parser.expect('p');
    decoded.page = parser.parsePage();
    parser.expect('_');
  }

  parser.expect('x');
  decoded.bbox.x1 = parser.parseNumber("x");
  parser.expect('y');
  decoded.bbox.y1 = parser.parseNumber("y");
  parser.expect('a');
  decoded.bbox.x2 = parser.parseNumber("a");
  parser.expect('b');
  decoded.bbox.y2 = parser.parseNumber("b");
  parser.expect('_');

  decoded.text = unescapeText(parser.rest());
  return decoded;
}

} // namespace fieldedit
