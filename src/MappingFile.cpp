#include "MappingFile.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace fieldedit {

std::string quoteScalar(const std::string &value) {
  std::string quoted = "\"";
  for (char c : value) {
    unsigned char uc = static_cast<unsigned char>(c);
    switch (c) {
    case '\\':
      quoted += "\\\\";
      break;
    case '"':
      quoted += "\\\"";
      break;
    case '\n':
      quoted += "\\n";
      break;
    case '\r':
      quoted += "\\r";
      break;
    case '\t':
      quoted += "\\t";
      break;
    default:
      if (uc < 0x20 || uc == 0x7f) {
        char hex[8];
        std::snprintf(hex, sizeof(hex), "\\x%02X", uc);
        quoted += hex;
      } else {
        quoted += c;
      }
      break;
    }
  }
  quoted += "\"";
  return quoted;
}

namespace {

void skipSpaces(const std::string &line, std::string::size_type &pos) {
  while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
    ++pos;
  }
}

int hexValue(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

bool readHex(const std::string &line, std::string::size_type &pos,
             std::string::size_type digits, unsigned long &value) {
  if (pos + digits > line.size()) {
    return false;
  }
  value = 0;
  for (std::string::size_type i = 0; i < digits; ++i) {
    int digit = hexValue(line[pos + i]);
    if (digit < 0) {
      return false;
    }
    value = value * 16 + static_cast<unsigned long>(digit);
  }
  pos += digits;
  return true;
}

// Appends a code point as UTF-8. Surrogates and values past U+10FFFF fail.
bool appendUtf8(std::string &out, unsigned long cp) {
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    if (cp >= 0xD800 && cp <= 0xDFFF) {
      return false;
    }
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp <= 0x10FFFF) {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    return false;
  }
  return true;
}

bool readDoubleQuoted(const std::string &line, std::string::size_type &pos,
                      std::string &out) {
  ++pos; // opening quote
  while (pos < line.size()) {
    char c = line[pos++];
    if (c == '"') {
      return true;
    }
    if (c != '\\') {
      out += c;
      continue;
    }
    if (pos >= line.size()) {
      return false;
    }
    char next = line[pos++];
    switch (next) {
    case 'n':
      out += '\n';
      break;
    case 'r':
      out += '\r';
      break;
    case 't':
    case '\t':
      out += '\t';
      break;
    case '0':
      out += '\0';
      break;
    case 'a':
      out += '\a';
      break;
    case 'b':
      out += '\b';
      break;
    case 'e':
      out += '\x1b';
      break;
    case 'f':
      out += '\f';
      break;
    case 'v':
      out += '\v';
      break;
    case 'N':
      appendUtf8(out, 0x85);
      break;
    case '_':
      appendUtf8(out, 0xA0);
      break;
    case 'L':
      appendUtf8(out, 0x2028);
      break;
    case 'P':
      appendUtf8(out, 0x2029);
      break;
    case 'x':
    case 'u':
    case 'U': {
      std::string::size_type digits = next == 'x' ? 2 : (next == 'u' ? 4 : 8);
      unsigned long codePoint = 0;
      if (!readHex(line, pos, digits, codePoint)) {
        return false;
      }
      if (next == 'x') {
        // \x is written for raw control bytes, keep it a single byte
        out += static_cast<char>(codePoint);
      } else if (!appendUtf8(out, codePoint)) {
        return false;
      }
      break;
    }
    case '\\':
    case '"':
    case '/':
    case ' ':
      out += next;
      break;
    default:
      return false; // not a YAML escape
    }
  }
  return false; // unterminated
}

bool readSingleQuoted(const std::string &line, std::string::size_type &pos,
                      std::string &out) {
  ++pos;
  while (pos < line.size()) {
    char c = line[pos++];
    if (c == '\'') {
      if (pos < line.size() && line[pos] == '\'') {
        out += '\'';
        ++pos;
        continue;
      }
      return true;
    }
    out += c;
  }
  return false;
}

bool readScalar(const std::string &line, std::string::size_type &pos,
                std::string &out, bool isKey) {
  if (pos < line.size() && line[pos] == '"') {
    return readDoubleQuoted(line, pos, out);
  }
  if (pos < line.size() && line[pos] == '\'') {
    return readSingleQuoted(line, pos, out);
  }

  // Plain scalar: a key ends at ": " or a final ':', a value at end of line
  std::string::size_type end = line.size();
  if (isKey) {
    end = std::string::npos;
    for (std::string::size_type i = pos; i < line.size(); ++i) {
      if (line[i] == ':' &&
          (i + 1 == line.size() || line[i + 1] == ' ' || line[i + 1] == '\t')) {
        end = i;
        break;
      }
    }
    if (end == std::string::npos) {
      return false;
    }
  }

  out = trimText(line.substr(pos, end - pos));
  pos = end;
  return isKey ? !out.empty() : true;
}

} // anonymous namespace

bool parseMappingLine(const std::string &line, MappingEntry &entry,
                      bool &hasValue) {
  entry = MappingEntry();
  hasValue = false;

  std::string::size_type pos = 0;
  skipSpaces(line, pos);
  if (pos >= line.size() || line[pos] == '#' || line[pos] == '\r') {
    return true;
  }

  if (!readScalar(line, pos, entry.key, true)) {
    return false;
  }

  skipSpaces(line, pos);
  if (pos >= line.size() || line[pos] != ':') {
    return false;
  }
  ++pos;
  skipSpaces(line, pos);

  if (pos >= line.size() || line[pos] == '\r') {
    return true; // key with no value
  }

  bool quoted = line[pos] == '"' || line[pos] == '\'';
  if (!readScalar(line, pos, entry.value, false)) {
    return false;
  }

  if (!quoted && (entry.value.empty() || entry.value == "~" ||
                  entry.value == "null" || entry.value == "Null" ||
                  entry.value == "NULL")) {
    entry.value.clear();
    return true;
  }

  hasValue = true;
  return true;
}

bool writeMappingFile(const std::string &path,
                      const std::vector<MappingEntry> &entries,
                      std::string &error) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    error = "Cannot open " + path + " for writing";
    return false;
  }

  for (const MappingEntry &entry : entries) {
    out << quoteScalar(entry.key) << ": "
        << quoteScalar(escapeText(entry.value)) << "\n";
  }

  out.flush();
  if (!out) {
    error = "Write to " + path + " failed";
    return false;
  }
  return true;
}

MappingFile readMappingFile(const std::string &path) {
  MappingFile result;

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    result.errorMessage = "Cannot open mapping file: " + path;
    return result;
  }

  std::string line;
  std::size_t lineNumber = 0;
  while (std::getline(in, line)) {
    ++lineNumber;

    MappingEntry entry;
    bool hasValue = false;
    if (!parseMappingLine(line, entry, hasValue)) {
      std::cerr << "WARNING: " << path << ":" << lineNumber
                << ": malformed line skipped" << std::endl;
      result.malformedLines++;
      continue;
    }

    if (entry.key.empty()) {
      continue;
    }

    if (!hasValue) {
      result.nullEntries++;
      continue;
    }

    result.entries.push_back(entry);
  }

  result.success = true;
  return result;
}

ReplacementRequest
toReplacementRequest(const std::vector<MappingEntry> &entries) {
  ReplacementRequest request;
  for (const MappingEntry &entry : entries) {
    request[entry.key] = unescapeText(entry.value);
  }
  return request;
}

std::string aliasFilePath(const std::string &pdfPath) {
  std::filesystem::path path(pdfPath);
  path.replace_extension(".alias.yaml");
  return path.string();
}

std::map<std::string, std::string> loadAliasMap(const std::string &pdfPath) {
  std::map<std::string, std::string> aliasToKey;

  std::string aliasPath = aliasFilePath(pdfPath);
  if (!std::filesystem::exists(aliasPath)) {
    return aliasToKey;
  }

  MappingFile file = readMappingFile(aliasPath);
  if (!file.success) {
    std::cerr << "WARNING: " << file.errorMessage << std::endl;
    return aliasToKey;
  }

  // The overlay is stored key -> alias
  for (const MappingEntry &entry : file.entries) {
    aliasToKey[entry.value] = entry.key;
  }
  return aliasToKey;
}

ReplacementRequest
resolveAliases(const std::map<std::string, std::string> &fields,
               const std::map<std::string, std::string> &aliasToKey) {
  ReplacementRequest request;
  for (const auto &field : fields) {
    auto alias = aliasToKey.find(field.first);
    const std::string &key =
        alias != aliasToKey.end() ? alias->second : field.first;
    request[key] = field.second;
  }
  return request;
}

std::vector<std::string>
formatFieldList(const std::vector<TextRun> &runs,
                const std::map<std::string, std::string> &aliasToKey) {
  std::map<std::string, std::string> keyToAlias;
  for (const auto &alias : aliasToKey) {
    keyToAlias[alias.second] = alias.first;
  }

  std::vector<std::string> lines;
  lines.reserve(runs.size());
  for (const TextRun &run : runs) {
    auto alias = keyToAlias.find(run.key);
    const std::string &name =
        alias != keyToAlias.end() ? alias->second : run.key;
    lines.push_back(name + ": " + quoteScalar(run.text));
  }
  return lines;
}

} // namespace fieldedit
