#ifndef FIELD_EDIT_MAPPING_FILE_HPP
#define FIELD_EDIT_MAPPING_FILE_HPP

#include "TemplateEngine.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace fieldedit {

/**
 * @brief One key/value line of a mapping or alias file
 */
struct MappingEntry {
  std::string key;   ///< Left-hand side (a FieldKey or an alias)
  std::string value; ///< Right-hand side, unquoted
};

/**
 * @brief Contents of a mapping file
 */
struct MappingFile {
  bool success = false;              ///< Whether the file could be read
  std::string errorMessage;          ///< Error message if failed
  std::vector<MappingEntry> entries; ///< Entries with a value, in file order
  std::size_t nullEntries = 0;       ///< Entries without a value (dropped)
  std::size_t malformedLines = 0;    ///< Lines that could not be parsed
};

/**
 * @brief Quote a string as a YAML double-quoted scalar
 */
std::string quoteScalar(const std::string &value);

/**
 * @brief Parse one "key: value" line
 *
 * Keys and values may be double-quoted, single-quoted or plain. A missing
 * value, "~" or "null" leaves hasValue false.
 *
 * @param line Line without its terminator
 * @param entry Receives the parsed key and value
 * @param hasValue Set to whether a value was present
 * @return false if the line is malformed; blank and comment lines return
 *         true with an empty key
 */
bool parseMappingLine(const std::string &line, MappingEntry &entry,
                      bool &hasValue);

/**
 * @brief Write a field mapping, one quoted key/value line per field
 *
 * Values are run through escapeText() before quoting so the file round
 * trips through a YAML loader followed by unescapeText().
 *
 * @param path Output file
 * @param entries FieldKey and raw text pairs, written in order
 * @param error Receives the failure reason
 * @return true on success
 */
bool writeMappingFile(const std::string &path,
                      const std::vector<MappingEntry> &entries,
                      std::string &error);

/**
 * @brief Read a key/value file written by writeMappingFile() or by hand
 *
 * Values are returned unquoted but still escaped.
 */
MappingFile readMappingFile(const std::string &path);

/**
 * @brief Turn mapping entries into a replacement request
 *
 * Values are unescaped with unescapeText(). Later duplicates win.
 */
ReplacementRequest toReplacementRequest(const std::vector<MappingEntry> &entries);

/**
 * @brief Path of the alias overlay that belongs to a PDF
 *
 * "forms/invoice.pdf" maps to "forms/invoice.alias.yaml".
 */
std::string aliasFilePath(const std::string &pdfPath);

/**
 * @brief Load the alias overlay of a PDF as alias to FieldKey
 *
 * The file stores "FieldKey: alias" lines. A missing or unreadable file
 * yields an empty map.
 */
std::map<std::string, std::string> loadAliasMap(const std::string &pdfPath);

/**
 * @brief Translate alias-keyed values into a replacement request
 *
 * Names without an alias are taken to be FieldKeys already.
 */
ReplacementRequest
resolveAliases(const std::map<std::string, std::string> &fields,
               const std::map<std::string, std::string> &aliasToKey);

/**
 * @brief Format runs as "alias: \"text\"" lines
 *
 * Runs without an alias are listed under their key.
 */
std::vector<std::string>
formatFieldList(const std::vector<TextRun> &runs,
                const std::map<std::string, std::string> &aliasToKey);

} // namespace fieldedit

#endif // FIELD_EDIT_MAPPING_FILE_HPP
