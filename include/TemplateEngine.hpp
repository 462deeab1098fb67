#ifndef FIELD_EDIT_TEMPLATE_ENGINE_HPP
#define FIELD_EDIT_TEMPLATE_ENGINE_HPP

#include "Document.hpp"
#include "FieldKey.hpp"

#include <cstddef>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace fieldedit {

/// Maximum per-coordinate difference between a key and a run that matches it
constexpr double kMatchTolerance = 10.0;

/// Baseline of inserted text, as a fraction of the box height from its top
constexpr double kBaselineRatio = 0.8;

/**
 * @brief Configuration options for template processing
 */
struct EditorConfig {
  bool verbose = false;                  ///< Print DEBUG trace lines
  double matchTolerance = kMatchTolerance; ///< Geometry tolerance in points
  double baselineRatio = kBaselineRatio; ///< Baseline position in the box
  std::string fallbackFont = "Helvetica"; ///< Standard font for fallback text
  bool preserveGraphics = true; ///< Keep paths and images under redactions
};

/**
 * @brief Colour classes accepted by extractRuns()
 */
enum class ColorFilter {
  None, ///< Keep every run
  Red   ///< Keep runs whose colour passes isRedColor()
};

/**
 * @brief A text run together with its page and identifier
 */
struct TextRun {
  std::string key;        ///< FieldKey built from page, bbox and text
  int page = 0;           ///< 0-indexed page number
  BoundingBox bbox;       ///< Run rectangle, top-left origin
  std::string text;       ///< Trimmed run text, never empty
  std::string fontFamily; ///< Font name
  double fontSize = 12.0; ///< Font size in points
  RGBColor color;         ///< Normalised fill colour
};

/**
 * @brief Replacement values keyed by FieldKey string
 *
 * Keys are strings produced by encodeKey(). Values are the new text, already
 * unescaped.
 */
using ReplacementRequest = std::map<std::string, std::string>;

/**
 * @brief A decoded replacement request entry
 */
struct ReplacementTarget {
  std::string key;      ///< Original key string
  FieldKey field;       ///< Decoded page, bbox and text
  std::string newValue; ///< Replacement text
};

/**
 * @brief A run matched to a replacement, ready for the executor
 */
struct MatchedEdit {
  std::string key;          ///< Key of the target that matched
  int page = 0;             ///< 0-indexed page number
  BoundingBox rect;         ///< Rectangle of the matched run
  std::string originalText; ///< Text of the matched run
  std::string replacement;  ///< New text
  std::string fontFamily;   ///< Font of the matched run
  double fontSize = 12.0;   ///< Font size of the matched run
  RGBColor color;           ///< Original colour of the matched run
};

/**
 * @brief Result of one requested edit
 */
enum class EditStatus {
  Applied,                ///< Removed and re-inserted with the original font
  AppliedWithFallback,    ///< Removed and re-inserted with the fallback font
  SkippedMalformedKey,    ///< The key did not decode
  SkippedNoMatch,         ///< No run matched the key
  SkippedNotLocated,      ///< The text was not found near the run rectangle
  SkippedRedactionFailed, ///< Redaction removed nothing
  SkippedInsertFailed     ///< Removed, but neither insertion path worked
};

/**
 * @brief Human readable name of an EditStatus
 */
const char *editStatusName(EditStatus status);

/**
 * @brief Whether the status counts as a successful edit
 */
bool isApplied(EditStatus status);

/**
 * @brief Outcome of one requested edit
 */
struct EditOutcome {
  std::string key;    ///< Key the outcome refers to
  EditStatus status;  ///< What happened
  std::string detail; ///< Reason for a skip, empty otherwise
};

/**
 * @brief Result of a replacement pass
 */
struct ReplacementReport {
  bool success = false;              ///< Whether the pass ran to completion
  std::string errorMessage;          ///< Error message if failed
  std::size_t requested = 0;         ///< Number of entries in the request
  std::size_t applied = 0;           ///< Number of edits applied
  std::vector<EditOutcome> outcomes; ///< One entry per request entry
  double processingTimeMs = 0;       ///< Processing time in milliseconds
};

/**
 * @brief Result of a placeholder sweep
 */
struct RemovalReport {
  bool success = false;             ///< Whether the sweep ran to completion
  std::string errorMessage;         ///< Error message if failed
  std::size_t removed = 0;          ///< Runs whose matches were removed
  std::size_t reinserted = 0;       ///< Remainders written back
  std::vector<std::string> texts;   ///< Texts of the runs that were touched
  double processingTimeMs = 0;      ///< Processing time in milliseconds
};

// ---------------------------------------------------------------------------
// Run extraction
// ---------------------------------------------------------------------------

/**
 * @brief Loose "marked in red" test: R > 0.5, G < 0.3, B < 0.3
 */
bool isRedColor(const RGBColor &color);

/**
 * @brief Trim leading and trailing whitespace
 */
std::string trimText(const std::string &text);

/**
 * @brief Extract every non-empty text run of a document
 *
 * Runs are produced in document order: page by page, then in the layout
 * order reported by the engine. The document is not modified.
 *
 * @param document Open document
 * @param filter Colour class to keep
 * @param sortByPosition Reorder by (page, rounded y1, x1)
 * @return Runs with their keys
 */
std::vector<TextRun> extractRuns(const Document &document,
                                 ColorFilter filter = ColorFilter::None,
                                 bool sortByPosition = false);

/**
 * @brief Stable sort by page, then rounded top edge, then left edge
 *
 * Rounding the top edge keeps runs with sub-point jitter on one visual line.
 */
void sortByPosition(std::vector<TextRun> &runs);

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

/**
 * @brief Whether every edge of two boxes differs by at most tolerance
 */
bool boxesWithinTolerance(const BoundingBox &a, const BoundingBox &b,
                          double tolerance);

/**
 * @brief Largest difference between corresponding edges of two boxes
 */
double boxDistance(const BoundingBox &a, const BoundingBox &b);

/**
 * @brief Pair the runs of one page with replacement targets
 *
 * A run and a target are candidates when they are on the same page, their
 * text is equal and their boxes lie within tolerance. Candidates are paired
 * closest first (by boxDistance()), ties going to the earlier run and then
 * the earlier target. Each run and each target is used at most once, so two
 * identical fields a few points apart keep their own values. Targets that
 * match nothing are simply absent from the result.
 *
 * @param page 0-indexed page the runs belong to
 * @param pageRuns Runs of that page in extraction order
 * @param targets Decoded replacement targets (any page)
 * @param tolerance Geometry tolerance in points
 * @return Matched edits in run order
 */
std::vector<MatchedEdit> matchRuns(int page,
                                   const std::vector<TextRun> &pageRuns,
                                   const std::vector<ReplacementTarget> &targets,
                                   double tolerance = kMatchTolerance);

// ---------------------------------------------------------------------------
// Replacement
// ---------------------------------------------------------------------------

/**
 * @brief Redact matched runs and insert their replacements
 *
 * Works page by page in two phases: every matched run on the page is
 * removed first, then every replacement on the page is inserted. The
 * document is saved once at the end if anything was changed.
 *
 * @param document Open document
 * @param edits Matched edits, any page order
 * @param textColor Colour of the inserted text
 * @param config Tolerance, baseline, fallback font and logging options
 * @param outcomes Receives one outcome per edit
 * @return Number of edits applied
 */
std::size_t applyEdits(Document &document,
                       const std::vector<MatchedEdit> &edits,
                       const RGBColor &textColor, const EditorConfig &config,
                       std::vector<EditOutcome> &outcomes);

/**
 * @brief Strip a pattern from every run that contains it
 *
 * Each matching run is redacted. Whatever is left after removing the pattern
 * is written back at the run's top-left corner with the run's font, size
 * and colour. The document is saved if anything was removed.
 *
 * @param document Open document
 * @param pattern Regular expression to strip
 * @param config Baseline, fallback font and logging options
 * @return Sweep report
 */
RemovalReport removeMatching(Document &document, const std::regex &pattern,
                             const EditorConfig &config);

} // namespace fieldedit

#endif // FIELD_EDIT_TEMPLATE_ENGINE_HPP
