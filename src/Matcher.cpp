#include "TemplateEngine.hpp"

#include <algorithm>
#include <cmath>

namespace fieldedit {

bool boxesWithinTolerance(const BoundingBox &a, const BoundingBox &b,
                          double tolerance) {
  return std::abs(a.x1 - b.x1) <= tolerance &&
         std::abs(a.y1 - b.y1) <= tolerance &&
         std::abs(a.x2 - b.x2) <= tolerance &&
         std::abs(a.y2 - b.y2) <= tolerance;
}

double boxDistance(const BoundingBox &a, const BoundingBox &b) {
  return std::max(std::max(std::abs(a.x1 - b.x1), std::abs(a.y1 - b.y1)),
                  std::max(std::abs(a.x2 - b.x2), std::abs(a.y2 - b.y2)));
}

namespace {

struct Candidate {
  std::size_t run;
  std::size_t target;
  double distance;
};

} // anonymous namespace

std::vector<MatchedEdit> matchRuns(int page,
                                   const std::vector<TextRun> &pageRuns,
                                   const std::vector<ReplacementTarget> &targets,
                                   double tolerance) {
  std::vector<Candidate> candidates;
  for (std::size_t r = 0; r < pageRuns.size(); r++) {
    const TextRun &run = pageRuns[r];
    for (std::size_t t = 0; t < targets.size(); t++) {
      const ReplacementTarget &target = targets[t];
      // Text must match exactly; only the geometry is fuzzy
      if (target.field.page != page || run.text != target.field.text ||
          !boxesWithinTolerance(run.bbox, target.field.bbox, tolerance)) {
        continue;
      }
      candidates.push_back({r, t, boxDistance(run.bbox, target.field.bbox)});
    }
  }

  // Candidates are already in (run, target) order, so a stable sort keeps
  // that order among equal distances
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate &a, const Candidate &b) {
                     return a.distance < b.distance;
                   });

  const std::size_t unmatched = targets.size();
  std::vector<std::size_t> targetOfRun(pageRuns.size(), unmatched);
  std::vector<bool> consumed(targets.size(), false);
  for (const Candidate &candidate : candidates) {
    if (targetOfRun[candidate.run] != unmatched || consumed[candidate.target]) {
      continue;
    }
    targetOfRun[candidate.run] = candidate.target;
    consumed[candidate.target] = true;
  }

  std::vector<MatchedEdit> matches;
  for (std::size_t r = 0; r < pageRuns.size(); r++) {
    if (targetOfRun[r] == unmatched) {
      continue;
    }
    const TextRun &run = pageRuns[r];
    const ReplacementTarget &target = targets[targetOfRun[r]];

    MatchedEdit edit;
    edit.key = target.key;
    edit.page = page;
    edit.rect = run.bbox;
    edit.originalText = run.text;
    edit.replacement = target.newValue;
    edit.fontFamily = run.fontFamily;
    edit.fontSize = run.fontSize;
    edit.color = run.color;
    matches.push_back(edit);
  }

  return matches;
}

} // namespace fieldedit
