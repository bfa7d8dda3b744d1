// Repository: Loopcast
// Component: Line Classifier
// Purpose: Pure mapping from one ffmpeg diagnostic line to a HealthSignal.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_LINE_CLASSIFIER_HPP_
#define LOOPCAST_SUPERVISOR_LINE_CLASSIFIER_HPP_

#include <string>
#include <vector>

#include "loopcast/supervisor/HealthSignal.hpp"

namespace loopcast::supervisor {

// One row of the classification table. A rule matches when every needle in
// `all_of` occurs in the line. Case-insensitive rules compare against the
// lower-cased line (needles must be lower case).
struct ClassificationRule {
  HealthSignal::Kind kind;
  std::vector<std::string> all_of;
  bool case_insensitive = false;
};

// Rules are evaluated top to bottom; the first match wins. Order matters:
// critical decoder errors must be checked before the generic error/warning
// rows, and input-open lines before everything (they are never failures).
const std::vector<ClassificationRule>& DefaultClassificationTable();

// Classifies one line (without trailing newline / carriage return).
// kInputOpened fills opened_path from "Opening '<path>' for reading".
// Never returns kProcessExited; input_path is left unset (the reader
// attributes it).
HealthSignal ClassifyLine(const std::string& line);

// Same, against an explicit table (tests).
HealthSignal ClassifyLine(const std::string& line,
                          const std::vector<ClassificationRule>& table);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_LINE_CLASSIFIER_HPP_
