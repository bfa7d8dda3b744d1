// Repository: Loopcast
// Component: Line Classifier
// Purpose: Pure mapping from one ffmpeg diagnostic line to a HealthSignal.
// Copyright (c) 2026 Loopcast Authors

#include "loopcast/supervisor/LineClassifier.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace loopcast::supervisor {

namespace {

using Kind = HealthSignal::Kind;

// libavformat logs: Opening '/media/a.mp4' for reading
const std::regex& OpeningForReadingPattern() {
  static const std::regex pattern(R"(Opening '(.*)' for reading)");
  return pattern;
}

std::string ToLower(const std::string& s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool Matches(const ClassificationRule& rule, const std::string& line,
             const std::string& lower_line) {
  const std::string& haystack = rule.case_insensitive ? lower_line : line;
  for (const auto& needle : rule.all_of) {
    if (haystack.find(needle) == std::string::npos) return false;
  }
  return true;
}

}  // namespace

const char* ToString(HealthSignal::Kind kind) {
  switch (kind) {
    case Kind::kInfo:
      return "info";
    case Kind::kProgress:
      return "progress";
    case Kind::kWarning:
      return "warning";
    case Kind::kCriticalDecodeError:
      return "critical_decode_error";
    case Kind::kInputOpened:
      return "input_opened";
    case Kind::kProcessExited:
      return "process_exited";
  }
  return "unknown";
}

const std::vector<ClassificationRule>& DefaultClassificationTable() {
  static const std::vector<ClassificationRule> table = {
      {Kind::kInputOpened, {"Opening '", "' for reading"}},

      {Kind::kCriticalDecodeError, {"Error submitting packet to decoder"}},
      {Kind::kCriticalDecodeError, {"Decoder thread returned error"}},
      {Kind::kCriticalDecodeError, {"Internal bug, should not have happened"}},
      {Kind::kCriticalDecodeError, {"Error while decoding stream"}},

      // Level-tagged chatter ("-loglevel level+debug").
      {Kind::kInfo, {"[debug] "}},
      {Kind::kInfo, {"[verbose] "}},
      {Kind::kInfo, {"[trace] "}},

      // Periodic stats: "frame= 1234 fps= 30 q=28.0 size= ... time=... speed=1x"
      // Audio-only encodes drop the frame counter.
      {Kind::kProgress, {"frame=", "fps="}},
      {Kind::kProgress, {"size=", "time="}},

      {Kind::kWarning, {"warning"}, true},
      {Kind::kWarning, {"error"}, true},
      {Kind::kWarning, {"failed"}, true},
      {Kind::kWarning, {"invalid"}, true},
      {Kind::kWarning, {"could not"}, true},
  };
  return table;
}

HealthSignal ClassifyLine(const std::string& line) {
  return ClassifyLine(line, DefaultClassificationTable());
}

HealthSignal ClassifyLine(const std::string& line,
                          const std::vector<ClassificationRule>& table) {
  HealthSignal signal;
  signal.line = line;

  const std::string lower_line = ToLower(line);
  for (const auto& rule : table) {
    if (!Matches(rule, line, lower_line)) continue;
    signal.kind = rule.kind;
    break;
  }

  if (signal.kind == Kind::kInputOpened) {
    std::smatch match;
    if (std::regex_search(line, match, OpeningForReadingPattern())) {
      signal.opened_path = match[1].str();
    } else {
      signal.kind = Kind::kInfo;
    }
  }
  return signal;
}

}  // namespace loopcast::supervisor
