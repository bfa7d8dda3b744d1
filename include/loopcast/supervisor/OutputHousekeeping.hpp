// Repository: Loopcast
// Component: Output Housekeeping
// Purpose: Segment directory preparation between encoder runs.
// Copyright (c) 2026 Loopcast Authors

#ifndef LOOPCAST_SUPERVISOR_OUTPUT_HOUSEKEEPING_HPP_
#define LOOPCAST_SUPERVISOR_OUTPUT_HOUSEKEEPING_HPP_

#include <string>

namespace loopcast::supervisor {

// Creates the output directory if missing. Returns false (and logs) on error.
bool EnsureOutputDirectory(const std::string& output_dir);

// True for stream<anything>.ts.
bool IsSegmentFileName(const std::string& name);

// Deletes prior segment files; the playlist is kept so clients polling it
// keep getting a valid response across restarts. Returns the number removed.
// Failures are logged per file, never thrown.
size_t PurgeSegments(const std::string& output_dir);

}  // namespace loopcast::supervisor

#endif  // LOOPCAST_SUPERVISOR_OUTPUT_HOUSEKEEPING_HPP_
