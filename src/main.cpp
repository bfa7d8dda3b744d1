// Repository: Loopcast
// Component: Loopcast Main Entry Point
// Purpose: Parses configuration and runs the HLS loop streamer.
// Copyright (c) 2026 Loopcast Authors

#include <iostream>
#include <string>
#include <vector>

#include "loopcast/app/StreamerApp.hpp"
#include "loopcast/app/StreamerConfig.hpp"
#include "loopcast/catalog/FFmpegMediaProber.h"
#include "loopcast/supervisor/PosixTranscoderProcess.h"

int main(int argc, char* argv[]) {
  using namespace loopcast;

  const std::vector<std::string> args(argv + 1, argv + argc);
  app::ParseResult parsed = app::ParseArgs(args, app::ProcessEnvironment());
  if (parsed.help) {
    app::PrintUsage(std::cout, argv[0]);
    return app::kExitOk;
  }
  if (!parsed.valid) {
    std::cerr << "Error: " << parsed.error << "\n\n";
    app::PrintUsage(std::cerr, argv[0]);
    return app::kExitUsage;
  }

  catalog::FFmpegMediaProber prober;
  supervisor::PosixTranscoderLauncher launcher;

  app::StreamerApp streamer(std::move(parsed.config), prober, launcher);
  streamer.InstallSignalHandlers();
  return streamer.Run();
}
