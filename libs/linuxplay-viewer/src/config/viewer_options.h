///////////////////////////////////////////////////////////////////////////////
// viewer_options.h -- Command line for linuxplay-viewer
///////////////////////////////////////////////////////////////////////////////
#pragma once

#include "session/host_connection.h"

#include <lp/common.h>

#include <string>

namespace lp {

struct ViewerOptions {
    bool     help      = false;
    LogLevel log_level = LogLevel::INFO;
};

/// Default certificate directory: $HOME/.linuxplay-viewer.
std::string defaultCertDir();

/// "0,2" -> {0, 2}.  Rejects empty items and non-digits.
bool parseMonitorIndices(const std::string& text, std::vector<uint32_t>& out);

bool parseViewerArgs(int argc, char* argv[], ViewerConfig& config,
                     ViewerOptions& options, std::string& error);

void printViewerUsage(const char* argv0);

} // namespace lp
