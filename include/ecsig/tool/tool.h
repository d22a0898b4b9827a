// ECSIG - Signature Tool
// Copyright (c) 2024 ECSIG Developers
// MIT License
//
// Command implementation behind ecsig-tool. The executable forwards its
// arguments and standard streams here; tests pass string streams.

#ifndef ECSIG_TOOL_TOOL_H
#define ECSIG_TOOL_TOOL_H

#include <iosfwd>

namespace ecsig {
namespace tool {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* TOOL_NAME = "ECSIG Tool";

// ============================================================================
// Exit Codes
// ============================================================================

constexpr int EXIT_OK = 0;
constexpr int EXIT_REJECTED = 1;
constexpr int EXIT_USAGE = 2;

/// Streams the tool reads from and writes to
struct ToolIo {
    std::istream& in;
    std::ostream& out;
    std::ostream& err;
};

/**
 * Run ecsig-tool.
 *
 * @param argc Argument count, including the program name
 * @param argv Arguments
 * @param io Input for hex read from stdin, output for results, and
 *           error output for diagnostics
 * @return EXIT_OK, EXIT_REJECTED or EXIT_USAGE
 */
int RunTool(int argc, const char* const argv[], ToolIo io);

} // namespace tool
} // namespace ecsig

#endif // ECSIG_TOOL_TOOL_H
