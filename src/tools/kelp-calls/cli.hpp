//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/kelp-calls/cli.hpp
// Purpose: Declares the kelp-calls entry point so tests can drive the CLI
//          with in-memory streams.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_manager.hpp"

#include <ostream>

namespace kelp::tools::calls
{

/// @brief Run kelp-calls with @p argv, writing results to @p out and errors to @p err.
/// @return Process exit status.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm);

} // namespace kelp::tools::calls
