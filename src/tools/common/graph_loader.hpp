//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/common/graph_loader.hpp
// Purpose: Shared helpers for loading and verifying graphs used by CLI tools.
// Key invariants: LoadResult describes exactly one outcome; a diagnostic is
//                 present for every failure status.
// Ownership/Lifetime: Functions take Graph by reference and populate it.
//                     LoadResult owns its diagnostic data; safe to copy/move.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "graph/Graph.hpp"
#include "support/diag_expected.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace kelp::tools::common
{

/// @brief Result classifications for attempting to load a graph from disk.
enum class LoadStatus
{
    Success,    ///< Graph loaded successfully.
    FileError,  ///< Input file could not be opened.
    ParseError, ///< Parser reported diagnostics.
    VerifyError ///< Verifier reported diagnostics.
};

/// @brief Outcome produced by ::loadGraphFromFile describing the failure mode.
struct LoadResult
{
    LoadStatus status = LoadStatus::Success;
    std::optional<support::Diag> diag{};
    std::string path{};

    [[nodiscard]] bool succeeded() const
    {
        return status == LoadStatus::Success;
    }

    [[nodiscard]] bool isParseError() const
    {
        return status == LoadStatus::ParseError;
    }

    [[nodiscard]] bool isVerifyError() const
    {
        return status == LoadStatus::VerifyError;
    }
};

/// @brief Parse the graph text file at @p path into @p graph.
///
/// File and parse failures are printed to @p err.  A file that cannot be
/// opened is reported as @p ioErrorPrefix followed by the path.
LoadResult loadGraphFromFile(const std::string &path,
                             graph::Graph &graph,
                             std::ostream &err,
                             std::string_view ioErrorPrefix = "unable to open ");

/// @brief Verify @p graph and forward every diagnostic to @p err on failure.
/// @return True when verification succeeds; false otherwise.
bool verifyGraph(const graph::Graph &graph,
                 std::ostream &err,
                 const support::SourceManager *sm = nullptr);

} // namespace kelp::tools::common
