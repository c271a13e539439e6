//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/tools/common/graph_loader.cpp
// Purpose: Standardise how command-line tools load, verify, and report on graphs.
// Key invariants: Load results encode whether the failure came from the file
//                 system or the parser.
// Ownership/Lifetime: The helpers operate on caller-owned graphs and streams.
// Links: src/tools/common/graph_loader.hpp
//
//===----------------------------------------------------------------------===//

#include "tools/common/graph_loader.hpp"

#include "graph/io/Parser.hpp"
#include "graph/verify/GraphVerifier.hpp"
#include "support/diagnostics.hpp"

#include <fstream>

namespace kelp::tools::common
{
namespace
{
LoadResult makeFileError(const std::string &path, std::string message)
{
    support::Diag diag{support::Severity::Error, std::move(message), {}};
    return {LoadStatus::FileError, diag, path};
}
} // namespace

LoadResult loadGraphFromFile(const std::string &path,
                             graph::Graph &graph,
                             std::ostream &err,
                             std::string_view ioErrorPrefix)
{
    std::ifstream input(path);
    if (!input)
    {
        std::string message = std::string(ioErrorPrefix) + path;
        err << message << '\n';
        return makeFileError(path, std::move(message));
    }

    auto parsed = io::Parser::parse(input, graph);
    if (!parsed)
    {
        err << path << ": ";
        support::printDiag(parsed.error(), err);
        return {LoadStatus::ParseError, parsed.error(), path};
    }
    return {LoadStatus::Success, std::nullopt, path};
}

bool verifyGraph(const graph::Graph &graph, std::ostream &err, const support::SourceManager *sm)
{
    support::DiagnosticEngine diags;
    if (verify::GraphVerifier::verify(graph, diags))
        return true;
    diags.printAll(err, sm);
    return false;
}

} // namespace kelp::tools::common
