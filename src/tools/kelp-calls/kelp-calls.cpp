//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Provides the `kelp-calls` CLI.  The executable reads a graph in the text
// format, verifies it, runs the call-site walker and prints the discovered
// call sites in discovery order followed by a summary count.  Alternative
// modes stop after verification or print the canonical text of the graph.
//
//===----------------------------------------------------------------------===//

#include "graph/analysis/CallSiteWalker.hpp"
#include "graph/io/Serializer.hpp"
#include "tools/kelp-calls/cli.hpp"
#include "support/diag_expected.hpp"
#include "support/source_manager.hpp"
#include "tools/common/graph_loader.hpp"

#include <iostream>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace kelp::tools::calls
{
namespace
{
constexpr const char *kVersion = "kelp-calls 0.1.0";

/// @brief What the tool does after loading the graph.
enum class Mode
{
    Walk,
    Dump,
    VerifyOnly
};

struct CallsOptions
{
    Mode mode = Mode::Walk;
    bool trace = false;
    std::optional<bool> checkCount;
    std::string path;
};

void usage(std::ostream &os)
{
    os << "Usage: kelp-calls [options] <file.kg>\n"
          "  --dump             print the canonical graph text instead of walking\n"
          "  --verify-only      stop after structural verification\n"
          "  --trace            trace walk decisions to stderr\n"
          "  --check-count      check that every resolved invoke was found\n"
          "  --no-check-count   skip the completeness check\n"
          "  --version          print version information\n"
          "  --help             print this message\n";
}

/// @return 0 to continue, 1 on usage error, 2 when the command is complete.
int parseArgs(int argc, char **argv, CallsOptions &opts, std::ostream &out, std::ostream &err)
{
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--version")
        {
            out << kVersion << '\n';
            return 2;
        }
        if (arg == "--help" || arg == "-h")
        {
            usage(out);
            return 2;
        }
        if (arg == "--dump")
            opts.mode = Mode::Dump;
        else if (arg == "--verify-only")
            opts.mode = Mode::VerifyOnly;
        else if (arg == "--trace")
            opts.trace = true;
        else if (arg == "--check-count")
            opts.checkCount = true;
        else if (arg == "--no-check-count")
            opts.checkCount = false;
        else if (!arg.empty() && arg[0] == '-')
        {
            err << "unknown option '" << arg << "'\n";
            usage(err);
            return 1;
        }
        else if (!opts.path.empty())
        {
            err << "multiple input files given\n";
            usage(err);
            return 1;
        }
        else
            opts.path = arg;
    }
    if (opts.path.empty())
    {
        usage(err);
        return 1;
    }
    return 0;
}

void printCallSites(const graph::Graph &g,
                    const std::vector<graph::NodeId> &calls,
                    std::ostream &out)
{
    for (graph::NodeId id : calls)
        out << '%' << id.index << " invoke @" << g.calleeName(id) << '\n';
    out << "calls: " << calls.size() << '\n';
}

} // namespace

/// @brief Execute the kelp-calls workflow with injectable streams and source manager.
/// @param argc Argument count supplied by the caller.
/// @param argv Argument vector containing the program name, options and input path.
/// @param out Stream receiving results.
/// @param err Stream receiving diagnostics and usage errors.
/// @param sm Source manager used to resolve diagnostic file paths.
/// @return Zero on success; one on argument, I/O, parse, or verification failure.
int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm)
{
    CallsOptions opts;
    if (int rc = parseArgs(argc, argv, opts, out, err); rc != 0)
        return rc == 2 ? 0 : 1;

    if (sm.addFile(opts.path) == 0)
    {
        auto diag = support::makeError({}, "source manager exhausted file identifier space");
        support::printDiag(diag, err);
        return 1;
    }

    graph::Graph g;
    auto load = common::loadGraphFromFile(opts.path, g, err, "cannot open ");
    if (!load.succeeded())
        return 1;

    if (opts.mode == Mode::Dump)
    {
        io::Serializer::write(g, out);
        return 0;
    }

    if (!common::verifyGraph(g, err, &sm))
        return 1;

    if (opts.mode == Mode::VerifyOnly)
    {
        out << "OK\n";
        return 0;
    }

    analysis::CallSiteWalkOptions walkOpts;
    walkOpts.trace = opts.trace;
    if (opts.checkCount)
        walkOpts.checkCallCount = *opts.checkCount;

    const auto calls = analysis::discoverCallSites(g, std::move(walkOpts));
    printCallSites(g, calls, out);
    return 0;
}

} // namespace kelp::tools::calls

/// @brief Entry point for the `kelp-calls` binary.
#ifndef KELP_CALLS_SKIP_MAIN
int main(int argc, char **argv)
{
    kelp::support::SourceManager sm;
    return kelp::tools::calls::runCLI(argc, argv, std::cout, std::cerr, sm);
}
#endif
