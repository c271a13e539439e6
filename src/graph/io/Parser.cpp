//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the graph text parser.  Parsing runs in two passes: the first
// allocates one node per declaration so forward references resolve, the
// second wires successors, merge ends, loop membership, call targets and
// values.
//
//===----------------------------------------------------------------------===//

#include "graph/io/Parser.hpp"

#include "graph/Graph.hpp"
#include "graph/io/ParserUtil.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kelp::io
{
namespace
{
using graph::CallTargetKind;
using graph::Graph;
using graph::NodeId;
using graph::NodeKind;
using support::Expected;
using support::makeError;

struct PendingNode
{
    NodeId id;
    NodeKind kind;
    std::string operands;
    std::string successors;
    unsigned lineNo = 0;
    bool dead = false;
};

struct ParserState
{
    explicit ParserState(Graph &graph) : g(graph) {}

    Graph &g;
    unsigned lineNo = 0;
    bool sawHeader = false;
    std::unordered_map<std::string, NodeId> labels;
    std::vector<PendingNode> pending;
    std::string entryLabel;
    unsigned entryLine = 0;
};

Expected<void> lineError(unsigned lineNo, std::string_view message)
{
    return Expected<void>{makeError({}, formatLineDiag(lineNo, message))};
}

std::string stripComment(const std::string &line)
{
    const size_t hash = line.find('#');
    return trim(hash == std::string::npos ? std::string_view(line)
                                          : std::string_view(line).substr(0, hash));
}

Expected<NodeId> resolveLabel(const ParserState &st, const std::string &token, unsigned lineNo)
{
    if (!isLabelToken(token))
        return makeError({}, formatLineDiag(lineNo, "expected label, found '" + token + "'"));
    auto it = st.labels.find(token.substr(1));
    if (it == st.labels.end())
        return makeError({}, formatLineDiag(lineNo, "unknown label '" + token + "'"));
    return it->second;
}

Expected<std::vector<NodeId>> resolveLabelList(const ParserState &st,
                                               std::string_view text,
                                               unsigned lineNo)
{
    std::vector<NodeId> ids;
    for (const std::string &token : splitCommaSeparated(text))
    {
        if (token.empty())
            return makeError({}, formatLineDiag(lineNo, "empty entry in label list"));
        auto id = resolveLabel(st, token, lineNo);
        if (!id)
            return id.error();
        ids.push_back(id.value());
    }
    return ids;
}

/// @brief Parse `graph @name`.
Expected<void> parseHeader(const std::string &line, ParserState &st)
{
    std::string rest = trim(std::string_view(line).substr(5));
    if (rest.size() < 2 || rest.front() != '@')
        return lineError(st.lineNo, "expected 'graph @name'");
    st.g.setName(rest.substr(1));
    st.sawHeader = true;
    return {};
}

/// @brief First pass over a `%label = mnemonic ...` line: allocate the node.
Expected<void> declareNode(const std::string &line, ParserState &st)
{
    const size_t eq = line.find('=');
    if (eq == std::string::npos)
        return lineError(st.lineNo, "missing '='");
    std::string label = trim(std::string_view(line).substr(0, eq));
    if (!isLabelToken(label))
        return lineError(st.lineNo, "malformed label '" + label + "'");
    label.erase(0, 1);
    if (st.labels.count(label))
        return lineError(st.lineNo, "duplicate label '%" + label + "'");

    std::string body = trim(std::string_view(line).substr(eq + 1));
    PendingNode pn;
    pn.lineNo = st.lineNo;

    constexpr std::string_view kDeadMarker = "!dead";
    if (body.size() >= kDeadMarker.size() &&
        std::string_view(body).substr(body.size() - kDeadMarker.size()) == kDeadMarker)
    {
        pn.dead = true;
        body = trim(std::string_view(body).substr(0, body.size() - kDeadMarker.size()));
    }

    const size_t arrow = body.find("->");
    if (arrow != std::string::npos)
    {
        pn.successors = trim(std::string_view(body).substr(arrow + 2));
        if (pn.successors.empty())
            return lineError(st.lineNo, "missing successor list after '->'");
        body = trim(std::string_view(body).substr(0, arrow));
    }

    const size_t space = body.find_first_of(" \t[(");
    const std::string mnemonic = body.substr(0, space);
    if (space != std::string::npos)
        pn.operands = trim(std::string_view(body).substr(space));

    auto kind = graph::nodeKindFromMnemonic(mnemonic);
    if (!kind)
        return lineError(st.lineNo, "unknown node kind '" + mnemonic + "'");
    pn.kind = *kind;
    pn.id = st.g.addNode(*kind);
    st.labels.emplace(std::move(label), pn.id);
    st.pending.push_back(std::move(pn));
    return {};
}

Expected<void> parseInvokeOperands(const PendingNode &pn, ParserState &st)
{
    std::string head = pn.operands;
    std::string args;
    const size_t lp = head.find('(');
    if (lp != std::string::npos)
    {
        if (head.back() != ')')
            return lineError(pn.lineNo, "missing ')' after call arguments");
        args = head.substr(lp + 1, head.size() - lp - 2);
        head = trim(std::string_view(head).substr(0, lp));
    }

    if (head == "indirect")
    {
        st.g.setCallTarget(pn.id, CallTargetKind::Indirect);
    }
    else
    {
        CallTargetKind target = CallTargetKind::Method;
        constexpr std::string_view kIntrinsic = "intrinsic";
        if (head.rfind(kIntrinsic, 0) == 0)
        {
            target = CallTargetKind::Intrinsic;
            head = trim(std::string_view(head).substr(kIntrinsic.size()));
        }
        if (head.size() < 2 || head.front() != '@')
            return lineError(pn.lineNo, "expected '@callee', 'indirect' or 'intrinsic @name'");
        st.g.setCallTarget(pn.id, target, std::string_view(head).substr(1));
    }

    auto inputs = resolveLabelList(st, args, pn.lineNo);
    if (!inputs)
        return Expected<void>{inputs.error()};
    for (NodeId input : inputs.value())
        st.g.addInput(pn.id, input);
    return {};
}

Expected<void> parseEndList(const PendingNode &pn, ParserState &st)
{
    const std::string &ops = pn.operands;
    if (ops.empty())
    {
        if (pn.kind == NodeKind::Merge)
            return lineError(pn.lineNo, "merge requires a forward end list '[...]'");
        return {};
    }
    if (ops.front() != '[' || ops.back() != ']')
        return lineError(pn.lineNo, "malformed forward end list '" + ops + "'");

    auto ends = resolveLabelList(st, std::string_view(ops).substr(1, ops.size() - 2), pn.lineNo);
    if (!ends)
        return Expected<void>{ends.error()};
    for (NodeId e : ends.value())
    {
        if (st.g.kind(e) != NodeKind::End)
            return lineError(pn.lineNo, "forward end %" + std::to_string(e.index) +
                                            " is not an 'end' node");
        if (st.g.node(e).owner.isValid())
            return lineError(pn.lineNo,
                             "end %" + std::to_string(e.index) + " already feeds another merge");
        st.g.bindEnd(e, pn.id);
    }
    return {};
}

Expected<void> parseLoopOwner(const PendingNode &pn, ParserState &st)
{
    auto loop = resolveLabel(st, pn.operands, pn.lineNo);
    if (!loop)
        return Expected<void>{loop.error()};
    if (st.g.kind(loop.value()) != NodeKind::LoopBegin)
        return lineError(pn.lineNo, "'" + pn.operands + "' is not a 'loopbegin' node");
    if (pn.kind == NodeKind::LoopEnd)
        st.g.bindLoopEnd(pn.id, loop.value());
    else
        st.g.bindLoopExit(pn.id, loop.value());
    return {};
}

Expected<void> parseValue(const PendingNode &pn, ParserState &st)
{
    int64_t value = 0;
    if (!parseIntegerLiteral(pn.operands, value))
        return lineError(pn.lineNo, "expected integer literal, found '" + pn.operands + "'");
    st.g.setValue(pn.id, value);
    return {};
}

/// @brief Second pass: wire operands and successors of one declared node.
Expected<void> resolveNode(const PendingNode &pn, ParserState &st)
{
    Expected<void> ops{};
    switch (pn.kind)
    {
        case NodeKind::Invoke:
            ops = parseInvokeOperands(pn, st);
            break;
        case NodeKind::Merge:
        case NodeKind::LoopBegin:
            ops = parseEndList(pn, st);
            break;
        case NodeKind::LoopEnd:
        case NodeKind::LoopExit:
            ops = parseLoopOwner(pn, st);
            break;
        case NodeKind::Constant:
        case NodeKind::Parameter:
            ops = parseValue(pn, st);
            break;
        default:
            if (!pn.operands.empty())
                ops = lineError(pn.lineNo, "unexpected operands '" + pn.operands + "'");
            break;
    }
    if (!ops)
        return ops;

    auto succs = resolveLabelList(st, pn.successors, pn.lineNo);
    if (!succs)
        return Expected<void>{succs.error()};
    for (NodeId succ : succs.value())
        st.g.addSuccessor(pn.id, succ);
    if (pn.dead)
        st.g.kill(pn.id);
    return {};
}

Expected<void> resolveEntry(ParserState &st)
{
    if (!st.entryLabel.empty())
    {
        auto entry = resolveLabel(st, st.entryLabel, st.entryLine);
        if (!entry)
            return Expected<void>{entry.error()};
        st.g.setStart(entry.value());
        return {};
    }

    NodeId found;
    for (const PendingNode &pn : st.pending)
    {
        if (pn.kind != NodeKind::Start)
            continue;
        if (found.isValid())
            return lineError(pn.lineNo, "multiple start nodes; add an 'entry' directive");
        found = pn.id;
    }
    if (found.isValid())
        st.g.setStart(found);
    return {};
}

} // namespace

Expected<void> Parser::parse(std::istream &is, Graph &g)
{
    ParserState st(g);
    std::string raw;
    while (std::getline(is, raw))
    {
        ++st.lineNo;
        std::string line = stripComment(raw);
        if (line.empty())
            continue;

        if (!st.sawHeader)
        {
            if (line.rfind("graph", 0) != 0)
                return lineError(st.lineNo, "expected 'graph @name' header");
            if (auto r = parseHeader(line, st); !r)
                return r;
            continue;
        }

        if (line.rfind("entry", 0) == 0)
        {
            if (!st.entryLabel.empty())
                return lineError(st.lineNo, "duplicate 'entry' directive");
            st.entryLabel = trim(std::string_view(line).substr(5));
            st.entryLine = st.lineNo;
            continue;
        }
        if (line.rfind("graph", 0) == 0)
            return lineError(st.lineNo, "only one graph per file");

        if (auto r = declareNode(line, st); !r)
            return r;
    }

    if (!st.sawHeader)
        return Expected<void>{makeError({}, "missing 'graph @name' header")};

    for (const PendingNode &pn : st.pending)
    {
        if (auto r = resolveNode(pn, st); !r)
            return r;
    }
    return resolveEntry(st);
}

} // namespace kelp::io
