//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// This file declares the Serializer class, which converts graphs to the text
// format read by Parser.  Output is deterministic: nodes appear in allocation
// order and are labelled `%<index>`, so parsing the text back yields a graph
// with identical node ids.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace kelp::graph
{
class Graph;
}

namespace kelp::io
{

/// @brief Serializes graphs to their textual form.
class Serializer
{
  public:
    /// @brief Write graph @p g to output stream @p os.
    static void write(const graph::Graph &g, std::ostream &os);

    /// @brief Serialize graph @p g to a string.
    static std::string toString(const graph::Graph &g);
};

} // namespace kelp::io
