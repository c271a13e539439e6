//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Maps graph source files to stable identifiers for diagnostics.
// Key invariants: File id 0 is reserved; ids are dense and start at 1.
// Ownership/Lifetime: Owns normalized copies of registered paths.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kelp::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New file identifier (>0 on success, 0 on overflow).
    /// @details Registering the same normalized path twice returns the
    ///          identifier assigned the first time.
    uint32_t addFile(std::string path);

    /// @brief Retrieve path for @p file_id, or an empty view when unknown.
    std::string_view getPath(uint32_t file_id) const;

  private:
    /// Index corresponds to file identifier minus one; deque keeps references stable.
    std::deque<std::string> files_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace kelp::support
