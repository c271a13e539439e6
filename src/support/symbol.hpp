//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/symbol.hpp
// Purpose: Defines Symbol handle type for interned strings.
// Key invariants: Value 0 denotes an invalid symbol.
// Ownership/Lifetime: Symbols are value types.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>

namespace kelp::support
{

struct Symbol
{
    uint32_t id = 0;

    [[nodiscard]] explicit operator bool() const noexcept;
};

bool operator==(Symbol a, Symbol b) noexcept;
bool operator!=(Symbol a, Symbol b) noexcept;
} // namespace kelp::support

namespace std
{
template <> struct hash<kelp::support::Symbol>
{
    size_t operator()(kelp::support::Symbol s) const noexcept;
};
} // namespace std
