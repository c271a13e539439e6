//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Comparison and hashing for interned symbol handles.
//
//===----------------------------------------------------------------------===//

#include "support/symbol.hpp"

namespace kelp::support
{
bool operator==(Symbol a, Symbol b) noexcept
{
    return a.id == b.id;
}

bool operator!=(Symbol a, Symbol b) noexcept
{
    return a.id != b.id;
}

Symbol::operator bool() const noexcept
{
    return id != 0;
}
} // namespace kelp::support

namespace std
{
size_t hash<kelp::support::Symbol>::operator()(kelp::support::Symbol s) const noexcept
{
    return s.id;
}
} // namespace std
