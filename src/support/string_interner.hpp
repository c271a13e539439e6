//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/string_interner.hpp
// Purpose: Declares string interning used for callee names in call targets.
// Key invariants: Symbol id 0 is invalid; equal strings share one symbol.
// Ownership/Lifetime: Interner owns stored strings.
// Links: docs/graph-format.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/symbol.hpp"
#include <deque>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kelp::support
{

class StringInterner
{
  public:
    /// Interns a string to produce a stable symbol for repeated use.
    ///
    /// Stores a copy of @p str if it has not been seen before and assigns it a
    /// new Symbol. Subsequent calls with the same string yield the existing
    /// Symbol without duplicating storage.
    Symbol intern(std::string_view str);

    /// Retrieves the original string associated with a Symbol; an invalid
    /// Symbol yields an empty view.
    std::string_view lookup(Symbol sym) const;

    size_t size() const
    {
        return storage_.size();
    }

  private:
    std::unordered_map<std::string, Symbol> map_;
    /// Index is symbol id minus one; deque keeps looked-up views stable.
    std::deque<std::string> storage_;
};
} // namespace kelp::support
