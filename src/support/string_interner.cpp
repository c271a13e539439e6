//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the string interner that assigns stable Symbol handles to unique
// strings.  The interner owns the canonical copies of the strings and provides
// constant-time lookup from handles back to their original text.
//
//===----------------------------------------------------------------------===//

#include "support/string_interner.hpp"

#include <utility>

namespace kelp::support
{

Symbol StringInterner::intern(std::string_view str)
{
    std::string key(str);
    auto it = map_.find(key);
    if (it != map_.end())
        return it->second;
    storage_.push_back(key);
    Symbol sym{static_cast<uint32_t>(storage_.size())};
    map_.emplace(std::move(key), sym);
    return sym;
}

std::string_view StringInterner::lookup(Symbol sym) const
{
    if (sym.id == 0 || sym.id > storage_.size())
        return {};
    return storage_[sym.id - 1];
}
} // namespace kelp::support
