//===----------------------------------------------------------------------===//
//
// Part of the Kelp project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line helpers for the SourceLoc value type.  A location is valid once
// it names a registered file identifier; line and column are optional.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace kelp::support
{
bool SourceLoc::isValid() const
{
    return file_id != 0;
}
} // namespace kelp::support
