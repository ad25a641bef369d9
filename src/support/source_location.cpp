//===----------------------------------------------------------------------===//
//
// Part of the Moo project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity query for SourceLoc. Verb bodies are single buffers, so
// a location is meaningful as soon as it names a line.
//
//===----------------------------------------------------------------------===//

#include "support/source_location.hpp"

namespace moo::support
{
/// @brief Determine whether the location names a real source line.
/// @return True when the line component is non-zero.
bool SourceLoc::isValid() const
{
    return line != 0;
}
} // namespace moo::support
