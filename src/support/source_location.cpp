//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Out-of-line validity predicate for SourceLoc. Source text handed to the
// front end directly (without a SourceManager) has file id 0, so validity is
// decided by the line component rather than the file id.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements the validity query for `SourceLoc`.

#include "support/source_location.hpp"

namespace javelin::support
{
/// @brief Determine whether the location refers to a real position.
/// @return True when a 1-based line number is attached.
bool SourceLoc::isValid() const
{
    return line != 0;
}

} // namespace javelin::support
