//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_manager.hpp
// Purpose: Declares the registry mapping file identifiers to paths and to the
//          loaded source text of each file.
// Key invariants: File ID 0 is invalid.
// Ownership/Lifetime: Manager owns file path strings and file contents.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace javelin::support
{

inline constexpr std::string_view kSourceManagerFileIdOverflowMessage =
    "source manager exhausted file identifier space";

/// Maintains the mapping between numeric file identifiers, their normalised
/// paths and, when loaded through @ref loadFile, their contents.
class SourceManager
{
  public:
    /// @brief Register file path @p path and return its id.
    /// @return New or existing identifier (>0), or 0 when the id space is exhausted.
    uint32_t addFile(std::string path);

    /// @brief Read the file at @p path into memory and register it.
    /// @return Identifier of the file, or std::nullopt when it cannot be read.
    std::optional<uint32_t> loadFile(const std::string &path);

    /// @brief Retrieve path for @p file_id; empty when unknown.
    [[nodiscard]] std::string_view getPath(uint32_t file_id) const;

    /// @brief Retrieve the loaded text of @p file_id; empty when not loaded.
    [[nodiscard]] std::string_view getText(uint32_t file_id) const;

  private:
    /// Stored file paths. Index i holds the path of file id i + 1.
    std::deque<std::string> files_;

    /// Contents of files registered through loadFile, keyed by id.
    std::unordered_map<uint32_t, std::string> texts_;

    /// Next identifier to assign; stored as 64-bit to detect overflow safely.
    uint64_t next_file_id_ = 1;

    /// Fast lookup from normalized path to previously assigned identifier.
    std::unordered_map<std::string, uint32_t> path_to_id_;
};
} // namespace javelin::support
