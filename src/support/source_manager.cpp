//===----------------------------------------------------------------------===//
//
// Part of the Javelin project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the SourceManager registry. Paths are normalised so diagnostics
// print the same spelling regardless of how a file was named on the command
// line, and identifiers start at one so that zero can mean "no file".
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Backing store for file identifiers and loaded file contents.

#include "support/source_manager.hpp"

#include "support/diag_expected.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>

namespace javelin::support
{
namespace
{
std::string normalizePath(std::string path)
{
    std::filesystem::path p(std::move(path));
    return p.lexically_normal().generic_string();
}
} // namespace

/// @brief Register a file path and assign it a stable identifier.
/// @details Registering the same normalised path twice yields the same id.
///          When the 32-bit id space is exhausted an error is printed to
///          stderr and 0 is returned.
uint32_t SourceManager::addFile(std::string path)
{
    std::string normalized = normalizePath(std::move(path));

    if (auto it = path_to_id_.find(normalized); it != path_to_id_.end())
        return it->second;

    if (next_file_id_ > std::numeric_limits<uint32_t>::max())
    {
        auto diag = makeError({}, std::string(kSourceManagerFileIdOverflowMessage));
        printDiag(diag, std::cerr);
        return 0;
    }

    const uint32_t file_id = static_cast<uint32_t>(next_file_id_++);
    files_.push_back(std::move(normalized));
    path_to_id_.emplace(files_.back(), file_id);
    return file_id;
}

/// @brief Load a file from disk and register it.
/// @details The whole file is read in binary mode; decoding is left to the
///          lexer. Unreadable files yield std::nullopt without registering.
std::optional<uint32_t> SourceManager::loadFile(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return std::nullopt;

    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    const uint32_t id = addFile(path);
    if (id == 0)
        return std::nullopt;
    texts_[id] = std::move(text);
    return id;
}

/// @brief Retrieve the canonical path associated with a file identifier.
/// @return Stored path, or an empty view if @p file_id is invalid.
std::string_view SourceManager::getPath(uint32_t file_id) const
{
    if (file_id == 0 || file_id > files_.size())
        return {};
    return files_[file_id - 1];
}

/// @brief Retrieve the text loaded for @p file_id.
/// @return View into the stored contents, or an empty view.
std::string_view SourceManager::getText(uint32_t file_id) const
{
    auto it = texts_.find(file_id);
    if (it == texts_.end())
        return {};
    return it->second;
}
} // namespace javelin::support
