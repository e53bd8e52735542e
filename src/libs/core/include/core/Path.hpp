/*
 * Copyright (C) 2026 The tagsort authors
 *
 * This file is part of tagsort.
 *
 * tagsort is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tagsort is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tagsort.  If not, see <http://www.gnu.org/licenses/>.
 */

#pragma once

#include <filesystem>
#include <functional>
#include <span>
#include <system_error>

namespace tagsort::core::pathUtils
{
    // Make sure the given path is a directory
    // Create it if needed, an already existing directory is not an error
    bool ensureDirectory(const std::filesystem::path& dir);

    struct ExploreOptions
    {
        bool followDirectorySymlinks{};
        const std::filesystem::path* excludeDirectory{}; // this directory and its content are skipped
    };

    // Entries of each directory are visited in path order
    // Callback gets an error code set if the entry could not be read
    // returns false if aborted by user
    using ExploreFileCallback = std::function<bool(std::error_code, const std::filesystem::path&)>;
    bool exploreFilesRecursive(const std::filesystem::path& directory, ExploreFileCallback cb, const ExploreOptions& options = {});

    // Check if file's extension is one of provided extensions
    // extensions are expected lower case, with a leading dot
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> extensions);

    // Byte for byte comparison, throws IOException if one of the files cannot be read
    bool areFilesIdentical(const std::filesystem::path& file1, const std::filesystem::path& file2);

    // Never overwrites: fails if dst already exists
    // Permissions and last write time are carried to dst
    // throws IOException on failure
    void copyFilePreservingMetadata(const std::filesystem::path& src, const std::filesystem::path& dst);

    std::filesystem::path getExecutablePath(const char* argv0);
} // namespace tagsort::core::pathUtils
