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

#include <optional>
#include <string>
#include <string_view>

namespace tagsort::sorter
{
    enum class PathSanitizePolicy
    {
        ReservedCharacters, // replace < > : " / \ | ? * and NUL with '_'
        Friendly,           // lower case, spaces and '/' to '_', any character outside [a-z0-9._()[]-] to '.'
    };

    std::optional<PathSanitizePolicy> parsePathSanitizePolicy(std::string_view str);
    const char* getPathSanitizePolicyName(PathSanitizePolicy policy);

    // Returns a string usable as a single file or directory name
    // "." and ".." are mapped to "_" and "__"
    // Idempotent for both policies
    std::string sanitizePathComponent(std::string_view str, PathSanitizePolicy policy);
} // namespace tagsort::sorter
