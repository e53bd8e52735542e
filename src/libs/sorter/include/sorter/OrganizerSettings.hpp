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
#include <vector>

#include "sorter/PathSanitizer.hpp"

namespace tagsort::core
{
    class IConfig;
}

namespace tagsort::sorter
{
    struct OrganizerSettings
    {
        PathSanitizePolicy sanitizePolicy{ PathSanitizePolicy::ReservedCharacters };
        std::vector<std::filesystem::path> unsupportedExtensions; // lower case, with leading dot
        bool followDirectorySymlinks{};
    };

    // "path-sanitize-policy" setting, throws Exception on invalid value
    PathSanitizePolicy readPathSanitizePolicy(core::IConfig& config);

    // throws Exception on invalid values
    OrganizerSettings readOrganizerSettings(core::IConfig& config);
} // namespace tagsort::sorter
