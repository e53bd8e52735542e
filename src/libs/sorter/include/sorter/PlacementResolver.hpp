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
#include <string>

#include "metadata/Types.hpp"
#include "sorter/PathSanitizer.hpp"

namespace tagsort::sorter
{
    struct SanitizedTriple
    {
        std::string artist;
        std::string album;
        std::string title;

        bool operator==(const SanitizedTriple& other) const = default;
    };

    SanitizedTriple sanitizeTags(const metadata::TagSet& tags, PathSanitizePolicy policy);

    enum class PlacementOutcome
    {
        New,       // path is a free slot
        Duplicate, // path holds a byte identical copy of the source file
    };

    struct Placement
    {
        PlacementOutcome outcome;
        std::filesystem::path path;
    };

    // Probes destRoot/artist/album/title[_N]extension in increasing N order
    // and stops at the first free slot or at the first byte identical file.
    // Linear in the number of distinct files already sharing the title.
    // Creates the artist and album directories if needed
    // throws PlacementException or core::IOException on failure
    Placement resolvePlacement(const std::filesystem::path& destRoot, const SanitizedTriple& triple, const std::filesystem::path& extension, const std::filesystem::path& sourceFile);

    // Same as resolvePlacement, then copies sourceFile when the outcome is New
    Placement placeFile(const std::filesystem::path& destRoot, const SanitizedTriple& triple, const std::filesystem::path& extension, const std::filesystem::path& sourceFile);
} // namespace tagsort::sorter
