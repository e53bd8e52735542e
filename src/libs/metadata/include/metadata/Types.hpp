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

#include <string>
#include <variant>

namespace tagsort::metadata
{
    struct TagSet
    {
        std::string artist;
        std::string album;
        std::string title;

        bool operator==(const TagSet& other) const = default;
    };

    enum class ExtractionError
    {
        MissingTag,     // absent, empty or ambiguous field
        UnreadableFile, // container could not be opened or parsed
    };

    struct ExtractionFailure
    {
        ExtractionError error;
        std::string message;
    };

    using ExtractionResult = std::variant<TagSet, ExtractionFailure>;
} // namespace tagsort::metadata
