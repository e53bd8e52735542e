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

#include <functional>
#include <string_view>

namespace tagsort::metadata
{
    enum class TagType
    {
        Album,
        Artist,
        TrackTitle,
    };

    const char* getTagTypeName(TagType tagType);

    class ITagReader
    {
    public:
        virtual ~ITagReader() = default;

        // Visits every value stored for the tag, in file order
        using TagValueVisitor = std::function<void(std::string_view value)>;
        virtual void visitTagValues(TagType tag, TagValueVisitor visitor) const = 0;
    };
} // namespace tagsort::metadata
