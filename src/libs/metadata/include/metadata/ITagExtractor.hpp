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
#include <memory>
#include <span>

#include "metadata/TagReaderRegistry.hpp"
#include "metadata/Types.hpp"

namespace tagsort::metadata
{
    class ITagExtractor
    {
    public:
        virtual ~ITagExtractor() = default;

        virtual std::span<const std::filesystem::path> getSupportedExtensions() const = 0;

        // Never throws on a corrupt or unreadable file, reported as UnreadableFile instead
        // extension must be one of the supported extensions, Exception thrown otherwise
        virtual ExtractionResult extract(const std::filesystem::path& file, const std::filesystem::path& extension) const = 0;
    };

    std::unique_ptr<ITagExtractor> createTagExtractor(TagReaderRegistry registry);
} // namespace tagsort::metadata
