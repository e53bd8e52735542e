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

#include <vector>

#include "metadata/ITagExtractor.hpp"

namespace tagsort::metadata
{
    class TagExtractor : public ITagExtractor
    {
    public:
        TagExtractor(TagReaderRegistry registry);
        ~TagExtractor() override = default;
        TagExtractor(const TagExtractor&) = delete;
        TagExtractor& operator=(const TagExtractor&) = delete;

    private:
        std::span<const std::filesystem::path> getSupportedExtensions() const override;
        ExtractionResult extract(const std::filesystem::path& file, const std::filesystem::path& extension) const override;

    protected:
        // A field must have exactly one non blank value
        ExtractionResult extractTags(const ITagReader& tagReader) const;

    private:
        const TagReaderRegistry _registry;
        const std::vector<std::filesystem::path> _supportedExtensions;
    };
} // namespace tagsort::metadata
