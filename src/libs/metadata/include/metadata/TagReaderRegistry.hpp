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
#include <map>
#include <memory>
#include <vector>

#include "metadata/ITagReader.hpp"

namespace tagsort::metadata
{
    // Maps a file extension to the tag reader able to handle it
    class TagReaderRegistry
    {
    public:
        // Factories throw AudioFileParsingException if the file cannot be opened or parsed
        using TagReaderFactory = std::function<std::unique_ptr<ITagReader>(const std::filesystem::path& file)>;

        // extension must start with a dot, case insensitive
        // throws Exception if the extension is invalid or already registered
        void registerTagReader(const std::filesystem::path& extension, TagReaderFactory factory);

        // nullptr if not found
        const TagReaderFactory* findTagReaderFactory(const std::filesystem::path& extension) const;

        // lower case, sorted
        std::vector<std::filesystem::path> getExtensions() const;

    private:
        std::map<std::filesystem::path, TagReaderFactory> _factories;
    };

    // .mp3 (ID3v2 frames) and .flac (Vorbis comments), read using TagLib
    TagReaderRegistry createDefaultTagReaderRegistry();
} // namespace tagsort::metadata
