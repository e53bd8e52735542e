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
#include <unordered_map>

#include "metadata/ITagReader.hpp"

namespace tagsort::metadata::taglib
{
    // Frame based: first frame of TPE1, TALB and TIT2
    class Id3v2TagReader : public ITagReader
    {
    public:
        Id3v2TagReader(const std::filesystem::path& p);
        ~Id3v2TagReader() override = default;
        Id3v2TagReader(const Id3v2TagReader&) = delete;
        Id3v2TagReader& operator=(const Id3v2TagReader&) = delete;

    private:
        void visitTagValues(TagType tag, TagValueVisitor visitor) const override;

        std::unordered_map<TagType, std::string> _frameValues;
    };
} // namespace tagsort::metadata::taglib
