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


#include "Id3v2TagReader.hpp"

#include <taglib/id3v2frame.h>
#include <taglib/id3v2tag.h>
#include <taglib/mpegfile.h>

#include "core/ILogger.hpp"
#include "metadata/Exception.hpp"

namespace tagsort::metadata::taglib
{
    namespace
    {
        const std::unordered_map<TagType, const char*> frameIdMapping{
            { TagType::Artist, "TPE1" },
            { TagType::Album, "TALB" },
            { TagType::TrackTitle, "TIT2" },
        };
    } // namespace

    Id3v2TagReader::Id3v2TagReader(const std::filesystem::path& p)
    {
        TagLib::MPEG::File file{ p.c_str(), false /* readProperties */ };
        if (!file.isValid())
        {
            TAGSORT_LOG(METADATA, ERROR, "File '" << p.string() << "': parsing failed");
            throw AudioFileParsingException{ "Parsing failed" };
        }

        // TagLib accepts any content as MPEG, require at least one audio frame
        if (file.firstFrameOffset() < 0)
        {
            TAGSORT_LOG(METADATA, ERROR, "File '" << p.string() << "': no MPEG frame found");
            throw AudioFileParsingException{ "No MPEG frame found" };
        }

        if (!file.hasID3v2Tag())
        {
            TAGSORT_LOG(METADATA, DEBUG, "File '" << p.string() << "': no ID3v2 tag");
            return;
        }

        const TagLib::ID3v2::FrameListMap& frameListMap{ file.ID3v2Tag()->frameListMap() };
        for (const auto& [tagType, frameId] : frameIdMapping)
        {
            const auto itFrames{ frameListMap.find(TagLib::ByteVector{ frameId }) };
            if (itFrames == frameListMap.end() || itFrames->second.isEmpty())
                continue;

            _frameValues.emplace(tagType, itFrames->second.front()->toString().to8Bit(true));
        }
    }

    void Id3v2TagReader::visitTagValues(TagType tag, TagValueVisitor visitor) const
    {
        const auto it{ _frameValues.find(tag) };
        if (it != std::cend(_frameValues))
            visitor(it->second);
    }
} // namespace tagsort::metadata::taglib
