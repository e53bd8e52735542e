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


#include "FlacTagReader.hpp"

#include <taglib/flacfile.h>
#include <taglib/xiphcomment.h>

#include "core/ILogger.hpp"
#include "metadata/Exception.hpp"

namespace tagsort::metadata::taglib
{
    namespace
    {
        // field names are upper case in TagLib's field list map
        const std::unordered_map<TagType, const char*> fieldNameMapping{
            { TagType::Artist, "ARTIST" },
            { TagType::Album, "ALBUM" },
            { TagType::TrackTitle, "TITLE" },
        };
    } // namespace

    FlacTagReader::FlacTagReader(const std::filesystem::path& p)
    {
        TagLib::FLAC::File file{ p.c_str(), false /* readProperties */ };
        if (!file.isValid())
        {
            TAGSORT_LOG(METADATA, ERROR, "File '" << p.string() << "': parsing failed");
            throw AudioFileParsingException{ "Parsing failed" };
        }

        const TagLib::Ogg::XiphComment* xiphComment{ file.xiphComment() };
        if (!xiphComment)
        {
            TAGSORT_LOG(METADATA, DEBUG, "File '" << p.string() << "': no Vorbis comment block");
            return;
        }

        const TagLib::Ogg::FieldListMap& fieldListMap{ xiphComment->fieldListMap() };
        for (const auto& [tagType, fieldName] : fieldNameMapping)
        {
            const auto itField{ fieldListMap.find(TagLib::String{ fieldName }) };
            if (itField == fieldListMap.end())
                continue;

            std::vector<std::string>& values{ _fieldValues[tagType] };
            for (const TagLib::String& value : itField->second)
                values.push_back(value.to8Bit(true));
        }
    }

    void FlacTagReader::visitTagValues(TagType tag, TagValueVisitor visitor) const
    {
        const auto it{ _fieldValues.find(tag) };
        if (it == std::cend(_fieldValues))
            return;

        for (const std::string& value : it->second)
            visitor(value);
    }
} // namespace tagsort::metadata::taglib
