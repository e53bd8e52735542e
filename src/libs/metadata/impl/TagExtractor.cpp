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


#include "TagExtractor.hpp"

#include <optional>

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "metadata/Exception.hpp"

namespace tagsort::metadata
{
    namespace
    {
        std::optional<ExtractionFailure> readSingleValue(const ITagReader& tagReader, TagType tagType, std::string& value)
        {
            std::size_t valueCount{};
            tagReader.visitTagValues(tagType, [&](std::string_view tagValue) {
                if (valueCount++ == 0)
                    value = core::stringUtils::stringTrim(tagValue);
            });

            const std::string tagName{ getTagTypeName(tagType) };
            if (valueCount == 0)
                return ExtractionFailure{ ExtractionError::MissingTag, "missing " + tagName + " tag" };
            if (valueCount > 1)
                return ExtractionFailure{ ExtractionError::MissingTag, "ambiguous " + tagName + " tag (" + std::to_string(valueCount) + " values)" };
            if (value.empty())
                return ExtractionFailure{ ExtractionError::MissingTag, "empty " + tagName + " tag" };

            return std::nullopt;
        }
    } // namespace

    std::unique_ptr<ITagExtractor> createTagExtractor(TagReaderRegistry registry)
    {
        return std::make_unique<TagExtractor>(std::move(registry));
    }

    TagExtractor::TagExtractor(TagReaderRegistry registry)
        : _registry{ std::move(registry) }
        , _supportedExtensions{ _registry.getExtensions() }
    {
    }

    std::span<const std::filesystem::path> TagExtractor::getSupportedExtensions() const
    {
        return _supportedExtensions;
    }

    ExtractionResult TagExtractor::extract(const std::filesystem::path& file, const std::filesystem::path& extension) const
    {
        const TagReaderRegistry::TagReaderFactory* factory{ _registry.findTagReaderFactory(extension) };
        if (!factory)
            throw Exception{ "No tag reader registered for extension '" + extension.string() + "'" };

        std::unique_ptr<ITagReader> tagReader;
        try
        {
            tagReader = (*factory)(file);
        }
        catch (const AudioFileParsingException& e)
        {
            TAGSORT_LOG(METADATA, DEBUG, "Cannot read tags from '" << file.string() << "': " << e.what());
            return ExtractionFailure{ ExtractionError::UnreadableFile, e.what() };
        }

        ExtractionResult res{ extractTags(*tagReader) };
        if (const ExtractionFailure* failure{ std::get_if<ExtractionFailure>(&res) })
            TAGSORT_LOG(METADATA, DEBUG, "Skipping '" << file.string() << "': " << failure->message);

        return res;
    }

    ExtractionResult TagExtractor::extractTags(const ITagReader& tagReader) const
    {
        TagSet tags;

        if (auto failure{ readSingleValue(tagReader, TagType::Artist, tags.artist) })
            return *failure;
        if (auto failure{ readSingleValue(tagReader, TagType::Album, tags.album) })
            return *failure;
        if (auto failure{ readSingleValue(tagReader, TagType::TrackTitle, tags.title) })
            return *failure;

        return tags;
    }
} // namespace tagsort::metadata
