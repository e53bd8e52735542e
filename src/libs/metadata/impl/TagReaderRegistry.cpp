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


#include "metadata/TagReaderRegistry.hpp"

#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "metadata/Exception.hpp"

#include "taglib/FlacTagReader.hpp"
#include "taglib/Id3v2TagReader.hpp"

namespace tagsort::metadata
{
    namespace
    {
        std::filesystem::path normalizeExtension(const std::filesystem::path& extension)
        {
            return std::filesystem::path{ core::stringUtils::stringToLower(extension.native()) };
        }
    } // namespace

    void TagReaderRegistry::registerTagReader(const std::filesystem::path& extension, TagReaderFactory factory)
    {
        const std::string& str{ extension.native() };
        if (str.size() < 2 || str.front() != '.' || extension.has_parent_path())
            throw Exception{ "Invalid extension '" + str + "'" };

        auto [it, inserted]{ _factories.emplace(normalizeExtension(extension), std::move(factory)) };
        if (!inserted)
            throw Exception{ "A tag reader is already registered for extension '" + it->first.string() + "'" };

        TAGSORT_LOG(METADATA, DEBUG, "Registered tag reader for extension '" << it->first.string() << "'");
    }

    const TagReaderRegistry::TagReaderFactory* TagReaderRegistry::findTagReaderFactory(const std::filesystem::path& extension) const
    {
        const auto it{ _factories.find(normalizeExtension(extension)) };
        if (it == std::cend(_factories))
            return nullptr;

        return &it->second;
    }

    std::vector<std::filesystem::path> TagReaderRegistry::getExtensions() const
    {
        std::vector<std::filesystem::path> res;
        res.reserve(_factories.size());

        for (const auto& [extension, factory] : _factories)
            res.push_back(extension);

        return res;
    }

    TagReaderRegistry createDefaultTagReaderRegistry()
    {
        TagReaderRegistry registry;

        registry.registerTagReader(".mp3", [](const std::filesystem::path& file) { return std::make_unique<taglib::Id3v2TagReader>(file); });
        registry.registerTagReader(".flac", [](const std::filesystem::path& file) { return std::make_unique<taglib::FlacTagReader>(file); });

        return registry;
    }
} // namespace tagsort::metadata
