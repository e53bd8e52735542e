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

#include "sorter/OrganizerSettings.hpp"
#include "sorter/RunReport.hpp"

namespace tagsort::metadata
{
    class ITagExtractor;
}

namespace tagsort::sorter
{
    // Copies the audio files of a source tree into a destination tree organized as artist/album/title
    class Organizer
    {
    public:
        Organizer(const metadata::ITagExtractor& tagExtractor, OrganizerSettings settings);
        ~Organizer() = default;
        Organizer(const Organizer&) = delete;
        Organizer& operator=(const Organizer&) = delete;

        // Per file failures are collected in the report, never thrown
        // throws Exception if srcRoot is not a directory or if destRoot cannot be created
        RunReport organize(const std::filesystem::path& srcRoot, const std::filesystem::path& destRoot) const;

    private:
        enum class FileKind
        {
            Audio,
            Unsupported,
            Ignored,
        };
        FileKind classifyFile(const std::filesystem::path& file) const;

        void processAudioFile(const std::filesystem::path& file, const std::filesystem::path& extension, const std::filesystem::path& destRoot, RunReport& report) const;

        const metadata::ITagExtractor& _tagExtractor;
        const OrganizerSettings _settings;
    };
} // namespace tagsort::sorter
