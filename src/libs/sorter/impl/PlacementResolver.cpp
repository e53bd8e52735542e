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


#include "sorter/PlacementResolver.hpp"

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "sorter/Exception.hpp"

namespace tagsort::sorter
{
    namespace
    {
        void checkComponent(std::string_view component, std::string_view name)
        {
            if (component.empty() || component == "." || component == ".." || component.find_first_of(std::string_view{ "/\0", 2 }) != std::string_view::npos)
                throw PlacementException{ "Invalid " + std::string{ name } + " path component '" + std::string{ component } + "'" };
        }

        void createDirectory(const std::filesystem::path& dir)
        {
            if (!core::pathUtils::ensureDirectory(dir))
                throw PlacementException{ "Cannot create directory '" + dir.string() + "'" };
        }

        std::filesystem::path getCandidatePath(const std::filesystem::path& albumDir, const std::string& title, const std::filesystem::path& extension, std::size_t n)
        {
            std::string fileName{ title };
            if (n > 0)
                fileName += "_" + std::to_string(n);
            fileName += extension.string();

            return albumDir / fileName;
        }
    } // namespace

    SanitizedTriple sanitizeTags(const metadata::TagSet& tags, PathSanitizePolicy policy)
    {
        return SanitizedTriple{
            .artist = sanitizePathComponent(tags.artist, policy),
            .album = sanitizePathComponent(tags.album, policy),
            .title = sanitizePathComponent(tags.title, policy),
        };
    }

    Placement resolvePlacement(const std::filesystem::path& destRoot, const SanitizedTriple& triple, const std::filesystem::path& extension, const std::filesystem::path& sourceFile)
    {
        checkComponent(triple.artist, "artist");
        checkComponent(triple.album, "album");
        checkComponent(triple.title, "title");

        const std::filesystem::path artistDir{ destRoot / triple.artist };
        const std::filesystem::path albumDir{ artistDir / triple.album };
        createDirectory(artistDir);
        createDirectory(albumDir);

        for (std::size_t n{};; ++n)
        {
            const std::filesystem::path candidate{ getCandidatePath(albumDir, triple.title, extension, n) };

            std::error_code ec;
            const bool exists{ std::filesystem::exists(candidate, ec) };
            if (ec)
                throw core::IOException{ "Cannot check existence of file", candidate, ec };

            if (!exists)
                return Placement{ PlacementOutcome::New, candidate };

            if (core::pathUtils::areFilesIdentical(sourceFile, candidate))
                return Placement{ PlacementOutcome::Duplicate, candidate };

            TAGSORT_LOG(PLACEMENT, DEBUG, "'" << candidate.string() << "' already exists with a different content");
        }
    }

    Placement placeFile(const std::filesystem::path& destRoot, const SanitizedTriple& triple, const std::filesystem::path& extension, const std::filesystem::path& sourceFile)
    {
        const Placement placement{ resolvePlacement(destRoot, triple, extension, sourceFile) };

        switch (placement.outcome)
        {
        case PlacementOutcome::New:
            core::pathUtils::copyFilePreservingMetadata(sourceFile, placement.path);
            TAGSORT_LOG(PLACEMENT, DEBUG, "Copied '" << sourceFile.string() << "' to '" << placement.path.string() << "'");
            break;

        case PlacementOutcome::Duplicate:
            TAGSORT_LOG(PLACEMENT, DEBUG, "'" << sourceFile.string() << "' is a duplicate of '" << placement.path.string() << "'");
            break;
        }

        return placement;
    }
} // namespace tagsort::sorter
