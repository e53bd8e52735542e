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


#include "sorter/Organizer.hpp"

#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/String.hpp"
#include "metadata/ITagExtractor.hpp"
#include "sorter/Exception.hpp"
#include "sorter/PlacementResolver.hpp"

namespace tagsort::sorter
{
    namespace
    {
        std::filesystem::path toAbsolutePath(const std::filesystem::path& path)
        {
            std::error_code ec;
            std::filesystem::path res{ std::filesystem::absolute(path, ec) };
            if (ec)
                throw core::IOException{ "Cannot resolve absolute path", path, ec };

            return res.lexically_normal();
        }

        FailureReason toFailureReason(metadata::ExtractionError error)
        {
            switch (error)
            {
            case metadata::ExtractionError::MissingTag:
                return FailureReason::MissingTag;
            case metadata::ExtractionError::UnreadableFile:
                return FailureReason::Unreadable;
            }

            return FailureReason::Unreadable;
        }
    } // namespace

    Organizer::Organizer(const metadata::ITagExtractor& tagExtractor, OrganizerSettings settings)
        : _tagExtractor{ tagExtractor }
        , _settings{ std::move(settings) }
    {
    }

    RunReport Organizer::organize(const std::filesystem::path& srcRootArg, const std::filesystem::path& destRootArg) const
    {
        const std::filesystem::path srcRoot{ toAbsolutePath(srcRootArg) };
        const std::filesystem::path destRoot{ toAbsolutePath(destRootArg) };

        if (std::error_code ec; !std::filesystem::is_directory(srcRoot, ec))
            throw Exception{ "Source '" + srcRoot.string() + "' is not a directory" };

        if (!core::pathUtils::ensureDirectory(destRoot))
            throw Exception{ "Cannot create destination directory '" + destRoot.string() + "'" };

        TAGSORT_LOG(WALKER, INFO, "Sorting files from '" << srcRoot.string() << "' to '" << destRoot.string() << "' using '" << getPathSanitizePolicyName(_settings.sanitizePolicy) << "' path policy");

        RunReport report;

        core::pathUtils::ExploreOptions exploreOptions;
        exploreOptions.followDirectorySymlinks = _settings.followDirectorySymlinks;
        exploreOptions.excludeDirectory = &destRoot;

        core::pathUtils::exploreFilesRecursive(
            srcRoot, [&](std::error_code ec, const std::filesystem::path& file) {
                if (ec)
                {
                    TAGSORT_LOG(WALKER, ERROR, "Cannot explore '" << file.string() << "': " << ec.message());
                    return true; // continue anyway
                }

                const std::filesystem::path extension{ core::stringUtils::stringToLower(file.extension().native()) };
                switch (classifyFile(file))
                {
                case FileKind::Audio:
                    processAudioFile(file, extension, destRoot, report);
                    break;

                case FileKind::Unsupported:
                    TAGSORT_LOG(WALKER, DEBUG, "Unsupported format for '" << file.string() << "'");
                    report.unsupported.push_back(FailureRecord{ file, FailureReason::UnsupportedFormat, "unsupported format '" + extension.string() + "'" });
                    break;

                case FileKind::Ignored:
                    TAGSORT_LOG(WALKER, DEBUG, "Ignoring '" << file.string() << "'");
                    report.ignoredCount++;
                    break;
                }

                return true;
            },
            exploreOptions);

        TAGSORT_LOG(WALKER, INFO, "Sorting done: " << report.copiedCount << " copied, " << report.duplicateCount << " duplicate(s), " << report.failures.size() << " failure(s), " << report.unsupported.size() << " unsupported, " << report.ignoredCount << " ignored");

        return report;
    }

    Organizer::FileKind Organizer::classifyFile(const std::filesystem::path& file) const
    {
        if (core::pathUtils::hasFileAnyExtension(file, _tagExtractor.getSupportedExtensions()))
            return FileKind::Audio;

        if (core::pathUtils::hasFileAnyExtension(file, _settings.unsupportedExtensions))
            return FileKind::Unsupported;

        return FileKind::Ignored;
    }

    void Organizer::processAudioFile(const std::filesystem::path& file, const std::filesystem::path& extension, const std::filesystem::path& destRoot, RunReport& report) const
    {
        TAGSORT_LOG(WALKER, INFO, "Sorting '" << file.string() << "'");

        const metadata::ExtractionResult extractionResult{ _tagExtractor.extract(file, extension) };
        if (const auto* failure{ std::get_if<metadata::ExtractionFailure>(&extractionResult) })
        {
            report.failures.push_back(FailureRecord{ file, toFailureReason(failure->error), failure->message });
            return;
        }

        const SanitizedTriple triple{ sanitizeTags(std::get<metadata::TagSet>(extractionResult), _settings.sanitizePolicy) };
        try
        {
            const Placement placement{ placeFile(destRoot, triple, extension, file) };
            switch (placement.outcome)
            {
            case PlacementOutcome::New:
                report.copiedCount++;
                break;
            case PlacementOutcome::Duplicate:
                report.duplicateCount++;
                break;
            }
        }
        catch (const core::TagsortException& e)
        {
            TAGSORT_LOG(PLACEMENT, ERROR, "Cannot place '" << file.string() << "': " << e.what());
            report.failures.push_back(FailureRecord{ file, FailureReason::PlacementFailed, e.what() });
        }
    }
} // namespace tagsort::sorter
