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

#include "core/Path.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <vector>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

namespace tagsort::core::pathUtils
{
    namespace
    {
        constexpr std::size_t compareBufferSize{ 64 * 1024 };

        std::error_code getLastErrorCode()
        {
            return std::error_code{ errno, std::generic_category() };
        }

        bool isExcludedDirectory(const std::filesystem::path& path, const ExploreOptions& options)
        {
            if (!options.excludeDirectory || options.excludeDirectory->empty())
                return false;

            std::error_code ec;
            return std::filesystem::equivalent(path, *options.excludeDirectory, ec) && !ec;
        }
    } // namespace

    bool ensureDirectory(const std::filesystem::path& dir)
    {
        std::error_code ec;
        std::filesystem::create_directory(dir, ec);
        if (ec && ec != std::errc::file_exists)
            return false;

        // someone else may have created it in the meantime
        return std::filesystem::is_directory(dir, ec);
    }

    bool exploreFilesRecursive(const std::filesystem::path& directory, ExploreFileCallback cb, const ExploreOptions& options)
    {
        std::error_code ec;
        std::filesystem::directory_iterator itPath{ directory, ec };
        if (ec)
        {
            cb(ec, directory);
            return true; // try to continue exploring anyway
        }

        std::vector<std::filesystem::directory_entry> entries;
        const std::filesystem::directory_iterator itEnd;
        while (itPath != itEnd)
        {
            entries.push_back(*itPath);

            itPath.increment(ec);
            if (ec)
            {
                if (!cb(ec, directory))
                    return false;
                break;
            }
        }

        std::sort(std::begin(entries), std::end(entries), [](const std::filesystem::directory_entry& entryA, const std::filesystem::directory_entry& entryB) { return entryA.path() < entryB.path(); });

        for (const std::filesystem::directory_entry& entry : entries)
        {
            bool continueExploring{ true };
            const std::filesystem::path& path{ entry.path() };

            const bool isDirectory{ entry.is_directory(ec) };
            if (ec)
            {
                continueExploring = cb(ec, path);
            }
            else if (isDirectory)
            {
                if (isExcludedDirectory(path, options))
                {
                    TAGSORT_LOG(WALKER, DEBUG, "Skipping excluded directory '" << path.string() << "'");
                }
                else if (!options.followDirectorySymlinks && entry.is_symlink(ec))
                {
                    TAGSORT_LOG(WALKER, DEBUG, "Skipping directory symlink '" << path.string() << "'");
                }
                else
                {
                    continueExploring = exploreFilesRecursive(path, cb, options);
                }
            }
            else if (entry.is_regular_file(ec) && !ec)
            {
                continueExploring = cb(ec, path);
            }

            if (!continueExploring)
                return false;
        }

        return true;
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::filesystem::path> extensions)
    {
        if (!file.has_extension())
            return false;

        const std::filesystem::path extension{ stringUtils::stringToLower(file.extension().native()) };
        return std::any_of(std::cbegin(extensions), std::cend(extensions), [&](const std::filesystem::path& candidate) { return candidate == extension; });
    }

    bool areFilesIdentical(const std::filesystem::path& file1, const std::filesystem::path& file2)
    {
        std::error_code ec;
        const std::uintmax_t fileSize1{ std::filesystem::file_size(file1, ec) };
        if (ec)
            throw IOException{ "Cannot get size of file", file1, ec };

        const std::uintmax_t fileSize2{ std::filesystem::file_size(file2, ec) };
        if (ec)
            throw IOException{ "Cannot get size of file", file2, ec };

        if (fileSize1 != fileSize2)
            return false;

        std::ifstream ifs1{ file1, std::ios_base::binary };
        if (!ifs1)
            throw IOException{ "Cannot open file", file1, getLastErrorCode() };

        std::ifstream ifs2{ file2, std::ios_base::binary };
        if (!ifs2)
            throw IOException{ "Cannot open file", file2, getLastErrorCode() };

        std::vector<char> buffer1(compareBufferSize);
        std::vector<char> buffer2(compareBufferSize);
        do
        {
            ifs1.read(buffer1.data(), static_cast<std::streamsize>(buffer1.size()));
            if (ifs1.bad())
                throw IOException{ "Cannot read file", file1, getLastErrorCode() };

            ifs2.read(buffer2.data(), static_cast<std::streamsize>(buffer2.size()));
            if (ifs2.bad())
                throw IOException{ "Cannot read file", file2, getLastErrorCode() };

            if (ifs1.gcount() != ifs2.gcount())
                return false;

            if (!std::equal(buffer1.data(), buffer1.data() + ifs1.gcount(), buffer2.data()))
                return false;
        } while (ifs1 && ifs2);

        return true;
    }

    void copyFilePreservingMetadata(const std::filesystem::path& src, const std::filesystem::path& dst)
    {
        std::error_code ec;
        std::filesystem::copy_file(src, dst, std::filesystem::copy_options::none, ec);
        if (ec)
            throw IOException{ "Cannot copy file to", dst, ec };

        const std::filesystem::file_status srcStatus{ std::filesystem::status(src, ec) };
        if (ec)
            throw IOException{ "Cannot get status of file", src, ec };

        std::filesystem::permissions(dst, srcStatus.permissions(), std::filesystem::perm_options::replace, ec);
        if (ec)
            throw IOException{ "Cannot set permissions on file", dst, ec };

        const std::filesystem::file_time_type lastWriteTime{ std::filesystem::last_write_time(src, ec) };
        if (ec)
            throw IOException{ "Cannot get last write time of file", src, ec };

        std::filesystem::last_write_time(dst, lastWriteTime, ec);
        if (ec)
            throw IOException{ "Cannot set last write time on file", dst, ec };
    }

    std::filesystem::path getExecutablePath(const char* argv0)
    {
        std::error_code ec;
        std::filesystem::path res{ std::filesystem::read_symlink("/proc/self/exe", ec) };
        if (!ec)
            return res;

        TAGSORT_LOG(MAIN, DEBUG, "Cannot read executable path from /proc: " << ec.message());

        res = std::filesystem::absolute(argv0, ec);
        if (ec)
            throw IOException{ "Cannot resolve executable path", argv0, ec };

        return res;
    }
} // namespace tagsort::core::pathUtils
