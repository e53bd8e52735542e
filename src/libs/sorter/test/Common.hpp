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

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <stdlib.h>

#include <gtest/gtest.h>

#include "core/IConfig.hpp"
#include "metadata/Exception.hpp"
#include "metadata/ITagExtractor.hpp"

namespace tagsort::sorter::tests
{
    class ScopedTemporaryDirectory
    {
    public:
        ScopedTemporaryDirectory()
        {
            std::string pathTemplate{ (std::filesystem::temp_directory_path() / "tagsort-sorter-XXXXXX").string() };
            EXPECT_NE(::mkdtemp(pathTemplate.data()), nullptr);
            _path = pathTemplate;
        }
        ~ScopedTemporaryDirectory()
        {
            std::error_code ec;
            std::filesystem::remove_all(_path, ec);
        }
        ScopedTemporaryDirectory(const ScopedTemporaryDirectory&) = delete;
        ScopedTemporaryDirectory& operator=(const ScopedTemporaryDirectory&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

        std::filesystem::path createFile(const std::filesystem::path& relativePath, std::string_view content) const
        {
            const std::filesystem::path path{ _path / relativePath };
            std::filesystem::create_directories(path.parent_path());

            std::ofstream ofs{ path, std::ios::binary };
            ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
            EXPECT_TRUE(ofs.good());

            return path;
        }

    private:
        std::filesystem::path _path;
    };

    inline std::string readFile(const std::filesystem::path& path)
    {
        std::ifstream ifs{ path, std::ios::binary };
        std::ostringstream oss;
        oss << ifs.rdbuf();
        return oss.str();
    }

    // regular files under root, relative and sorted
    inline std::vector<std::string> listFiles(const std::filesystem::path& root)
    {
        std::vector<std::string> res;
        for (const std::filesystem::directory_entry& entry : std::filesystem::recursive_directory_iterator{ root })
        {
            if (entry.is_regular_file())
                res.push_back(entry.path().lexically_relative(root).string());
        }
        std::sort(std::begin(res), std::end(res));

        return res;
    }

    // Track file whose tags are its own "key=value" lines
    inline std::string createTrackContent(std::string_view artist, std::string_view album, std::string_view title, std::string_view payload = "")
    {
        std::string res;
        if (!artist.empty())
            res += "artist=" + std::string{ artist } + "\n";
        if (!album.empty())
            res += "album=" + std::string{ album } + "\n";
        if (!title.empty())
            res += "title=" + std::string{ title } + "\n";
        res += "payload=" + std::string{ payload } + "\n";

        return res;
    }

    // Reads tags written by createTrackContent, a file starting with "corrupt" cannot be parsed
    class ContentTagReader : public metadata::ITagReader
    {
    public:
        ContentTagReader(const std::filesystem::path& file)
        {
            std::ifstream ifs{ file };
            if (!ifs)
                throw metadata::AudioFileParsingException{ "Cannot open file" };

            std::string line;
            while (std::getline(ifs, line))
            {
                if (line.starts_with("corrupt"))
                    throw metadata::AudioFileParsingException{ "Parsing failed" };

                const auto separator{ line.find('=') };
                if (separator != std::string::npos)
                    _values.emplace(line.substr(0, separator), line.substr(separator + 1));
            }
        }

        void visitTagValues(metadata::TagType tag, TagValueVisitor visitor) const override
        {
            const auto [itBegin, itEnd]{ _values.equal_range(metadata::getTagTypeName(tag)) };
            for (auto it{ itBegin }; it != itEnd; ++it)
                visitor(it->second);
        }

    private:
        std::multimap<std::string, std::string> _values;
    };

    // ".mp3" and ".flac" files read with ContentTagReader, readerCount incremented on each read
    inline std::unique_ptr<metadata::ITagExtractor> createContentTagExtractor(std::size_t* readerCount = nullptr)
    {
        metadata::TagReaderRegistry registry;
        for (const std::filesystem::path extension : { ".mp3", ".flac" })
        {
            registry.registerTagReader(extension, [readerCount](const std::filesystem::path& file) {
                if (readerCount)
                    (*readerCount)++;
                return std::make_unique<ContentTagReader>(file);
            });
        }

        return metadata::createTagExtractor(std::move(registry));
    }

    class TestConfig : public core::IConfig
    {
    public:
        std::map<std::string, std::string, std::less<>> strings;
        std::map<std::string, std::vector<std::string>, std::less<>> stringLists;
        std::map<std::string, bool, std::less<>> bools;

    private:
        std::string_view getString(std::string_view setting, std::string_view def) override
        {
            const auto it{ strings.find(setting) };
            return it != std::cend(strings) ? std::string_view{ it->second } : def;
        }

        void visitStrings(std::string_view setting, std::function<void(std::string_view)> func, std::initializer_list<std::string_view> defs) override
        {
            const auto it{ stringLists.find(setting) };
            if (it == std::cend(stringLists))
            {
                for (std::string_view def : defs)
                    func(def);
                return;
            }

            for (const std::string& value : it->second)
                func(value);
        }

        std::filesystem::path getPath(std::string_view setting, const std::filesystem::path& def) override
        {
            const auto it{ strings.find(setting) };
            return it != std::cend(strings) ? std::filesystem::path{ it->second } : def;
        }

        bool getBool(std::string_view setting, bool def) override
        {
            const auto it{ bools.find(setting) };
            return it != std::cend(bools) ? it->second : def;
        }
    };
} // namespace tagsort::sorter::tests
