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
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace tagsort::core
{
    class TagsortException : public std::runtime_error
    {
    public:
        TagsortException(std::string_view message = "")
            : std::runtime_error{ std::string{ message } }
        {
        }
    };

    class IOException : public TagsortException
    {
    public:
        IOException(std::string_view message, const std::filesystem::path& path, std::error_code err)
            : TagsortException{ std::string{ message } + " '" + path.string() + "': " + err.message() }
            , _path{ path }
            , _err{ err }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }
        std::error_code getErrorCode() const { return _err; }

    private:
        std::filesystem::path _path;
        std::error_code _err;
    };
} // namespace tagsort::core
