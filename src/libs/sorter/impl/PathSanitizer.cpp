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


#include "sorter/PathSanitizer.hpp"

#include <algorithm>

namespace tagsort::sorter
{
    namespace
    {
        // NUL would truncate the path given to the system
        constexpr std::string_view reservedCharacters{ "<>:\"/\\|?*\0", 10 };

        constexpr bool isFriendlyCharacter(char c)
        {
            return (c >= 'a' && c <= 'z')
                || (c >= '0' && c <= '9')
                || c == '.' || c == '_' || c == '(' || c == ')' || c == '[' || c == ']' || c == '-';
        }

        char sanitizeReservedCharacter(char c)
        {
            return reservedCharacters.find(c) != std::string_view::npos ? '_' : c;
        }

        char sanitizeFriendlyCharacter(char c)
        {
            if (c >= 'A' && c <= 'Z')
                return static_cast<char>(c - 'A' + 'a');
            if (c == ' ' || c == '/')
                return '_';
            if (!isFriendlyCharacter(c))
                return '.';

            return c;
        }

        // Number of bytes of the UTF-8 sequence starting str
        // 1 for ASCII and for invalid sequences
        std::size_t getUTF8SequenceLength(std::string_view str)
        {
            const unsigned char lead{ static_cast<unsigned char>(str.front()) };

            std::size_t length{ 1 };
            if ((lead & 0xE0) == 0xC0)
                length = 2;
            else if ((lead & 0xF0) == 0xE0)
                length = 3;
            else if ((lead & 0xF8) == 0xF0)
                length = 4;

            if (length > str.size())
                return 1;

            for (std::size_t i{ 1 }; i < length; ++i)
            {
                if ((static_cast<unsigned char>(str[i]) & 0xC0) != 0x80)
                    return 1;
            }

            return length;
        }

        // non ASCII characters are replaced by a single '.'
        std::string sanitizeFriendly(std::string_view str)
        {
            std::string res;
            res.reserve(str.size());

            while (!str.empty())
            {
                const std::size_t length{ getUTF8SequenceLength(str) };
                res.push_back(length == 1 ? sanitizeFriendlyCharacter(str.front()) : '.');
                str.remove_prefix(length);
            }

            return res;
        }
    } // namespace

    std::optional<PathSanitizePolicy> parsePathSanitizePolicy(std::string_view str)
    {
        for (const PathSanitizePolicy policy : { PathSanitizePolicy::ReservedCharacters, PathSanitizePolicy::Friendly })
        {
            if (str == getPathSanitizePolicyName(policy))
                return policy;
        }

        return std::nullopt;
    }

    const char* getPathSanitizePolicyName(PathSanitizePolicy policy)
    {
        switch (policy)
        {
        case PathSanitizePolicy::ReservedCharacters:
            return "reserved-characters";
        case PathSanitizePolicy::Friendly:
            return "friendly";
        }

        return "unknown";
    }

    std::string sanitizePathComponent(std::string_view str, PathSanitizePolicy policy)
    {
        std::string res;

        switch (policy)
        {
        case PathSanitizePolicy::ReservedCharacters:
            res = str;
            std::transform(std::cbegin(res), std::cend(res), std::begin(res), sanitizeReservedCharacter);
            break;
        case PathSanitizePolicy::Friendly:
            res = sanitizeFriendly(str);
            break;
        }

        // must not address the current or the parent directory
        if (res == ".")
            res = "_";
        else if (res == "..")
            res = "__";

        return res;
    }
} // namespace tagsort::sorter
