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


#include <gtest/gtest.h>

#include "sorter/Exception.hpp"
#include "sorter/OrganizerSettings.hpp"

#include "Common.hpp"

namespace tagsort::sorter::tests
{
    TEST(OrganizerSettings, defaults)
    {
        TestConfig config;
        const OrganizerSettings settings{ readOrganizerSettings(config) };

        EXPECT_EQ(settings.sanitizePolicy, PathSanitizePolicy::ReservedCharacters);
        EXPECT_FALSE(settings.followDirectorySymlinks);

        const std::vector<std::filesystem::path> expectedExtensions{ ".wav", ".aiff", ".aif", ".ape", ".wv", ".ogg", ".opus", ".m4a", ".aac", ".wma", ".alac", ".dsf" };
        EXPECT_EQ(settings.unsupportedExtensions, expectedExtensions);
    }

    TEST(OrganizerSettings, values)
    {
        TestConfig config;
        config.strings["path-sanitize-policy"] = "friendly";
        config.stringLists["unsupported-extensions"] = { ".WAV", ".ogg" };
        config.bools["follow-directory-symlinks"] = true;

        const OrganizerSettings settings{ readOrganizerSettings(config) };

        EXPECT_EQ(settings.sanitizePolicy, PathSanitizePolicy::Friendly);
        EXPECT_TRUE(settings.followDirectorySymlinks);
        EXPECT_EQ(settings.unsupportedExtensions, (std::vector<std::filesystem::path>{ ".wav", ".ogg" }));
    }

    TEST(OrganizerSettings, emptyUnsupportedExtensions)
    {
        TestConfig config;
        config.stringLists["unsupported-extensions"] = {};

        EXPECT_TRUE(readOrganizerSettings(config).unsupportedExtensions.empty());
    }

    TEST(OrganizerSettings, invalidValues)
    {
        {
            TestConfig config;
            config.strings["path-sanitize-policy"] = "lowercase";
            EXPECT_THROW(readOrganizerSettings(config), Exception);
        }

        {
            TestConfig config;
            config.stringLists["unsupported-extensions"] = { "wav" };
            EXPECT_THROW(readOrganizerSettings(config), Exception);
        }
    }
} // namespace tagsort::sorter::tests
