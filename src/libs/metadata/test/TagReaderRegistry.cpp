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

#include "metadata/Exception.hpp"
#include "metadata/TagReaderRegistry.hpp"

#include "TestTagReader.hpp"

namespace tagsort::metadata::tests
{
    namespace
    {
        std::unique_ptr<ITagReader> createTestTagReader(const std::filesystem::path&)
        {
            return std::make_unique<TestTagReader>(createDefaultTestTags());
        }
    } // namespace

    TEST(TagReaderRegistry, empty)
    {
        const TagReaderRegistry registry;

        EXPECT_TRUE(registry.getExtensions().empty());
        EXPECT_EQ(registry.findTagReaderFactory(".mp3"), nullptr);
    }

    TEST(TagReaderRegistry, caseInsensitive)
    {
        TagReaderRegistry registry;
        registry.registerTagReader(".OgA", createTestTagReader);

        EXPECT_NE(registry.findTagReaderFactory(".oga"), nullptr);
        EXPECT_NE(registry.findTagReaderFactory(".OGA"), nullptr);
        EXPECT_EQ(registry.findTagReaderFactory(".ogg"), nullptr);
        EXPECT_EQ(registry.findTagReaderFactory(""), nullptr);

        ASSERT_EQ(registry.getExtensions().size(), 1u);
        EXPECT_EQ(registry.getExtensions().front(), ".oga");
    }

    TEST(TagReaderRegistry, sortedExtensions)
    {
        TagReaderRegistry registry;
        registry.registerTagReader(".mp3", createTestTagReader);
        registry.registerTagReader(".flac", createTestTagReader);
        registry.registerTagReader(".ape", createTestTagReader);

        const std::vector<std::filesystem::path> expected{ ".ape", ".flac", ".mp3" };
        EXPECT_EQ(registry.getExtensions(), expected);
    }

    TEST(TagReaderRegistry, invalidExtension)
    {
        TagReaderRegistry registry;

        EXPECT_THROW(registry.registerTagReader("", createTestTagReader), Exception);
        EXPECT_THROW(registry.registerTagReader(".", createTestTagReader), Exception);
        EXPECT_THROW(registry.registerTagReader("mp3", createTestTagReader), Exception);
        EXPECT_THROW(registry.registerTagReader("foo/.mp3", createTestTagReader), Exception);
        EXPECT_TRUE(registry.getExtensions().empty());
    }

    TEST(TagReaderRegistry, duplicateExtension)
    {
        TagReaderRegistry registry;
        registry.registerTagReader(".mp3", createTestTagReader);

        EXPECT_THROW(registry.registerTagReader(".MP3", createTestTagReader), Exception);
    }

    TEST(TagReaderRegistry, defaultRegistry)
    {
        const TagReaderRegistry registry{ createDefaultTagReaderRegistry() };

        const std::vector<std::filesystem::path> expected{ ".flac", ".mp3" };
        EXPECT_EQ(registry.getExtensions(), expected);
    }
} // namespace tagsort::metadata::tests
