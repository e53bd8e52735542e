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


#include <cstdint>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

#include <stdlib.h>

#include <gtest/gtest.h>

#include "metadata/Exception.hpp"
#include "metadata/ITagExtractor.hpp"

#include "taglib/FlacTagReader.hpp"
#include "taglib/Id3v2TagReader.hpp"

namespace tagsort::metadata::tests
{
    namespace
    {
        void appendBigEndian32(std::string& data, std::uint32_t value)
        {
            data += static_cast<char>((value >> 24) & 0xFF);
            data += static_cast<char>((value >> 16) & 0xFF);
            data += static_cast<char>((value >> 8) & 0xFF);
            data += static_cast<char>(value & 0xFF);
        }

        void appendLittleEndian32(std::string& data, std::uint32_t value)
        {
            data += static_cast<char>(value & 0xFF);
            data += static_cast<char>((value >> 8) & 0xFF);
            data += static_cast<char>((value >> 16) & 0xFF);
            data += static_cast<char>((value >> 24) & 0xFF);
        }

        // ID3v2.3 tag with Latin-1 text frames, followed by two silent MPEG-1 layer III frames
        std::string createMp3Content(const std::vector<std::pair<std::string, std::string>>& textFrames)
        {
            std::string frames;
            for (const auto& [frameId, text] : textFrames)
            {
                frames += frameId;
                appendBigEndian32(frames, static_cast<std::uint32_t>(text.size() + 1));
                frames += std::string(2, '\0'); // flags
                frames += '\0';                 // Latin-1 encoding
                frames += text;
            }

            std::string data{ "ID3" };
            data += '\x03'; // version
            data += '\0';   // revision
            data += '\0';   // flags
            // synchsafe size
            const auto size{ static_cast<std::uint32_t>(frames.size()) };
            data += static_cast<char>((size >> 21) & 0x7F);
            data += static_cast<char>((size >> 14) & 0x7F);
            data += static_cast<char>((size >> 7) & 0x7F);
            data += static_cast<char>(size & 0x7F);
            data += frames;

            for (int i{}; i < 2; ++i)
            {
                std::string mpegFrame(417, '\0'); // 128 kbps, 44.1 kHz
                mpegFrame[0] = '\xFF';
                mpegFrame[1] = '\xFB';
                mpegFrame[2] = '\x90';
                mpegFrame[3] = '\x00';
                data += mpegFrame;
            }

            return data;
        }

        // STREAMINFO block followed by a VORBIS_COMMENT block
        std::string createFlacContent(const std::vector<std::string>& comments)
        {
            std::string data{ "fLaC" };

            data += '\x00'; // STREAMINFO, not last
            data += std::string{ "\x00\x00\x22", 3 };
            std::string streamInfo(34, '\0');
            streamInfo[0] = '\x10'; // min block size 4096
            streamInfo[2] = '\x10'; // max block size 4096
            streamInfo[10] = '\x0A'; // 44100 Hz, 2 channels, 16 bits
            streamInfo[11] = '\xC4';
            streamInfo[12] = '\x42';
            streamInfo[13] = '\xF0';
            data += streamInfo;

            std::string vorbisComment;
            const std::string vendor{ "tagsort" };
            appendLittleEndian32(vorbisComment, static_cast<std::uint32_t>(vendor.size()));
            vorbisComment += vendor;
            appendLittleEndian32(vorbisComment, static_cast<std::uint32_t>(comments.size()));
            for (const std::string& comment : comments)
            {
                appendLittleEndian32(vorbisComment, static_cast<std::uint32_t>(comment.size()));
                vorbisComment += comment;
            }

            data += '\x84'; // VORBIS_COMMENT, last
            const auto size{ static_cast<std::uint32_t>(vorbisComment.size()) };
            data += static_cast<char>((size >> 16) & 0xFF);
            data += static_cast<char>((size >> 8) & 0xFF);
            data += static_cast<char>(size & 0xFF);
            data += vorbisComment;

            return data;
        }

        class TagLibReaderTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                std::string pathTemplate{ (std::filesystem::temp_directory_path() / "tagsort-metadata-XXXXXX").string() };
                ASSERT_NE(::mkdtemp(pathTemplate.data()), nullptr);
                _tmpDir = pathTemplate;
            }

            void TearDown() override
            {
                std::error_code ec;
                std::filesystem::remove_all(_tmpDir, ec);
            }

            std::filesystem::path createFile(const std::filesystem::path& fileName, std::string_view content)
            {
                const std::filesystem::path path{ _tmpDir / fileName };

                std::ofstream ofs{ path, std::ios::binary };
                ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
                EXPECT_TRUE(ofs.good());

                return path;
            }

            ExtractionResult extract(const std::filesystem::path& file)
            {
                return _extractor->extract(file, file.extension());
            }

            std::filesystem::path _tmpDir;
            const std::unique_ptr<ITagExtractor> _extractor{ createTagExtractor(createDefaultTagReaderRegistry()) };
        };

        std::vector<std::string> collectValues(const ITagReader& tagReader, TagType tagType)
        {
            std::vector<std::string> values;
            tagReader.visitTagValues(tagType, [&](std::string_view value) { values.emplace_back(value); });
            return values;
        }
    } // namespace

    TEST_F(TagLibReaderTest, missingFile)
    {
        EXPECT_THROW(taglib::Id3v2TagReader{ _tmpDir / "missing.mp3" }, AudioFileParsingException);
        EXPECT_THROW(taglib::FlacTagReader{ _tmpDir / "missing.flac" }, AudioFileParsingException);

        for (const std::filesystem::path file : { _tmpDir / "missing.mp3", _tmpDir / "missing.flac" })
        {
            const ExtractionResult res{ extract(file) };
            ASSERT_TRUE(std::holds_alternative<ExtractionFailure>(res));
            EXPECT_EQ(std::get<ExtractionFailure>(res).error, ExtractionError::UnreadableFile);
        }
    }

    TEST_F(TagLibReaderTest, corruptFlac)
    {
        const std::filesystem::path file{ createFile("corrupt.flac", "this is not a flac file") };

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<ExtractionFailure>(res));
        EXPECT_EQ(std::get<ExtractionFailure>(res).error, ExtractionError::UnreadableFile);
    }

    TEST_F(TagLibReaderTest, corruptMp3)
    {
        const std::filesystem::path file{ createFile("corrupt.mp3", "this is not an mp3 file") };

        EXPECT_THROW(taglib::Id3v2TagReader{ file }, AudioFileParsingException);

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<ExtractionFailure>(res));
        EXPECT_EQ(std::get<ExtractionFailure>(res).error, ExtractionError::UnreadableFile);
    }

    TEST_F(TagLibReaderTest, mp3WithoutId3v2Tag)
    {
        const std::string content{ createMp3Content({}) };
        // strip the empty ID3v2 header, keep the MPEG frames only
        const std::filesystem::path file{ createFile("untagged.mp3", std::string_view{ content }.substr(10)) };

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<ExtractionFailure>(res));
        EXPECT_EQ(std::get<ExtractionFailure>(res).error, ExtractionError::MissingTag);
        EXPECT_EQ(std::get<ExtractionFailure>(res).message, "missing artist tag");
    }

    TEST_F(TagLibReaderTest, id3v2Frames)
    {
        const std::filesystem::path file{ createFile("track.mp3", createMp3Content({ { "TPE1", "MyArtist" }, { "TALB", "MyAlbum" }, { "TIT2", "MyTitle" } })) };

        const taglib::Id3v2TagReader tagReader{ file };
        EXPECT_EQ(collectValues(tagReader, TagType::Artist), std::vector<std::string>{ "MyArtist" });
        EXPECT_EQ(collectValues(tagReader, TagType::Album), std::vector<std::string>{ "MyAlbum" });
        EXPECT_EQ(collectValues(tagReader, TagType::TrackTitle), std::vector<std::string>{ "MyTitle" });

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<TagSet>(res));
        EXPECT_EQ(std::get<TagSet>(res), (TagSet{ "MyArtist", "MyAlbum", "MyTitle" }));
    }

    TEST_F(TagLibReaderTest, id3v2MissingFrame)
    {
        const std::filesystem::path file{ createFile("track.mp3", createMp3Content({ { "TPE1", "MyArtist" }, { "TIT2", "MyTitle" } })) };

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<ExtractionFailure>(res));
        EXPECT_EQ(std::get<ExtractionFailure>(res).error, ExtractionError::MissingTag);
        EXPECT_EQ(std::get<ExtractionFailure>(res).message, "missing album tag");
    }

    TEST_F(TagLibReaderTest, flacVorbisComments)
    {
        const std::filesystem::path file{ createFile("track.flac", createFlacContent({ "ARTIST=Bj\xC3\xB6rk", "album=MyAlbum", "TITLE=MyTitle", "GENRE=Pop" })) };

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<TagSet>(res));
        EXPECT_EQ(std::get<TagSet>(res), (TagSet{ "Bj\xC3\xB6rk", "MyAlbum", "MyTitle" }));
    }

    TEST_F(TagLibReaderTest, flacMultiValuedField)
    {
        const std::filesystem::path file{ createFile("track.flac", createFlacContent({ "ARTIST=MyArtist1", "ARTIST=MyArtist2", "ALBUM=MyAlbum", "TITLE=MyTitle" })) };

        const taglib::FlacTagReader tagReader{ file };
        EXPECT_EQ(collectValues(tagReader, TagType::Artist), (std::vector<std::string>{ "MyArtist1", "MyArtist2" }));

        const ExtractionResult res{ extract(file) };
        ASSERT_TRUE(std::holds_alternative<ExtractionFailure>(res));
        EXPECT_EQ(std::get<ExtractionFailure>(res).error, ExtractionError::MissingTag);
        EXPECT_EQ(std::get<ExtractionFailure>(res).message, "ambiguous artist tag (2 values)");
    }
} // namespace tagsort::metadata::tests
