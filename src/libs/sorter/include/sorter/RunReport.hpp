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

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace tagsort::sorter
{
    enum class FailureReason
    {
        MissingTag,
        Unreadable,
        UnsupportedFormat,
        PlacementFailed,
    };

    // "missing-tag", "unreadable", ...
    const char* getFailureReasonName(FailureReason reason);

    struct FailureRecord
    {
        std::filesystem::path file; // absolute
        FailureReason reason;
        std::string detail;
    };

    struct RunReport
    {
        std::size_t copiedCount{};
        std::size_t duplicateCount{};
        std::size_t ignoredCount{};

        std::vector<FailureRecord> failures;    // missing tags, unreadable files, placement failures
        std::vector<FailureRecord> unsupported; // known formats that cannot be sorted
    };
} // namespace tagsort::sorter
