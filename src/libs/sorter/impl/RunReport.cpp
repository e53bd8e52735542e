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


#include "sorter/RunReport.hpp"

namespace tagsort::sorter
{
    const char* getFailureReasonName(FailureReason reason)
    {
        switch (reason)
        {
        case FailureReason::MissingTag:
            return "missing-tag";
        case FailureReason::Unreadable:
            return "unreadable";
        case FailureReason::UnsupportedFormat:
            return "unsupported-format";
        case FailureReason::PlacementFailed:
            return "placement-failed";
        }

        return "unknown";
    }
} // namespace tagsort::sorter
