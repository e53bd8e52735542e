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
#include <ostream>
#include <span>
#include <string>
#include <vector>

#include "sorter/PathSanitizer.hpp"
#include "sorter/RunReport.hpp"

namespace Wt
{
    class WDate;
    class WTime;
} // namespace Wt

namespace tagsort::core
{
    class IConfig;
}

namespace tagsort::sorter
{
    enum class ReportNaming
    {
        SourceDirectory, // re-running on the same source overwrites the previous reports
        Timestamp,
    };

    struct ReportSettings
    {
        std::filesystem::path reportDirectory;
        ReportNaming naming{ ReportNaming::SourceDirectory };
        PathSanitizePolicy sanitizePolicy{ PathSanitizePolicy::ReservedCharacters };
    };

    // throws Exception on invalid values
    ReportSettings readReportSettings(core::IConfig& config, const std::filesystem::path& defaultReportDirectory);

    // YYYY-M-D_h-m-s, not zero padded
    std::string formatReportTimestamp(const Wt::WDate& date, const Wt::WTime& time);

    class ReportWriter
    {
    public:
        ReportWriter(ReportSettings settings, std::ostream& console);

        // One file per non empty category ("failures<suffix>.txt", "unsupported<suffix>.txt")
        // containing one absolute source path per line. Entries are echoed to the console.
        // Returns the written files
        // throws core::IOException on failure
        std::vector<std::filesystem::path> write(const RunReport& report, const std::filesystem::path& srcRoot) const;

        std::string getReportNameSuffix(const std::filesystem::path& srcRoot) const;

    private:
        void writeReportFile(const std::filesystem::path& reportFile, std::span<const FailureRecord> records) const;
        void echo(std::string_view heading, std::span<const FailureRecord> records) const;

        const ReportSettings _settings;
        std::ostream& _console;
    };
} // namespace tagsort::sorter
