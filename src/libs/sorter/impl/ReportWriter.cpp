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


#include "sorter/ReportWriter.hpp"

#include <cerrno>
#include <fstream>
#include <optional>

#include <Wt/WDate.h>
#include <Wt/WLocalDateTime.h>
#include <Wt/WTime.h>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "sorter/Exception.hpp"
#include "sorter/OrganizerSettings.hpp"

namespace tagsort::sorter
{
    namespace
    {
        std::optional<ReportNaming> parseReportNaming(std::string_view str)
        {
            if (str == "source-dir")
                return ReportNaming::SourceDirectory;
            if (str == "timestamp")
                return ReportNaming::Timestamp;

            return std::nullopt;
        }
    } // namespace

    ReportSettings readReportSettings(core::IConfig& config, const std::filesystem::path& defaultReportDirectory)
    {
        ReportSettings settings;

        settings.reportDirectory = config.getPath("report-dir", defaultReportDirectory);

        const std::string_view namingStr{ config.getString("report-naming", "source-dir") };
        const std::optional<ReportNaming> naming{ parseReportNaming(namingStr) };
        if (!naming)
            throw Exception{ "Invalid value '" + std::string{ namingStr } + "' for setting 'report-naming'" };
        settings.naming = *naming;

        settings.sanitizePolicy = readPathSanitizePolicy(config);

        return settings;
    }

    std::string formatReportTimestamp(const Wt::WDate& date, const Wt::WTime& time)
    {
        return std::to_string(date.year()) + "-" + std::to_string(date.month()) + "-" + std::to_string(date.day())
               + "_" + std::to_string(time.hour()) + "-" + std::to_string(time.minute()) + "-" + std::to_string(time.second());
    }

    ReportWriter::ReportWriter(ReportSettings settings, std::ostream& console)
        : _settings{ std::move(settings) }
        , _console{ console }
    {
    }

    std::vector<std::filesystem::path> ReportWriter::write(const RunReport& report, const std::filesystem::path& srcRoot) const
    {
        std::vector<std::filesystem::path> reportFiles;

        if (report.failures.empty() && report.unsupported.empty())
            return reportFiles;

        std::error_code ec;
        std::filesystem::create_directories(_settings.reportDirectory, ec);
        if (ec)
            throw core::IOException{ "Cannot create report directory", _settings.reportDirectory, ec };

        const std::string suffix{ getReportNameSuffix(srcRoot) };

        if (!report.failures.empty())
        {
            echo("The following files failed:", report.failures);

            const std::filesystem::path reportFile{ _settings.reportDirectory / ("failures" + suffix + ".txt") };
            writeReportFile(reportFile, report.failures);
            reportFiles.push_back(reportFile);
        }

        if (!report.unsupported.empty())
        {
            echo("The following files have an unsupported format:", report.unsupported);

            const std::filesystem::path reportFile{ _settings.reportDirectory / ("unsupported" + suffix + ".txt") };
            writeReportFile(reportFile, report.unsupported);
            reportFiles.push_back(reportFile);
        }

        return reportFiles;
    }

    std::string ReportWriter::getReportNameSuffix(const std::filesystem::path& srcRoot) const
    {
        switch (_settings.naming)
        {
        case ReportNaming::SourceDirectory:
            {
                const std::filesystem::path normalizedRoot{ srcRoot.lexically_normal() };
                std::string dirName{ (normalizedRoot.has_filename() ? normalizedRoot : normalizedRoot.parent_path()).filename().string() };
                if (dirName.empty())
                    dirName = "root";

                return sanitizePathComponent(dirName, _settings.sanitizePolicy);
            }

        case ReportNaming::Timestamp:
            {
                const Wt::WLocalDateTime now{ Wt::WLocalDateTime::currentServerDateTime() };
                return formatReportTimestamp(now.date(), now.time());
            }
        }

        return {};
    }

    void ReportWriter::writeReportFile(const std::filesystem::path& reportFile, std::span<const FailureRecord> records) const
    {
        std::ofstream ofs{ reportFile, std::ios::out | std::ios::trunc };
        if (!ofs)
            throw core::IOException{ "Cannot open report file", reportFile, std::error_code{ errno, std::generic_category() } };

        for (const FailureRecord& record : records)
            ofs << record.file.string() << '\n';

        ofs.flush();
        if (!ofs)
            throw core::IOException{ "Cannot write report file", reportFile, std::error_code{ errno, std::generic_category() } };

        TAGSORT_LOG(REPORT, INFO, "Wrote " << records.size() << " entries to '" << reportFile.string() << "'");
    }

    void ReportWriter::echo(std::string_view heading, std::span<const FailureRecord> records) const
    {
        _console << heading << '\n';
        for (const FailureRecord& record : records)
            _console << record.file.string() << " (" << getFailureReasonName(record.reason) << ": " << record.detail << ")\n";
        _console << std::flush;
    }
} // namespace tagsort::sorter
