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


#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/program_options.hpp>

#include "core/Exception.hpp"
#include "core/IConfig.hpp"
#include "core/ILogger.hpp"
#include "core/Path.hpp"
#include "core/Service.hpp"
#include "metadata/ITagExtractor.hpp"
#include "metadata/TagReaderRegistry.hpp"
#include "sorter/Organizer.hpp"
#include "sorter/OrganizerSettings.hpp"
#include "sorter/ReportWriter.hpp"

namespace tagsort
{
    namespace
    {
        constexpr std::string_view copySortCommand{ "copy_sort" };
        const std::filesystem::path configFileName{ "tagsort.conf" };

        core::logging::Severity getLogMinSeverity()
        {
            std::string_view minSeverity{ core::Service<core::IConfig>::get()->getString("log-min-severity", "info") };

            if (minSeverity == "debug")
                return core::logging::Severity::DEBUG;
            else if (minSeverity == "info")
                return core::logging::Severity::INFO;
            else if (minSeverity == "warning")
                return core::logging::Severity::WARNING;
            else if (minSeverity == "error")
                return core::logging::Severity::ERROR;
            else if (minSeverity == "fatal")
                return core::logging::Severity::FATAL;

            throw core::TagsortException{ "Invalid config value for 'log-min-severity'" };
        }

        // explicit file first, then the one installed beside the executable
        std::unique_ptr<core::IConfig> createConfig(const std::optional<std::filesystem::path>& configFilePath, const std::filesystem::path& executableDirectory)
        {
            if (configFilePath)
                return core::createConfig(*configFilePath);

            std::error_code ec;
            if (const std::filesystem::path defaultConfigFilePath{ executableDirectory / configFileName }; std::filesystem::is_regular_file(defaultConfigFilePath, ec))
                return core::createConfig(defaultConfigFilePath);

            return core::createDefaultConfig();
        }

        bool isDirectory(const std::filesystem::path& path)
        {
            std::error_code ec;
            return std::filesystem::is_directory(path, ec);
        }
    } // namespace

    int main(int argc, char* argv[])
    {
        namespace program_options = boost::program_options;

        program_options::options_description options{ "Options" };
        // clang-format off
        options.add_options()
            ("help,h", "Display this help message")
            ("conf,c", program_options::value<std::string>(), "tagsort config file (defaults to tagsort.conf beside the executable, if any)")
            ("report-dir", program_options::value<std::string>(), "Directory where report files are written (overrides the 'report-dir' setting)");
        // clang-format on

        auto displayUsage{ [&](std::ostream& os) {
            os << "Usage: " << argv[0] << " [options] " << copySortCommand << " SRC DEST\n\n"
               << "Commands:\n"
               << "\t" << copySortCommand << ":\tcopy the audio files found in SRC into DEST, organized as artist/album/title\n\n"
               << options << std::endl;
        } };

        try
        {
            program_options::options_description hiddenOptions{ "Hidden options" };
            hiddenOptions.add_options()("args", program_options::value<std::vector<std::string>>()->composing(), "command and its arguments");

            program_options::options_description allOptions;
            allOptions.add(options).add(hiddenOptions);

            program_options::positional_options_description positional;
            positional.add("args", -1);

            program_options::variables_map vm;
            program_options::store(program_options::command_line_parser(argc, argv)
                                       .options(allOptions)
                                       .positional(positional)
                                       .run(),
                vm);
            program_options::notify(vm);

            if (vm.count("help"))
            {
                displayUsage(std::cout);
                return EXIT_SUCCESS;
            }

            const std::vector<std::string> args{ vm.count("args") ? vm["args"].as<std::vector<std::string>>() : std::vector<std::string>{} };
            if (args.size() != 3)
            {
                std::cerr << "Wrong number of arguments." << std::endl;
                displayUsage(std::cerr);
                return EXIT_FAILURE;
            }

            if (args[0] != copySortCommand)
            {
                std::cerr << args[0] << " (argument 1) is not a supported command." << std::endl;
                displayUsage(std::cerr);
                return EXIT_FAILURE;
            }

            const std::filesystem::path srcDirectory{ args[1] };
            if (!isDirectory(srcDirectory))
            {
                std::cerr << "Source folder (argument 2) is not a valid directory." << std::endl;
                displayUsage(std::cerr);
                return EXIT_FAILURE;
            }

            const std::filesystem::path destDirectory{ args[2] };
            if (!isDirectory(destDirectory))
            {
                std::cerr << "Destination folder (argument 3) is not a valid directory." << std::endl;
                displayUsage(std::cerr);
                return EXIT_FAILURE;
            }

            const std::filesystem::path executableDirectory{ core::pathUtils::getExecutablePath(argv[0]).parent_path() };

            std::optional<std::filesystem::path> configFilePath;
            if (vm.count("conf"))
                configFilePath = vm["conf"].as<std::string>();

            core::Service<core::IConfig> config{ createConfig(configFilePath, executableDirectory) };
            core::Service<core::logging::ILogger> logger{ core::logging::createLogger(getLogMinSeverity(), config->getPath("log-file", "")) };

            if (configFilePath)
                TAGSORT_LOG(CONFIG, DEBUG, "Using config file '" << configFilePath->string() << "'");

            // from here, errors are logged
            try
            {
                sorter::OrganizerSettings organizerSettings{ sorter::readOrganizerSettings(*config.get()) };
                sorter::ReportSettings reportSettings{ sorter::readReportSettings(*config.get(), executableDirectory / "output") };
                if (vm.count("report-dir"))
                    reportSettings.reportDirectory = vm["report-dir"].as<std::string>();

                const std::unique_ptr<metadata::ITagExtractor> tagExtractor{ metadata::createTagExtractor(metadata::createDefaultTagReaderRegistry()) };
                const sorter::Organizer organizer{ *tagExtractor, std::move(organizerSettings) };

                const sorter::RunReport report{ organizer.organize(srcDirectory, destDirectory) };

                const sorter::ReportWriter reportWriter{ std::move(reportSettings), std::cout };
                for (const std::filesystem::path& reportFile : reportWriter.write(report, std::filesystem::absolute(srcDirectory)))
                    std::cout << "Report written to '" << reportFile.string() << "'" << std::endl;

                std::cout << report.copiedCount << " file(s) copied, "
                          << report.duplicateCount << " duplicate(s) skipped, "
                          << report.failures.size() << " failure(s), "
                          << report.unsupported.size() << " unsupported file(s)" << std::endl;
            }
            catch (const std::exception& e)
            {
                TAGSORT_LOG(MAIN, FATAL, "Caught exception: " << e.what());
                std::cerr << "Caught exception: " << e.what() << std::endl;
                return EXIT_FAILURE;
            }
        }
        catch (const program_options::error& e)
        {
            std::cerr << e.what() << std::endl;
            displayUsage(std::cerr);
            return EXIT_FAILURE;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Caught exception: " << e.what() << std::endl;
            return EXIT_FAILURE;
        }

        return EXIT_SUCCESS;
    }
} // namespace tagsort

int main(int argc, char* argv[])
{
    return tagsort::main(argc, argv);
}
