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


#include "sorter/OrganizerSettings.hpp"

#include "core/IConfig.hpp"
#include "core/String.hpp"
#include "sorter/Exception.hpp"

namespace tagsort::sorter
{
    PathSanitizePolicy readPathSanitizePolicy(core::IConfig& config)
    {
        const std::string_view policyStr{ config.getString("path-sanitize-policy", getPathSanitizePolicyName(PathSanitizePolicy::ReservedCharacters)) };
        const std::optional<PathSanitizePolicy> policy{ parsePathSanitizePolicy(policyStr) };
        if (!policy)
            throw Exception{ "Invalid value '" + std::string{ policyStr } + "' for setting 'path-sanitize-policy'" };

        return *policy;
    }

    OrganizerSettings readOrganizerSettings(core::IConfig& config)
    {
        OrganizerSettings settings;

        settings.sanitizePolicy = readPathSanitizePolicy(config);

        config.visitStrings(
            "unsupported-extensions", [&](std::string_view extension) {
                if (extension.size() < 2 || extension.front() != '.')
                    throw Exception{ "Invalid extension '" + std::string{ extension } + "' in setting 'unsupported-extensions'" };

                settings.unsupportedExtensions.emplace_back(core::stringUtils::stringToLower(extension));
            },
            { ".wav", ".aiff", ".aif", ".ape", ".wv", ".ogg", ".opus", ".m4a", ".aac", ".wma", ".alac", ".dsf" });

        settings.followDirectorySymlinks = config.getBool("follow-directory-symlinks", false);

        return settings;
    }
} // namespace tagsort::sorter
