/******************************************************************************\
 * NamePattern.cpp - Selection predicate over bare remote file names.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <fnmatch.h>

#include <regex>

#include "NamePattern.hpp"
#include "IngestError.hpp"

namespace ingest {

NamePattern::NamePattern()
    : NamePattern{[](std::string const&) { return true; }, "regex:.*"}
{}

NamePattern NamePattern::regex(std::string const& expression)
{
    try {
        auto const nameRegex = std::regex{expression};
        return NamePattern{[nameRegex](std::string const& name) {
            return std::regex_search(name, nameRegex);
        }, "regex:" + expression};
    } catch (std::regex_error const& ex) {
        throw ConfigurationError{"Invalid selection pattern " + expression + ": " + ex.what()};
    }
}

NamePattern NamePattern::glob(std::string const& pattern)
{
    return NamePattern{[pattern](std::string const& name) {
        return ::fnmatch(pattern.c_str(), name.c_str(), FNM_PERIOD) == 0;
    }, "glob:" + pattern};
}

} /* namespace ingest */
