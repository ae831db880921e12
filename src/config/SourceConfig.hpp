/******************************************************************************\
 * SourceConfig.hpp - Configuration values for a RemoteFileSource, read from
 *  a JSON document and INGEST_* environment variables.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <optional>
#include <string>

#include "transfer/NamePattern.hpp"
#include "transfer/RemoteFileSource.hpp"

namespace ingest {

struct SourceConfig
{
    std::optional<std::string> host;
    std::optional<std::string> user;
    std::optional<std::string> folder;
    std::optional<std::string> match; // regular expression
    std::optional<std::string> glob;  // shell wildcard pattern
    std::optional<std::string> backup;
    std::optional<bool> deleteRemote;
    std::optional<std::string> tempDir;

    // parse a JSON object with keys host, user, folder, match, glob, backup,
    // delete and tempdir. throws ConfigurationError on parse errors
    static SourceConfig fromJson(std::string const& json);
    static SourceConfig fromJsonFile(std::string const& path);

    // override values from the INGEST_* environment variables that are set
    void applyEnvironment();

    // values set in other replace the values here
    void merge(SourceConfig const& other);

    // selection pattern from match or glob. throws ConfigurationError if both are set
    std::optional<NamePattern> pattern() const;

    // copy every set value onto source
    void configure(RemoteFileSource& source) const;
};

// parse 1/true/yes or 0/false/no. throws ConfigurationError otherwise
bool parseFlag(std::string const& name, std::string const& value);

} /* namespace ingest */
