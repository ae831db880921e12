/******************************************************************************\
 * SourceConfig.cpp - Configuration values for a RemoteFileSource, read from
 *  a JSON document and INGEST_* environment variables.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <stdlib.h>
#include <strings.h>

#include <fstream>

#include <boost/iostreams/device/array.hpp>
#include <boost/iostreams/stream.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include "SourceConfig.hpp"

#include "transfer/IngestError.hpp"
#include "useful/ingest_log.h"

namespace pt = boost::property_tree;

namespace ingest {

bool parseFlag(std::string const& name, std::string const& value)
{
    for (auto&& truthy : {"1", "true", "yes"}) {
        if (::strcasecmp(value.c_str(), truthy) == 0) {
            return true;
        }
    }
    for (auto&& falsy : {"0", "false", "no"}) {
        if (::strcasecmp(value.c_str(), falsy) == 0) {
            return false;
        }
    }
    throw ConfigurationError{"Invalid value for " + name + ": '" + value + "' (expected 1/true/yes or 0/false/no)"};
}

static SourceConfig fromPtree(pt::ptree const& root)
{
    auto result = SourceConfig{};

    auto readString = [&root](char const* key, std::optional<std::string>& dest) {
        if (auto const value = root.get_optional<std::string>(key)) {
            dest = *value;
        }
    };

    readString("host", result.host);
    readString("user", result.user);
    readString("folder", result.folder);
    readString("match", result.match);
    readString("glob", result.glob);
    readString("backup", result.backup);
    readString("tempdir", result.tempDir);

    // JSON true / false are stored as strings by the parser
    if (auto const value = root.get_optional<std::string>("delete")) {
        result.deleteRemote = parseFlag("delete", *value);
    }

    return result;
}

SourceConfig SourceConfig::fromJson(std::string const& json)
{
    // Create stream from string source
    auto jsonSource = boost::iostreams::array_source{json.c_str(), json.length()};
    auto jsonStream = boost::iostreams::stream<boost::iostreams::array_source>{jsonSource};

    auto root = pt::ptree{};
    try {
        pt::read_json(jsonStream, root);
    } catch (pt::json_parser::json_parser_error const& parse_ex) {
        throw ConfigurationError{"failed to parse configuration: " + std::string{parse_ex.what()}};
    }

    return fromPtree(root);
}

SourceConfig SourceConfig::fromJsonFile(std::string const& path)
{
    auto configStream = std::ifstream{path};
    if (!configStream) {
        throw ConfigurationError{"Cannot open configuration file " + path};
    }

    auto root = pt::ptree{};
    try {
        pt::read_json(configStream, root);
    } catch (pt::json_parser::json_parser_error const& parse_ex) {
        throw ConfigurationError{"failed to parse configuration file " + path + ": " + parse_ex.message()
            + " (line " + std::to_string(parse_ex.line()) + ")"};
    }

    getLogger().write("SourceConfig: read %s\n", path.c_str());

    return fromPtree(root);
}

void SourceConfig::applyEnvironment()
{
    auto readEnv = [](char const* var, std::optional<std::string>& dest) {
        if (auto const value = ::getenv(var)) {
            dest = std::string{value};
        }
    };

    readEnv(INGEST_HOST_ENV_VAR, host);
    readEnv(INGEST_USER_ENV_VAR, user);
    readEnv(INGEST_FOLDER_ENV_VAR, folder);

    // a pattern in the environment replaces either kind of pattern from the file
    if (::getenv(INGEST_MATCH_ENV_VAR) || ::getenv(INGEST_GLOB_ENV_VAR)) {
        match.reset();
        glob.reset();
        readEnv(INGEST_MATCH_ENV_VAR, match);
        readEnv(INGEST_GLOB_ENV_VAR, glob);
    }

    readEnv(INGEST_BACKUP_ENV_VAR, backup);
    readEnv(INGEST_TMPDIR_ENV_VAR, tempDir);

    if (auto const value = ::getenv(INGEST_DELETE_ENV_VAR)) {
        deleteRemote = parseFlag(INGEST_DELETE_ENV_VAR, value);
    }
}

void SourceConfig::merge(SourceConfig const& other)
{
    auto take = [](auto& dest, auto const& src) {
        if (src) {
            dest = src;
        }
    };

    take(host, other.host);
    take(user, other.user);
    take(folder, other.folder);
    take(backup, other.backup);
    take(deleteRemote, other.deleteRemote);
    take(tempDir, other.tempDir);

    // a pattern given in other replaces either kind of pattern here
    if (other.match || other.glob) {
        match = other.match;
        glob = other.glob;
    }
}

std::optional<NamePattern> SourceConfig::pattern() const
{
    if (match && glob) {
        throw ConfigurationError{"Only one of match (" + *match + ") and glob (" + *glob + ") may be set"};
    }
    if (match) {
        return NamePattern::regex(*match);
    }
    if (glob) {
        return NamePattern::glob(*glob);
    }
    return std::nullopt;
}

void SourceConfig::configure(RemoteFileSource& source) const
{
    if (host) {
        source.setHost(*host);
    }
    if (user) {
        source.setUser(*user);
    }
    if (folder) {
        source.setFolder(*folder);
    }
    if (auto const selection = pattern()) {
        source.setMatch(*selection);
    }
    if (backup) {
        source.setBackup(*backup);
    }
    if (deleteRemote) {
        source.setDelete(*deleteRemote);
    }
    if (tempDir) {
        source.setTempRoot(*tempDir);
    }
}

} /* namespace ingest */
