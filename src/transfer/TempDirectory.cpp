/******************************************************************************\
 * TempDirectory.cpp - A uniquely named local working directory that is
 *  recursively removed when its last owner releases it.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <filesystem>
#include <vector>

#include "TempDirectory.hpp"
#include "IngestError.hpp"

#include "useful/ingest_log.h"
#include "useful/ingest_wrappers.hpp"

namespace ingest {

std::string
defaultTempRoot()
{
    const auto strGetEnv = [](const char* key) -> std::string {
        const char* value = ::getenv(key);
        return value ? value : "";
    };

    // look in this order: $INGEST_TMPDIR, $TMPDIR, /tmp, $HOME
    const auto search_dirs = std::vector<std::string> {
        strGetEnv(INGEST_TMPDIR_ENV_VAR),
        strGetEnv("TMPDIR"),
        "/tmp",
        strGetEnv("HOME"),
    };

    for (auto&& dir_var : search_dirs) {
        if (!dir_var.empty() && dirHasPerms(dir_var.c_str(), R_OK | W_OK | X_OK)) {
            return dir_var;
        }
    }

    // We have no where to create a temporary directory...
    throw LocalIOError{std::string{"Cannot find suitable temporary directory. Try setting "
        "the env variable "} + INGEST_TMPDIR_ENV_VAR};
}

// generate the unique directory name, translating the failure into the engine's error type
static std::string
createUniqueDir(std::string const& root)
{
    try {
        return cstr::mkdtemp(root + "/" INGEST_TEMPDIR_PREFIX "XXXXXX");
    } catch (std::exception const& ex) {
        throw LocalIOError{std::string{"Could not create temporary directory: "} + ex.what()};
    }
}

TempDirectory::TempDirectory(std::string const& root)
    : m_root{root}
    , m_path{createUniqueDir(root)}
{}

std::shared_ptr<TempDirectory>
TempDirectory::make(std::string const& root)
{
    if (root.empty()) {
        throw LocalIOError{"Temporary directory not configured."};
    }

    // owned before anything else can fail, so the directory is always released
    auto tempDir = std::shared_ptr<TempDirectory>{new TempDirectory{root}};
    getLogger().write("TempDirectory: created %s\n", tempDir->path().c_str());

    return tempDir;
}

TempDirectory::~TempDirectory()
{
    auto ec = std::error_code{};
    std::filesystem::remove_all(m_path, ec);
    if (ec) {
        fprintf(stderr, "warning: remove %s failed: %s\n", m_path.c_str(), ec.message().c_str());
    }

    try {
        getLogger().write("TempDirectory: removed %s%s\n", m_path.c_str(), ec ? " (incomplete)" : "");
    } catch (std::exception const& ex) {
        fprintf(stderr, "warning: logging failed during cleanup of %s: %s\n", m_path.c_str(), ex.what());
    }
}

} /* namespace ingest */
