/******************************************************************************\
 * TempDirectory.hpp - A uniquely named local working directory that is
 *  recursively removed when its last owner releases it.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>

// pointer management
#include <memory>

namespace ingest {

// first usable directory out of $INGEST_TMPDIR, $TMPDIR, /tmp, $HOME
std::string defaultTempRoot();

class TempDirectory
{
private: // variables
    std::string const m_root;
    std::string const m_path;

private:
    // TempDirectory lifetime is shared between every file placed inside it,
    // so it may only be created as a shared_ptr
    TempDirectory(std::string const& root);

public: // interface
    // create <root>/sftp_ingest-XXXXXX. throws LocalIOError if it cannot be created
    static std::shared_ptr<TempDirectory> make(std::string const& root);
    static std::shared_ptr<TempDirectory> make() { return make(defaultTempRoot()); }

    // remove directory and all of its contents
    ~TempDirectory();

    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;
    TempDirectory(TempDirectory&&) = delete;
    TempDirectory& operator=(TempDirectory&&) = delete;

    std::string const& path() const { return m_path; }
    std::string const& root() const { return m_root; }
};

} /* namespace ingest */
