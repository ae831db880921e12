/******************************************************************************\
 * MaterializedFile.hpp - A local file produced by a download or an archive
 *  extraction. Holds a reference to the TempDirectory it lives in, so the
 *  file stays on disk for as long as any copy of the handle exists.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

// pointer management
#include <memory>

#include "TempDirectory.hpp"

namespace ingest {

class Extractable;

class MaterializedFile
{
private: // variables
    std::string m_path;
    std::string m_remoteName;
    std::shared_ptr<TempDirectory> m_tempDir;

public: // interface
    // bind to <tempDir>/<relativePath>. the file does not need to exist yet
    MaterializedFile(std::shared_ptr<TempDirectory> tempDir, std::string const& relativePath,
        std::string const& remoteName);
    MaterializedFile(std::shared_ptr<TempDirectory> tempDir, std::string const& relativePath)
        : MaterializedFile{std::move(tempDir), relativePath, relativePath}
    {}

    std::string const& path() const { return m_path; }
    // name of the remote file or archive member this file was materialized from
    std::string const& remoteName() const { return m_remoteName; }
    // base name of the local file
    std::string name() const;
    // directory containing the local file
    std::string directory() const;
    // ownership token keeping the backing directory alive
    std::shared_ptr<TempDirectory> const& tempDirectory() const { return m_tempDir; }

    bool isReadable() const;

    // extract every regular member of this ZIP archive into its own TempDirectory
    std::vector<MaterializedFile> extract() const;
    std::vector<MaterializedFile> extract(Extractable const& extractor) const;
};

} /* namespace ingest */
