/******************************************************************************\
 * MaterializedFile.cpp - A local file produced by a download or an archive
 *  extraction.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include "MaterializedFile.hpp"
#include "ZipArchive.hpp"

#include "useful/ingest_wrappers.hpp"

namespace ingest {

MaterializedFile::MaterializedFile(std::shared_ptr<TempDirectory> tempDir,
    std::string const& relativePath, std::string const& remoteName)
    : m_path{}
    , m_remoteName{remoteName}
    , m_tempDir{std::move(tempDir)}
{
    if (m_tempDir == nullptr) {
        throw std::logic_error("MaterializedFile: temporary directory was null");
    }
    m_path = m_tempDir->path() + "/" + relativePath;
}

std::string MaterializedFile::name() const
{
    return cstr::basename(m_path);
}

std::string MaterializedFile::directory() const
{
    return cstr::dirname(m_path);
}

bool MaterializedFile::isReadable() const
{
    return fileHasPerms(m_path.c_str(), R_OK);
}

std::vector<MaterializedFile> MaterializedFile::extract() const
{
    return extract(ZipArchive{});
}

std::vector<MaterializedFile> MaterializedFile::extract(Extractable const& extractor) const
{
    return extractor.extract(*this);
}

} /* namespace ingest */
