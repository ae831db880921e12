/******************************************************************************\
 * ZipArchive.hpp - Extracts the members of a ZIP container with libarchive.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <functional>

#include "Extractable.hpp"

// forward declare
struct archive;
struct archive_entry;

namespace ingest {

class ZipArchive final : public Extractable
{
private: // types
    template <typename T>
    using UniquePtrDestr = std::unique_ptr<T, std::function<void(T*)>>;

public: // types
    using ArchPtr = UniquePtrDestr<struct archive>;

private: // functions
    // open container for reading with only the zip reader enabled
    static ArchPtr openReader(std::string const& archivePath);
    // block-copy the current entry's data into a new file at destPath
    static void writeMember(struct archive* arch, std::string const& destPath,
        std::string const& memberName);

public: // interface
    std::string formatName() const override { return "zip"; }
    std::vector<MaterializedFile> extract(MaterializedFile const& container) const override;
};

} /* namespace ingest */
