/******************************************************************************\
 * Extractable.hpp - Interface for container formats that can be unpacked into
 *  MaterializedFiles.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

#include "MaterializedFile.hpp"

namespace ingest {

class Extractable
{
public:
    virtual ~Extractable() = default;

    // name of the container format, used in diagnostics
    virtual std::string formatName() const = 0;

    // Unpack every regular member of container. Each member is placed in its
    // own TempDirectory created under the container's temp root. Throws
    // ArchiveError if the container cannot be read or any member fails; no
    // partial result is returned.
    // Directory members are skipped. Links and other special members are
    // rejected with ArchiveError instead of being extracted, which is narrower
    // than general-purpose zip tools that recreate them.
    virtual std::vector<MaterializedFile> extract(MaterializedFile const& container) const = 0;
};

} /* namespace ingest */
