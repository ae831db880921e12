/******************************************************************************\
 * ZipArchive.cpp - Extracts the members of a ZIP container with libarchive.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <string.h>
#include <fcntl.h>
#include <sys/stat.h>

#include <filesystem>

#include <archive.h>
#include <archive_entry.h>

#include "ZipArchive.hpp"
#include "IngestError.hpp"

#include "useful/ingest_log.h"
#include "useful/ingest_wrappers.hpp"

namespace ingest {

using ArchPtr = ZipArchive::ArchPtr;

static std::string archiveErrorString(struct archive* arch)
{
    if (auto const errorStr = archive_error_string(arch)) {
        return std::string{errorStr};
    }
    return "no error information available";
}

// member paths must stay inside the member's temporary directory
static void verifyMemberPath(std::string const& memberName)
{
    auto const memberPath = std::filesystem::path{memberName};
    if (memberPath.is_absolute()) {
        throw ArchiveError{"Error: Member " + memberName + " has an absolute path."};
    }
    for (auto&& component : memberPath) {
        if (component == "..") {
            throw ArchiveError{"Error: Member " + memberName + " escapes the extraction directory."};
        }
    }
}

ArchPtr ZipArchive::openReader(std::string const& archivePath)
{
    auto archPtr = ArchPtr{archive_read_new(), archive_read_free};
    if (archPtr == nullptr) {
        throw ArchiveError{"archive_read_new failed"};
    }

    // only one container format is supported
    if (archive_read_support_format_zip(archPtr.get()) != ARCHIVE_OK) {
        throw ArchiveError{archiveErrorString(archPtr.get())};
    }

    if (archive_read_open_filename(archPtr.get(), archivePath.c_str(), 10240) != ARCHIVE_OK) {
        throw ArchiveError{"Error: Cannot open file \"" + archivePath + "\": "
            + archiveErrorString(archPtr.get())};
    }

    return archPtr;
}

void ZipArchive::writeMember(struct archive* arch, std::string const& destPath,
    std::string const& memberName)
{
    // create intermediate directories inside the member's workspace
    { auto ec = std::error_code{};
        std::filesystem::create_directories(std::filesystem::path{destPath}.parent_path(), ec);
        if (ec) {
            throw ArchiveError{"Error: Failed to extract file " + memberName + ": " + ec.message()};
        }
    }

    auto destFd = fd_handle{};
    try {
        destFd = fd_handle{::open(destPath.c_str(), O_WRONLY | O_CREAT | O_EXCL,
            S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH)};
    } catch (std::exception const& ex) {
        throw ArchiveError{"Error: Failed to extract file " + memberName + ": " + ex.what()};
    }

    // copy data blocks from archive to file
    int64_t written = 0;
    while (true) {
        const void* buf = nullptr;
        size_t len = 0;
        la_int64_t offset = 0;

        auto const rc = archive_read_data_block(arch, &buf, &len, &offset);
        if (rc == ARCHIVE_EOF) {
            break;
        } else if (rc == ARCHIVE_WARN) {
            getLogger().write("ZipArchive: %s: %s\n", memberName.c_str(), archiveErrorString(arch).c_str());
        } else if (rc != ARCHIVE_OK) {
            throw ArchiveError{"Error: Failed to extract file " + memberName + ": "
                + archiveErrorString(arch)};
        }

        try {
            // skip over holes left by the decompressor
            if (offset != written) {
                if (::lseek(destFd.fd(), offset, SEEK_SET) < 0) {
                    throw std::runtime_error("lseek failed: " + std::string{strerror(errno)});
                }
            }
            writeLoop(destFd.fd(), static_cast<char const*>(buf), len);
        } catch (std::exception const& ex) {
            throw ArchiveError{"Error: Failed to extract file " + memberName + ": " + ex.what()};
        }
        written = offset + static_cast<int64_t>(len);
    }
}

std::vector<MaterializedFile> ZipArchive::extract(MaterializedFile const& container) const
{
    auto archPtr = openReader(container.path());

    // members are placed next to the container's workspace
    auto const tempRoot = container.tempDirectory()->root();

    auto files = std::vector<MaterializedFile>{};
    struct archive_entry *entry = nullptr;
    while (true) {
        auto const rc = archive_read_next_header(archPtr.get(), &entry);
        if (rc == ARCHIVE_EOF) {
            break;
        } else if (rc == ARCHIVE_RETRY) {
            continue;
        } else if (rc == ARCHIVE_WARN) {
            getLogger().write("ZipArchive: %s: %s\n", container.path().c_str(),
                archiveErrorString(archPtr.get()).c_str());
        } else if (rc != ARCHIVE_OK) {
            throw ArchiveError{"Error: Cannot open file \"" + container.path() + "\": "
                + archiveErrorString(archPtr.get())};
        }

        auto const rawName = archive_entry_pathname(entry);
        if (rawName == nullptr) {
            throw ArchiveError{"Error: Member of " + container.path() + " has no name."};
        }
        auto const memberName = std::string{rawName};

        // directory entries are implied by the member paths
        auto const filetype = archive_entry_filetype(entry);
        if ((filetype == AE_IFDIR) || (!memberName.empty() && (memberName.back() == '/'))) {
            if (archive_read_data_skip(archPtr.get()) < ARCHIVE_WARN) {
                throw ArchiveError{"Error: Failed to skip directory " + memberName + ": "
                    + archiveErrorString(archPtr.get())};
            }
            continue;
        }
        if (filetype != AE_IFREG) {
            throw ArchiveError{"Error: Member " + memberName + " is not a regular file."};
        }
        verifyMemberPath(memberName);

        // separate temporary directory for each member for fine grained cleanup
        auto file = MaterializedFile{TempDirectory::make(tempRoot), memberName};
        getLogger().write("ZipArchive: extracting %s to %s\n", memberName.c_str(), file.path().c_str());
        writeMember(archPtr.get(), file.path(), memberName);

        if (!file.isReadable()) {
            throw ArchiveError{"Error: File " + file.path() + " is not readable."};
        }

        files.emplace_back(std::move(file));
    }

    return files;
}

} /* namespace ingest */
