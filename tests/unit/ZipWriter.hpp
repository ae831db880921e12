/******************************************************************************\
 * ZipWriter.hpp - Builds ZIP containers for the extraction unit tests.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <functional>
#include <string>

// forward declare
struct archive;
struct archive_entry;

class ZipWriter {
private: // types
    template <typename T>
    using UniquePtrDestr = std::unique_ptr<T, std::function<void(T*)>>;

public: // types
    using ArchPtr = UniquePtrDestr<struct archive>;
    using EntryPtr = UniquePtrDestr<struct archive_entry>;

private: // variables
    ArchPtr  m_archPtr;
    EntryPtr m_entryScratchpad;
    std::string const m_archivePath;

private: // functions
    // refresh the entry scratchpad without reallocating
    EntryPtr& freshEntry();
    void writeHeader();

public: // interface
    // create zip file on disk
    ZipWriter(const std::string& archivePath);

    // finalize and return path to zip file; after, only valid operation is to destruct
    const std::string& finalize() {
        m_archPtr.reset();
        m_entryScratchpad.reset();
        return m_archivePath;
    }

    void addDirEntry(const std::string& entryPath);
    void addFile(const std::string& entryPath, const std::string& contents);
    void addSymlink(const std::string& entryPath, const std::string& target);
};
