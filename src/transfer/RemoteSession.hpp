/******************************************************************************\
 * RemoteSession.hpp - Interface to an authenticated connection to a remote
 *  file server. Every operation reports success with its return value; the
 *  reason for the last failure is available from lastError().
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <string>
#include <vector>

#include "NamePattern.hpp"

namespace ingest {

class RemoteSession
{
public:
    virtual ~RemoteSession() = default;

    // names (no metadata) of the entries in folder that match wanted and do
    // not match unwanted, in the order the server reports them
    virtual bool list(std::string const& folder, NamePattern const& wanted,
        NamePattern const& unwanted, std::vector<std::string>& names) = 0;

    // relative remote paths given to the operations below are resolved against
    // the working directory
    virtual bool setWorkingDirectory(std::string const& folder) = 0;

    // download remoteName to <localDir>/<basename of remoteName>
    virtual bool getToLocal(std::string const& remoteName, std::string const& localDir) = 0;

    // create path and any missing parents. succeeds if path already exists
    virtual bool makePath(std::string const& path) = 0;

    virtual bool rename(std::string const& remoteFrom, std::string const& remoteTo) = 0;

    virtual bool remove(std::string const& remoteName) = 0;

    virtual std::string lastError() const = 0;
};

} /* namespace ingest */
