/******************************************************************************\
 * SFTPSession.hpp - RemoteSession over the SFTP subsystem of an SSH session.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <libssh2.h>
#include <libssh2_sftp.h>

#include "SSHSession.hpp"
#include "transfer/RemoteSession.hpp"

namespace ingest {

class SFTPSession final : public RemoteSession
{
public: // types
    using UniqueSFTP = std::unique_ptr<LIBSSH2_SFTP, decltype(&libssh2_sftp_shutdown)>;

private: // variables
    // channel must be shut down before the ssh session is torn down
    SSHSession m_ssh;
    UniqueSFTP m_sftp;
    std::string m_cwd;
    std::string m_lastError;

private: // helpers
    // resolve a relative remote path against the working directory
    std::string resolve(std::string const& remotePath) const;
    // record the failure of operation on path, return false
    bool fail(std::string const& operation, std::string const& path);
    // stat remotePath, following links
    bool stat(std::string const& remotePath, LIBSSH2_SFTP_ATTRIBUTES& attrs);

public: // interface
    // connect to hostname as username (current user if empty) and start the
    // SFTP subsystem. throws ConnectionError on failure
    SFTPSession(std::string const& hostname, std::string const& username);
    ~SFTPSession() = default;

    SFTPSession(const SFTPSession&) = delete;
    SFTPSession& operator=(const SFTPSession&) = delete;

    bool list(std::string const& folder, NamePattern const& wanted,
        NamePattern const& unwanted, std::vector<std::string>& names) override;
    bool setWorkingDirectory(std::string const& folder) override;
    bool getToLocal(std::string const& remoteName, std::string const& localDir) override;
    bool makePath(std::string const& path) override;
    bool rename(std::string const& remoteFrom, std::string const& remoteTo) override;
    bool remove(std::string const& remoteName) override;
    std::string lastError() const override { return m_lastError; }

    std::string const& getUsername() const { return m_ssh.getUsername(); }
};

} /* namespace ingest */
