/******************************************************************************\
 * SSHSession.hpp - A header file for the SSH connection helper
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <memory>
#include <string>

#include <libssh2.h>

#include "useful/ingest_wrappers.hpp"

// Custom deleters
static void delete_ssh2_session(LIBSSH2_SESSION *pSession)
{
    libssh2_session_disconnect(pSession, "Normal Shutdown");
    libssh2_session_free(pSession);
}

namespace ingest {

// Get libssh2 error information
std::string get_libssh2_error(LIBSSH2_SESSION* session);

// Retry if hit timeout
template <typename Func>
static auto libssh2_retry(Func&& func)
{
    auto rc = LIBSSH2_ERROR_TIMEOUT;
    for (auto i = 0; i < INGEST_LIBSSH2_RETRIES; i++) {
        rc = func();

        if (rc != LIBSSH2_ERROR_TIMEOUT)  {
            break;
        }

        ::sleep(1);
    }

    return rc;
}

class SSHSession
{
public: // types
    using UniqueSession = std::unique_ptr<LIBSSH2_SESSION, decltype(&delete_ssh2_session)>;

private: // members
    ingest::fd_handle m_session_sock;
    UniqueSession m_session_ptr;
    std::string m_username;

public: // interface
    /*
     * SSHSession constructor - start and authenticate an ssh session with a remote host
     *
     * detail
     *      starts an ssh session with hostname, verifies the identity of the remote host,
     *      and authenticates the user using the public key method. this is the only supported
     *      ssh authentication method. throws ConnectionError on failure.
     *
     * arguments
     *      hostname - hostname of remote host to which to connect
     *      username - remote user to authenticate as
     *      homeDir - local home directory used to locate the default SSH directory
     *
     */
    SSHSession(std::string const& hostname, std::string const& username, std::string const& homeDir);

    ~SSHSession() = default;

    // Delete copy constructors
    SSHSession(const SSHSession&) = delete;
    SSHSession& operator=(const SSHSession&) = delete;

    LIBSSH2_SESSION* get() const { return m_session_ptr.get(); }
    std::string const& getUsername() const { return m_username; }
};

} /* namespace ingest */
