/******************************************************************************\
 * SSHSession.cpp - Connection, host verification and authentication of an
 *                  SSH session to a remote file server.
 *
 * Copyright 2017-2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <netdb.h>
#include <string.h>
#include <sys/socket.h>

#include "SSHSession.hpp"

#include "transfer/IngestError.hpp"
#include "useful/ingest_log.h"
#include "useful/ingest_wrappers.hpp"

#include <libssh2.h>

namespace ingest {

class SSHAgent {
private:
    LIBSSH2_AGENT * m_agent;
    std::string     m_username;

public:
    SSHAgent(LIBSSH2_SESSION *session, std::string username)
        : m_agent{nullptr}, m_username{username}
    {
        if (session == nullptr) {
            throw std::logic_error("SSHAgent: session was null");
        }

        // Connect to the ssh-agent
        m_agent = libssh2_agent_init(session);
        if (m_agent == nullptr) {
            throw std::runtime_error("Could not init ssh-agent support.");
        }
    }

    ~SSHAgent()
    {
        // cleanup
        if (m_agent != nullptr) {
            libssh2_agent_disconnect(m_agent);
            libssh2_agent_free(m_agent);
        }
    }

    // Delete copy/move constructors
    SSHAgent(const SSHAgent&) = delete;
    SSHAgent& operator=(const SSHAgent&) = delete;
    SSHAgent(SSHAgent&&) = delete;
    SSHAgent& operator=(SSHAgent&&) = delete;

    void auth()
    {
        if (libssh2_agent_connect(m_agent)) {
            throw std::runtime_error("Could not connect to ssh-agent.");
        }
        if (libssh2_agent_list_identities(m_agent)) {
            throw std::runtime_error("Could not request identities from ssh-agent.");
        }
        // Try to obtain a valid identity from the agent and authenticate
        struct libssh2_agent_publickey *identity, *prev_identity = nullptr;
        while (1) {
            auto rc = libssh2_agent_get_identity(m_agent, &identity, prev_identity);

            if (rc < 0) {
                throw std::runtime_error("Could not obtain identity from ssh-agent.");

            } else if (rc == 1) {
                throw std::runtime_error("ssh-agent reached the end of the public keys without authenticating.");
            }

            // Only valid return codes are 1, 0, or negative value.
            if (libssh2_agent_userauth(m_agent, m_username.c_str(), identity) == 0) {
                return;
            }

            prev_identity = identity;
        }
    }
};

// SSHSession implementations

std::string get_libssh2_error(LIBSSH2_SESSION* session)
{
    char *libssh2_error_ptr = nullptr;
    libssh2_session_last_error(session, &libssh2_error_ptr, nullptr, false);
    return std::string{ (libssh2_error_ptr)
        ? libssh2_error_ptr
        : "no error information available"
    };
}

// map the session hostkey type to the matching knownhost key mask
static int knownhost_keymask(int hostkey_type)
{
    switch (hostkey_type) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:       return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        case LIBSSH2_HOSTKEY_TYPE_DSS:       return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256: return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384: return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521: return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        case LIBSSH2_HOSTKEY_TYPE_ED25519:   return LIBSSH2_KNOWNHOST_KEY_ED25519;
        default:                             return LIBSSH2_KNOWNHOST_KEY_UNKNOWN;
    }
}

// Attempt public key authentication with a key file pair. Returns false if the
// key files do not exist, throws if they exist but cannot be used.
static bool tryAuthKeyfilePair(LIBSSH2_SESSION* session, std::string const& username,
    std::string const& defaultPublickeyPath, std::string const& defaultPrivatekeyPath)
{
    auto publickeyPath = defaultPublickeyPath;
    auto privatekeyPath = defaultPrivatekeyPath;

    // Determine if public keyfile path should be overridden
    if (auto const pubkey_path = ::getenv(SSH_PUBKEY_PATH_ENV_VAR)) {

        if (!fileHasPerms(pubkey_path, R_OK)) {
            throw ConnectionError("Default SSH public key path " + publickeyPath +
                " was overridden by setting the environment variable "
                SSH_PUBKEY_PATH_ENV_VAR " to " + pubkey_path +
                ", but the file was not readable. Ensure the file exists "
                "and has permission code 644.");
        }

        publickeyPath = pubkey_path;
    }

    // Verify public key exists
    if (!pathExists(publickeyPath.c_str())) {
        return false;
    }

    // Verify public key permissions
    if (!fileHasPerms(publickeyPath.c_str(), R_OK)) {
        throw ConnectionError("The SSH public key file at " + publickeyPath +
            " is not readable. Ensure the file exists and has permission code "
            "644. If your system is configured to use a non-default SSH public "
            "key file, it can be overridden by setting the environment variable "
            SSH_PUBKEY_PATH_ENV_VAR " to the public key file path.");
    }

    // Determine if private keyfile path should be overridden
    if (auto const prikey_path = ::getenv(SSH_PRIKEY_PATH_ENV_VAR)) {

        if (!fileHasPerms(prikey_path, R_OK)) {
            throw ConnectionError("Default SSH private key path " + privatekeyPath +
                " was overridden by setting the environment variable "
                SSH_PRIKEY_PATH_ENV_VAR " to " + prikey_path + ", but the file was not "
                "readable. Ensure the file exists and has permission code 600.");
        }

        privatekeyPath = prikey_path;
    }

    // Verify private key exists
    if (!pathExists(privatekeyPath.c_str())) {
        return false;
    }

    // Verify private key permissions
    if (!fileHasPerms(privatekeyPath.c_str(), R_OK)) {
        throw ConnectionError("The SSH private key file at " + privatekeyPath +
            " is not readable. Ensure the file exists and has permission code "
            "600. If your system is configured to use a non-default SSH private "
            "key file, it can be overridden by setting the environment variable "
            SSH_PRIKEY_PATH_ENV_VAR " to the private key file path.");
    }

    // Read passphrase from environment. If unset, null pointer is interpreted
    // as no passphrase by libssh2_userauth_publickey_fromfile
    auto const ssh_passphrase = ::getenv(SSH_PASSPHRASE_ENV_VAR);

    // Attempt to authenticate using public / private keys
    // Authentication call suffers from spurious timeout
    auto userauth_rc = libssh2_retry([&]() {
        return libssh2_userauth_publickey_fromfile(session,
            username.c_str(), publickeyPath.c_str(), privatekeyPath.c_str(),
            ssh_passphrase);
    });

    // Check return code
    if (userauth_rc < 0) {

        throw ConnectionError("Failed to authenticate using the "
            "username " + username + ", SSH public key file at " + publickeyPath +
            " and private key file at " + privatekeyPath + " . If these paths are "
            "not correct, they can be overridden by setting the environment "
            "variables " SSH_PUBKEY_PATH_ENV_VAR " and " SSH_PRIKEY_PATH_ENV_VAR
            " . If a passhrase is required to unlock the keys, it can be provided "
            "by setting the environment variable " SSH_PASSPHRASE_ENV_VAR " (" +
            get_libssh2_error(session) + ", " + std::to_string(userauth_rc) + ")");
    }

    // Authentication was successful
    return true;
}

SSHSession::SSHSession(std::string const& hostname, std::string const& username, std::string const& homeDir)
    : m_session_ptr{nullptr, delete_ssh2_session}
    , m_username{username}
{
    int rc;
    struct addrinfo hints = {};
    // Setup the hints structure
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_NUMERICSERV;

    struct addrinfo *host;
    auto const ssh_port = getenvOrDefault(SSH_PORT_ENV_VAR, INGEST_DEFAULT_SSH_PORT);
    if ((rc = getaddrinfo(hostname.c_str(), ssh_port.c_str(), &hints, &host)) != 0) {
        throw ConnectionError("getaddrinfo failed for " + hostname + ": " + std::string{gai_strerror(rc)});
    }
    // Take ownership of the host addrinfo into the unique_ptr.
    // This will enforce cleanup.
    auto host_ptr = take_pointer_ownership(std::move(host), freeaddrinfo);

    // create the ssh socket
    try {
        m_session_sock = ingest::fd_handle{ (int)socket(host_ptr->ai_family,
                                                       host_ptr->ai_socktype,
                                                       host_ptr->ai_protocol) };
    } catch (std::exception const& ex) {
        throw ConnectionError("Failed to create socket for " + hostname + ": " + ex.what());
    }

    // Connect the socket
    if (connect(m_session_sock.fd(), host_ptr->ai_addr, host_ptr->ai_addrlen)) {
        throw ConnectionError("failed to connect to host " + hostname + ": " + strerror(errno));
    }
    getLogger().write("SSHSession: connected to %s port %s\n", hostname.c_str(), ssh_port.c_str());

    // Init a new libssh2 session.
    m_session_ptr = take_pointer_ownership(libssh2_session_init(), delete_ssh2_session);
    if (m_session_ptr == nullptr) {
        throw ConnectionError("libssh2_session_init() failed");
    }

    // Set to blocking mode
    libssh2_session_set_blocking(m_session_ptr.get(), 1);
    if (::getenv(INGEST_DBG_ENV_VAR) != nullptr) {
        libssh2_trace(m_session_ptr.get(), LIBSSH2_TRACE_KEX | LIBSSH2_TRACE_AUTH | LIBSSH2_TRACE_ERROR);
    }

    // Start up the new session.
    // This will trade welcome banners, exchange keys, and setup crypto,
    // compression, and MAC layers.
    auto handshake_rc = libssh2_retry([this]() {
        return libssh2_session_handshake(m_session_ptr.get(), m_session_sock.fd());
    });

    if (handshake_rc < 0) {
        throw ConnectionError("Failure establishing SSH session: "
            + get_libssh2_error(m_session_ptr.get()));
    }

    // At this point we havn't authenticated. The first thing to do is check
    // the hostkey's fingerprint against our known hosts.
    auto known_host_ptr = take_pointer_ownership(libssh2_knownhost_init(m_session_ptr.get()),
                                                 libssh2_knownhost_free);
    if (known_host_ptr == nullptr) {
        throw ConnectionError("Failure initializing knownhost file");
    }

    // Detect usable SSH directory
    auto sshDir = homeDir + "/.ssh/";

    // Determine if default SSH directory should be overridden (default is ~/.ssh)
    if (auto const ssh_dir = ::getenv(SSH_DIR_ENV_VAR)) {

        if (!dirHasPerms(ssh_dir, R_OK | X_OK)) {
            throw ConnectionError("Default SSH keyfile directory " + sshDir +
                " was overridden by setting the environment variable " SSH_DIR_ENV_VAR " to " + ssh_dir +
                ", but the directory was not readable / executable. Ensure the directory exists and has "
                "permission code 500.");
        }

        sshDir = ssh_dir;
    }

    // Verify SSH directory permissions
    if (!dirHasPerms(sshDir.c_str(), R_OK | X_OK)) {
        throw ConnectionError("The SSH keyfile directory at " + sshDir +
            " is not readable / executable. Ensure the directory exists and has permission code 700. "
            "If your system is configured to use a non-default SSH directory, it can be overridden "
            "by setting the environment variable " SSH_DIR_ENV_VAR " to the SSH directory path.");
    }

    // Detect usable knownhosts file
    auto knownHostsPath = sshDir + "/known_hosts";

    // Determine if knownhosts path should be overridden (default is <sshDir>/known_hosts
    if (auto const known_hosts_path = ::getenv(SSH_KNOWNHOSTS_PATH_ENV_VAR)) {

        if (!fileHasPerms(known_hosts_path, R_OK)) {
            throw ConnectionError("Default SSH known hosts path " + knownHostsPath +
            " was overridden by setting the environment variable "
            SSH_KNOWNHOSTS_PATH_ENV_VAR " to " + known_hosts_path + ", but the file was not readable. "
            "Ensure the file exists and has permission code 600.");
        }

        knownHostsPath = known_hosts_path;
    }

    // Verify known_hosts permissions
    if (!fileHasPerms(knownHostsPath.c_str(), R_OK)) {
        throw ConnectionError("The SSH known hosts file at " + knownHostsPath +
            " is not readable. Ensure the file exists and has permission code 600. If your system is "
            "configured to use a non-default SSH known_hosts file, it can be overridden by setting "
            "the environment variable " SSH_KNOWNHOSTS_PATH_ENV_VAR " to the known hosts file path.");
    }

    // Read known_hosts
    rc = libssh2_knownhost_readfile(known_host_ptr.get(), knownHostsPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH);
    if (rc < 0) {
        throw ConnectionError("The SSH known hosts file at " + knownHostsPath +
            " failed to parse correctly. Ensure the file exists and is formatted correctly. If your "
            "system is configured to use a non-default SSH known_hosts file, it can be overridden "
            "by setting the environment variable " SSH_KNOWNHOSTS_PATH_ENV_VAR " to the known hosts file "
            "path.");
    }

    // obtain the session hostkey fingerprint
    size_t len;
    int type;
    const char *fingerprint = libssh2_session_hostkey(m_session_ptr.get(), &len, &type);
    if (fingerprint == nullptr) {
        throw ConnectionError("Failed to obtain the remote hostkey");
    }

    // Check the remote hostkey against the knownhosts
    { int keymask = knownhost_keymask(type);
        struct libssh2_knownhost *kh = nullptr;
        int check = libssh2_knownhost_checkp(   known_host_ptr.get(),
                                                hostname.c_str(), std::stoi(ssh_port),
                                                fingerprint, len,
                                                LIBSSH2_KNOWNHOST_TYPE_PLAIN |
                                                LIBSSH2_KNOWNHOST_KEYENC_RAW |
                                                keymask,
                                                &kh);
        switch (check) {
            case LIBSSH2_KNOWNHOST_CHECK_MATCH:
                // Do nothing
                break;
            case LIBSSH2_KNOWNHOST_CHECK_NOTFOUND:
                // Host is trusted for this session only. known_hosts is not modified.
                getLogger().write("SSHSession: %s not found in %s, continuing\n",
                    hostname.c_str(), knownHostsPath.c_str());
                break;
            case LIBSSH2_KNOWNHOST_CHECK_MISMATCH:
                throw ConnectionError("Remote hostkey mismatch with knownhosts file! Remove the host from knownhosts to resolve: " + hostname);
            case LIBSSH2_KNOWNHOST_CHECK_FAILURE:
            default:
                throw ConnectionError("Failure with libssh2 knownhost check");
        }
    }

    // check what authentication methods are available
    auto userauthlist = libssh2_userauth_list(m_session_ptr.get(), username.c_str(), username.length());

    // Check to see if we can use the passwordless login method
    if ((userauthlist == nullptr) || (::strstr(userauthlist, "publickey") == nullptr)) {
        throw ConnectionError("Remote host " + hostname + " does not offer public key authentication for "
            + username);
    }

    // Start by trying to use the ssh-agent mechanism
    try {
        SSHAgent agent(m_session_ptr.get(), username);
        agent.auth();
        getLogger().write("SSHSession: authenticated %s with ssh-agent\n", username.c_str());
        return;

    } catch (std::exception const& ex) {
        // fall back on key files
        getLogger().write("SSHSession: ssh-agent authentication unavailable (%s)\n", ex.what());
    }

    // Attempt authentication using the default key types
    for (auto&& keyName : {"id_rsa", "id_ecdsa", "id_ed25519"}) {
        if (tryAuthKeyfilePair(m_session_ptr.get(), username,
            sshDir + "/" + keyName + ".pub", sshDir + "/" + keyName)) {
            getLogger().write("SSHSession: authenticated %s with %s\n", username.c_str(), keyName);
            return;
        }
    }

    throw ConnectionError("Failed to detect SSH key files in " + sshDir +
        " . These paths can be specified by setting the environment variables "
        SSH_PUBKEY_PATH_ENV_VAR " and " SSH_PRIKEY_PATH_ENV_VAR " . If a passhrase "
        "is required to unlock the keys, it can be provided by setting the environment "
        "variable " SSH_PASSPHRASE_ENV_VAR " . Passwordless (public key) SSH "
        "authentication to the file server is required.");
}

} /* namespace ingest */
