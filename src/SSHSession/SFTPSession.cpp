/******************************************************************************\
 * SFTPSession.cpp - RemoteSession over the SFTP subsystem of an SSH session.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <climits>
#include <fcntl.h>
#include <unistd.h>

#include "SFTPSession.hpp"

#include "transfer/IngestError.hpp"
#include "useful/ingest_log.h"
#include "useful/ingest_wrappers.hpp"

namespace ingest {

static char const* sftp_status_string(unsigned long status)
{
    switch (status) {
        case LIBSSH2_FX_OK:                  return "ok";
        case LIBSSH2_FX_EOF:                 return "end of file";
        case LIBSSH2_FX_NO_SUCH_FILE:        return "no such file";
        case LIBSSH2_FX_PERMISSION_DENIED:   return "permission denied";
        case LIBSSH2_FX_FAILURE:             return "failure";
        case LIBSSH2_FX_BAD_MESSAGE:         return "bad message";
        case LIBSSH2_FX_NO_CONNECTION:       return "no connection";
        case LIBSSH2_FX_CONNECTION_LOST:     return "connection lost";
        case LIBSSH2_FX_OP_UNSUPPORTED:      return "operation unsupported";
        case LIBSSH2_FX_INVALID_HANDLE:      return "invalid handle";
        case LIBSSH2_FX_NO_SUCH_PATH:        return "no such path";
        case LIBSSH2_FX_FILE_ALREADY_EXISTS: return "file already exists";
        case LIBSSH2_FX_WRITE_PROTECT:       return "write protect";
        case LIBSSH2_FX_NO_MEDIA:            return "no media";
        case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM: return "no space on filesystem";
        case LIBSSH2_FX_QUOTA_EXCEEDED:      return "quota exceeded";
        case LIBSSH2_FX_DIR_NOT_EMPTY:       return "directory not empty";
        case LIBSSH2_FX_NOT_A_DIRECTORY:     return "not a directory";
        case LIBSSH2_FX_INVALID_FILENAME:    return "invalid filename";
        case LIBSSH2_FX_LINK_LOOP:           return "link loop";
        default:                             return "unknown status";
    }
}

// Custom deleters
static void close_sftp_handle(LIBSSH2_SFTP_HANDLE* handle)
{
    libssh2_sftp_close_handle(handle);
}

// passwd entry of the effective user, used for the default remote user and
// the local ssh directory
static auto currentUser()
{
    try {
        return ingest::getpwuid(geteuid());
    } catch (std::exception const& ex) {
        throw ConnectionError(std::string{"Could not determine the current user: "} + ex.what());
    }
}

SFTPSession::SFTPSession(std::string const& hostname, std::string const& username)
    : m_ssh{[&]() {
        auto const [pwd, pwd_buf] = currentUser();
        return SSHSession{hostname, username.empty() ? std::string{pwd.pw_name} : username,
            pwd.pw_dir};
    }()}
    , m_sftp{nullptr, libssh2_sftp_shutdown}
    , m_cwd{}
    , m_lastError{}
{
    m_sftp = UniqueSFTP{libssh2_sftp_init(m_ssh.get()), libssh2_sftp_shutdown};
    if (m_sftp == nullptr) {
        throw ConnectionError("Failed to start SFTP subsystem on " + hostname + ": "
            + get_libssh2_error(m_ssh.get()));
    }

    // initial working directory is the login directory reported by the server
    char buf[PATH_MAX];
    auto const rc = libssh2_sftp_realpath(m_sftp.get(), ".", buf, sizeof(buf) - 1);
    if (rc > 0) {
        m_cwd = std::string{buf, static_cast<size_t>(rc)};
    } else {
        m_cwd = "/";
    }

    getLogger().write("SFTPSession: %s@%s ready, cwd %s\n",
        m_ssh.getUsername().c_str(), hostname.c_str(), m_cwd.c_str());
}

std::string SFTPSession::resolve(std::string const& remotePath) const
{
    if (remotePath.empty()) {
        return m_cwd;
    }
    if (remotePath[0] == '/') {
        return remotePath;
    }
    if (!m_cwd.empty() && m_cwd.back() == '/') {
        return m_cwd + remotePath;
    }
    return m_cwd + "/" + remotePath;
}

bool SFTPSession::fail(std::string const& operation, std::string const& path)
{
    auto const status = libssh2_sftp_last_error(m_sftp.get());
    m_lastError = operation + " " + path + " failed: "
        + sftp_status_string(status) + " (" + get_libssh2_error(m_ssh.get()) + ")";
    getLogger().write("SFTPSession: %s\n", m_lastError.c_str());
    return false;
}

bool SFTPSession::stat(std::string const& remotePath, LIBSSH2_SFTP_ATTRIBUTES& attrs)
{
    return libssh2_sftp_stat(m_sftp.get(), remotePath.c_str(), &attrs) == 0;
}

bool SFTPSession::list(std::string const& folder, NamePattern const& wanted,
    NamePattern const& unwanted, std::vector<std::string>& names)
{
    auto const remoteFolder = resolve(folder);

    auto dir = take_pointer_ownership(libssh2_sftp_opendir(m_sftp.get(), remoteFolder.c_str()),
        close_sftp_handle);
    if (dir == nullptr) {
        return fail("opendir", remoteFolder);
    }

    auto result = std::vector<std::string>{};
    char entry[PATH_MAX];
    while (true) {
        LIBSSH2_SFTP_ATTRIBUTES attrs;
        auto const len = libssh2_sftp_readdir(dir.get(), entry, sizeof(entry), &attrs);
        if (len == 0) {
            break;
        } else if (len < 0) {
            return fail("readdir", remoteFolder);
        }

        auto const name = std::string{entry, static_cast<size_t>(len)};
        if (wanted(name) && !unwanted(name)) {
            result.push_back(name);
        }
    }

    names = std::move(result);
    return true;
}

bool SFTPSession::setWorkingDirectory(std::string const& folder)
{
    auto const remoteFolder = resolve(folder);

    LIBSSH2_SFTP_ATTRIBUTES attrs;
    if (!stat(remoteFolder, attrs)) {
        return fail("chdir", remoteFolder);
    }
    if (!(attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) || !LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
        m_lastError = "chdir " + remoteFolder + " failed: not a directory";
        return false;
    }

    m_cwd = remoteFolder;
    return true;
}

bool SFTPSession::getToLocal(std::string const& remoteName, std::string const& localDir)
{
    auto const remotePath = resolve(remoteName);
    auto const localPath = localDir + "/" + cstr::basename(remoteName);

    auto file = take_pointer_ownership(libssh2_sftp_open(m_sftp.get(), remotePath.c_str(),
        LIBSSH2_FXF_READ, 0), close_sftp_handle);
    if (file == nullptr) {
        return fail("open", remotePath);
    }

    try {
        auto const localFd = fd_handle{::open(localPath.c_str(), O_WRONLY | O_CREAT | O_EXCL, 0600)};

        char buf[INGEST_BUF_SIZE];
        while (true) {
            auto const len = libssh2_sftp_read(file.get(), buf, sizeof(buf));
            if (len == 0) {
                break;
            } else if (len < 0) {
                return fail("read", remotePath);
            }
            writeLoop(localFd.fd(), buf, static_cast<size_t>(len));
        }

    } catch (std::exception const& ex) {
        m_lastError = "writing " + localPath + " failed: " + ex.what();
        return false;
    }

    getLogger().write("SFTPSession: fetched %s to %s\n", remotePath.c_str(), localPath.c_str());
    return true;
}

bool SFTPSession::makePath(std::string const& path)
{
    auto const remotePath = resolve(path);

    // create each component in turn
    auto partial = std::string{};
    size_t pos = 0;
    while (pos != std::string::npos) {
        auto const next = remotePath.find('/', pos + 1);
        partial = remotePath.substr(0, next);
        pos = next;

        if (partial.empty() || (partial == "/")) {
            continue;
        }

        LIBSSH2_SFTP_ATTRIBUTES attrs;
        if (stat(partial, attrs)) {
            if ((attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) && !LIBSSH2_SFTP_S_ISDIR(attrs.permissions)) {
                m_lastError = "mkpath " + partial + " failed: not a directory";
                return false;
            }
            continue;
        }

        if (libssh2_sftp_mkdir(m_sftp.get(), partial.c_str(), 0755) != 0) {
            // may have been created concurrently
            if (!stat(partial, attrs)) {
                return fail("mkdir", partial);
            }
        }
    }

    return true;
}

bool SFTPSession::rename(std::string const& remoteFrom, std::string const& remoteTo)
{
    auto const fromPath = resolve(remoteFrom);
    auto const toPath = resolve(remoteTo);

    if (libssh2_sftp_rename(m_sftp.get(), fromPath.c_str(), toPath.c_str()) != 0) {
        return fail("rename " + fromPath + " to", toPath);
    }
    return true;
}

bool SFTPSession::remove(std::string const& remoteName)
{
    auto const remotePath = resolve(remoteName);

    if (libssh2_sftp_unlink(m_sftp.get(), remotePath.c_str()) != 0) {
        return fail("unlink", remotePath);
    }
    return true;
}

} /* namespace ingest */
