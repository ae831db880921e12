/******************************************************************************\
 * RemoteFileSource.cpp - Poll a folder on a remote file server and fetch the
 *  selected files one at a time into scoped local temporary directories.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <stdio.h>

#include <vector>

#include "RemoteFileSource.hpp"
#include "IngestError.hpp"
#include "TempDirectory.hpp"

#include "SSHSession/SFTPSession.hpp"
#include "useful/ingest_log.h"
#include "useful/ingest_wrappers.hpp"

namespace ingest {

RemoteFileSource::SessionFactory
RemoteFileSource::defaultSessionFactory()
{
    return [](std::string const& host, std::string const& user) -> std::unique_ptr<RemoteSession> {
        return std::make_unique<SFTPSession>(host, user);
    };
}

RemoteFileSource::WarningHandler
RemoteFileSource::defaultWarningHandler()
{
    return [](std::string const& message) {
        fprintf(stderr, "warning: %s\n", message.c_str());
    };
}

RemoteFileSource::RemoteFileSource()
    : m_host{}
    , m_user{}
    , m_folder{}
    , m_match{}
    , m_backup{}
    , m_delete{}
    , m_tempRoot{}
    , m_sessionFactory{defaultSessionFactory()}
    , m_warningHandler{defaultWarningHandler()}
    , m_session{}
    , m_list{}
    , m_conflictWarned{false}
{}

std::string RemoteFileSource::defaultFolder() const
{
    return INGEST_DEFAULT_FOLDER;
}

void RemoteFileSource::warn(std::string const& message)
{
    getLogger().write("RemoteFileSource: warning: %s\n", message.c_str());
    if (m_warningHandler) {
        m_warningHandler(message);
    }
}

RemoteSession& RemoteFileSource::session()
{
    if (m_session != nullptr) {
        return *m_session;
    }

    auto const remoteHost = host();
    if (remoteHost.empty()) {
        throw ConfigurationError{"Error: host required"};
    }
    if (!m_sessionFactory) {
        throw ConnectionError{"No session factory configured for " + remoteHost};
    }

    getLogger().write("RemoteFileSource: connecting to %s as '%s'\n", remoteHost.c_str(), m_user.c_str());

    // the factory reports its own failure reason; anything it throws that is
    // not already classified is a connection failure
    try {
        m_session = m_sessionFactory(remoteHost, m_user);
    } catch (Error const&) {
        throw;
    } catch (std::exception const& ex) {
        throw ConnectionError{"Connection to " + remoteHost + " failed: " + ex.what()};
    }
    if (m_session == nullptr) {
        throw ConnectionError{"Connection to " + remoteHost + " failed"};
    }

    return *m_session;
}

std::deque<std::string>& RemoteFileSource::list()
{
    if (m_list) {
        return *m_list;
    }

    auto const remoteFolder = folder();
    auto const wanted = match();
    auto const selfOrParent = NamePattern::regex(INGEST_SELF_PARENT_REGEX);

    auto names = std::vector<std::string>{};
    auto& remote = session();
    if (!remote.list(remoteFolder, wanted, selfOrParent, names)) {
        throw TransferError{"Error: list " + remoteFolder + ": " + remote.lastError()};
    }

    getLogger().write("RemoteFileSource: %zu of %s match %s\n", names.size(),
        remoteFolder.c_str(), wanted.description().c_str());

    m_list = std::deque<std::string>{names.begin(), names.end()};
    return *m_list;
}

std::optional<MaterializedFile> RemoteFileSource::next()
{
    auto& pending = list();
    if (pending.empty()) {
        return std::nullopt;
    }

    auto const name = pending.front();
    pending.pop_front();

    return download(name);
}

void RemoteFileSource::dispose(std::string const& name)
{
    auto const backupFolder = backup();
    auto const deleteRemote = deleteEnabled();
    auto& remote = session();

    if (!backupFolder.empty()) {
        if (deleteRemote && !m_conflictWarned) {
            m_conflictWarned = true;
            warn("both backup folder " + backupFolder + " and delete are configured, "
                "remote files are moved to the backup folder and not deleted");
        }

        if (!remote.makePath(backupFolder)) {
            throw TransferError{"Error: mkpath " + backupFolder + ": " + remote.lastError()};
        }
        auto const backupName = backupFolder + "/" + name;
        if (!remote.rename(name, backupName)) {
            throw TransferError{"Error: rename " + name + " to " + backupName + ": " + remote.lastError()};
        }
        getLogger().write("RemoteFileSource: moved %s to %s\n", name.c_str(), backupName.c_str());

    } else if (deleteRemote) {
        if (!remote.remove(name)) {
            warn("could not delete remote file " + name + ": " + remote.lastError());
            return;
        }
        getLogger().write("RemoteFileSource: deleted %s\n", name.c_str());
    }
}

MaterializedFile RemoteFileSource::download(std::string const& folder, std::string const& name)
{
    if (name.empty()) {
        throw ConfigurationError{"Error: file name required"};
    }
    auto const remoteFolder = folder.empty() ? this->folder() : folder;

    // released on any failure below, removing partial downloads
    auto tempDir = m_tempRoot.empty()
        ? TempDirectory::make()
        : TempDirectory::make(m_tempRoot);

    auto& remote = session();
    if (!remote.setWorkingDirectory(remoteFolder)) {
        throw TransferError{"Error: setcwd " + remoteFolder + ": " + remote.lastError()};
    }

    getLogger().write("RemoteFileSource: fetching %s/%s to %s\n", remoteFolder.c_str(),
        name.c_str(), tempDir->path().c_str());
    if (!remote.getToLocal(name, tempDir->path())) {
        throw TransferError{"Error: get " + name + ": " + remote.lastError()};
    }

    auto file = MaterializedFile{std::move(tempDir), cstr::basename(name), name};
    if (!file.isReadable()) {
        throw LocalIOError{"Error: Cannot read local file " + file.path()};
    }

    dispose(name);

    return file;
}

} /* namespace ingest */
