/******************************************************************************\
 * RemoteFileSource.hpp - Poll a folder on a remote file server and fetch the
 *  selected files one at a time into scoped local temporary directories,
 *  then back up or delete the remote originals.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "MaterializedFile.hpp"
#include "NamePattern.hpp"
#include "RemoteSession.hpp"

namespace ingest {

class RemoteFileSource
{
public: // types
    using SessionFactory = std::function<std::unique_ptr<RemoteSession>(
        std::string const& host, std::string const& user)>;
    using WarningHandler = std::function<void(std::string const&)>;

    // connects with SFTPSession
    static SessionFactory defaultSessionFactory();
    // prints "warning: <message>" to stderr
    static WarningHandler defaultWarningHandler();

private: // variables
    std::optional<std::string> m_host;
    std::string m_user;
    std::optional<std::string> m_folder;
    std::optional<NamePattern> m_match;
    std::optional<std::string> m_backup;
    std::optional<bool> m_delete;
    std::string m_tempRoot;

    SessionFactory m_sessionFactory;
    WarningHandler m_warningHandler;

    std::unique_ptr<RemoteSession> m_session;
    std::optional<std::deque<std::string>> m_list;
    bool m_conflictWarned;

private: // helpers
    void warn(std::string const& message);
    // apply backup or delete policy to a file that has been materialized
    void dispose(std::string const& name);

protected: // policy defaults, overridden to provide site defaults
    virtual std::string defaultHost() const { return ""; }
    virtual std::string defaultFolder() const;
    virtual NamePattern defaultMatch() const { return NamePattern{}; }
    virtual std::string defaultBackup() const { return ""; }
    virtual bool defaultDelete() const { return false; }

public: // interface
    RemoteFileSource();
    virtual ~RemoteFileSource() = default;

    RemoteFileSource(const RemoteFileSource&) = delete;
    RemoteFileSource& operator=(const RemoteFileSource&) = delete;

    // configuration. explicitly set values take precedence over policy defaults
    void setHost(std::string const& host) { m_host = host; }
    void setUser(std::string const& user) { m_user = user; }
    void setFolder(std::string const& folder) { m_folder = folder; }
    void setMatch(NamePattern const& match) { m_match = match; }
    void setBackup(std::string const& backup) { m_backup = backup; }
    void setDelete(bool enable) { m_delete = enable; }
    void setTempRoot(std::string const& tempRoot) { m_tempRoot = tempRoot; }
    void setSessionFactory(SessionFactory factory) { m_sessionFactory = std::move(factory); }
    void setWarningHandler(WarningHandler handler) { m_warningHandler = std::move(handler); }

    std::string host() const { return m_host ? *m_host : defaultHost(); }
    std::string const& user() const { return m_user; }
    std::string folder() const { return m_folder ? *m_folder : defaultFolder(); }
    NamePattern match() const { return m_match ? *m_match : defaultMatch(); }
    std::string backup() const { return m_backup ? *m_backup : defaultBackup(); }
    bool deleteEnabled() const { return m_delete ? *m_delete : defaultDelete(); }
    // empty until set, in which case the default temp root is used
    std::string const& tempRoot() const { return m_tempRoot; }

    /*
     * session - connected session to the configured host
     *
     * detail
     *      opened on first use and cached for the lifetime of this source.
     *      throws ConfigurationError if no host is configured and
     *      ConnectionError if the session cannot be opened.
     */
    RemoteSession& session();

    /*
     * list - remote names waiting to be fetched
     *
     * detail
     *      on first call, lists the configured folder through the session,
     *      keeping names that match the selection pattern, excluding . and ..
     *      and keeping server order. the result is cached, and consumed by
     *      next(); it is only queried again after resetList(). throws
     *      TransferError if the listing fails.
     */
    std::deque<std::string>& list();
    void setList(std::deque<std::string> names) { m_list = std::move(names); }
    void resetList() { m_list.reset(); }

    // fetch the next listed file, or nullopt once the list is exhausted.
    // a name is removed from the list before it is fetched, and is not
    // retried if the fetch throws
    std::optional<MaterializedFile> next();

    /*
     * download - fetch a single remote file and dispose of the original
     *
     * detail
     *      fetches folder/name (configured folder if folder is empty) into a
     *      new TempDirectory. after the local copy is verified, the remote
     *      file is moved to the backup folder if one is configured, else
     *      removed if delete is enabled, else left in place. a failed remove
     *      is reported as a warning; every other failure throws.
     */
    MaterializedFile download(std::string const& name) { return download("", name); }
    MaterializedFile download(std::string const& folder, std::string const& name);
};

} /* namespace ingest */
