/******************************************************************************\
 * RemoteSession.cpp - A mock remote session, serving files from a local
 *  directory tree.
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include <algorithm>
#include <filesystem>

#include "RemoteSession.hpp"

#include "useful/ingest_wrappers.hpp"

using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace fs = std::filesystem;

/* MockRemoteSession implementation */

MockRemoteSession::MockRemoteSession(std::string const& serverRoot)
    : m_serverRoot{serverRoot}
    , m_cwd{"/"}
    , m_lastError{}
{
    // every operation acts on the local tree by default
    ON_CALL(*this, list(_, _, _, _))
        .WillByDefault(Invoke(this, &MockRemoteSession::fakeList));
    ON_CALL(*this, setWorkingDirectory(_))
        .WillByDefault(Invoke(this, &MockRemoteSession::fakeSetWorkingDirectory));
    ON_CALL(*this, getToLocal(_, _))
        .WillByDefault(Invoke(this, &MockRemoteSession::fakeGetToLocal));
    ON_CALL(*this, makePath(_))
        .WillByDefault(Invoke(this, &MockRemoteSession::fakeMakePath));
    ON_CALL(*this, rename(_, _))
        .WillByDefault(Invoke(this, &MockRemoteSession::fakeRename));
    ON_CALL(*this, remove(_))
        .WillByDefault(Invoke(this, &MockRemoteSession::fakeRemove));

    // describe behavior of mock lastError
    ON_CALL(*this, lastError())
        .WillByDefault(Invoke([this]() { return m_lastError; }));
}

std::string MockRemoteSession::resolve(std::string const& remotePath) const
{
    if (remotePath.empty()) {
        return m_cwd;
    }
    if (remotePath[0] == '/') {
        return remotePath;
    }
    return (fs::path{m_cwd} / remotePath).string();
}

std::string MockRemoteSession::localPath(std::string const& remotePath) const
{
    return m_serverRoot + resolve(remotePath);
}

bool MockRemoteSession::fail(std::string const& message)
{
    m_lastError = message;
    return false;
}

bool MockRemoteSession::fakeList(std::string const& folder, ingest::NamePattern const& wanted,
    ingest::NamePattern const& unwanted, std::vector<std::string>& names)
{
    auto const dirPath = localPath(folder);
    if (!fs::is_directory(dirPath)) {
        return fail("no such file: " + resolve(folder));
    }

    // server reports . and .. first, then entries in name order
    auto entries = std::vector<std::string>{};
    for (auto&& entry : fs::directory_iterator{dirPath}) {
        entries.push_back(entry.path().filename().string());
    }
    std::sort(entries.begin(), entries.end());
    entries.insert(entries.begin(), {".", ".."});

    names.clear();
    for (auto&& name : entries) {
        if (wanted(name) && !unwanted(name)) {
            names.push_back(name);
        }
    }
    return true;
}

bool MockRemoteSession::fakeSetWorkingDirectory(std::string const& folder)
{
    if (!fs::is_directory(localPath(folder))) {
        return fail("no such directory: " + resolve(folder));
    }
    m_cwd = resolve(folder);
    return true;
}

bool MockRemoteSession::fakeGetToLocal(std::string const& remoteName, std::string const& localDir)
{
    auto const source = localPath(remoteName);
    if (!fs::is_regular_file(source)) {
        return fail("no such file: " + resolve(remoteName));
    }

    auto ec = std::error_code{};
    fs::copy_file(source, fs::path{localDir} / ingest::cstr::basename(remoteName), ec);
    if (ec) {
        return fail("get " + resolve(remoteName) + ": " + ec.message());
    }
    return true;
}

bool MockRemoteSession::fakeMakePath(std::string const& path)
{
    auto ec = std::error_code{};
    fs::create_directories(localPath(path), ec);
    if (ec) {
        return fail("mkpath " + resolve(path) + ": " + ec.message());
    }
    return true;
}

bool MockRemoteSession::fakeRename(std::string const& remoteFrom, std::string const& remoteTo)
{
    auto ec = std::error_code{};
    fs::rename(localPath(remoteFrom), localPath(remoteTo), ec);
    if (ec) {
        return fail("rename " + resolve(remoteFrom) + ": " + ec.message());
    }
    return true;
}

bool MockRemoteSession::fakeRemove(std::string const& remoteName)
{
    auto ec = std::error_code{};
    if (!fs::remove(localPath(remoteName), ec) || ec) {
        return fail("remove " + resolve(remoteName) + ": " + (ec ? ec.message() : "no such file"));
    }
    return true;
}
