/******************************************************************************\
 * ingest_source_unit_test.cpp - RemoteFileSource unit tests
 *
 * Copyright 2023 Hewlett Packard Enterprise Development LP.
 * SPDX-License-Identifier: Linux-OpenIB
 ******************************************************************************/

#include "ingest_defs.h"

#include <filesystem>

#include "transfer/IngestError.hpp"
#include "transfer/NamePattern.hpp"

#include "ingest_source_unit_test.hpp"
#include "ingest_tempdir_unit_test.hpp"

using ::testing::Return;
using ::testing::_;
using ::testing::Invoke;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace fs = std::filesystem;

IngestSourceUnitTest::IngestSourceUnitTest()
    : serverRoot{ingest::TempDirectory::make()}
    , workspaceRoot{ingest::TempDirectory::make()}
    , pendingSession{std::make_unique<MockRemoteSession::Nice>(serverRoot->path())}
    , mockSession{pendingSession.get()}
    , connections{}
    , warnings{}
    , source{}
{
    fs::create_directories(serverPath("/incoming"));

    source.setHost("mockhost");
    source.setTempRoot(workspaceRoot->path());
    source.setWarningHandler([this](std::string const& message) {
        warnings.push_back(message);
    });
    attachSession(source);
}

IngestSourceUnitTest::~IngestSourceUnitTest()
{}

void IngestSourceUnitTest::attachSession(ingest::RemoteFileSource& target)
{
    target.setSessionFactory([this](std::string const& host, std::string const& user)
        -> std::unique_ptr<ingest::RemoteSession> {
        connections.emplace_back(host, user);
        return std::move(pendingSession);
    });
}

void IngestSourceUnitTest::addRemoteFile(std::string const& remotePath, std::string const& contents)
{
    auto const localPath = serverPath(remotePath);
    fs::create_directories(fs::path{localPath}.parent_path());
    writeTestFile(localPath, contents);
}

std::string IngestSourceUnitTest::serverPath(std::string const& remotePath) const
{
    return serverRoot->path() + remotePath;
}

bool IngestSourceUnitTest::remoteExists(std::string const& remotePath) const
{
    return fs::exists(serverPath(remotePath));
}

size_t IngestSourceUnitTest::workspaceCount() const
{
    return countWorkspaces(workspaceRoot->path());
}

// site specific defaults supplied by a subclass
class SiteFileSource : public ingest::RemoteFileSource
{
protected:
    std::string defaultHost() const override { return "files.example.com"; }
    std::string defaultFolder() const override { return "/drop"; }
    ingest::NamePattern defaultMatch() const override { return ingest::NamePattern::glob("*.csv"); }
    bool defaultDelete() const override { return true; }
};

// glob selection with delete: each zip is fetched once and removed remotely
TEST_F(IngestSourceUnitTest, GlobDeleteScenario)
{
    addRemoteFile("/incoming/a.zip", "archive a");
    addRemoteFile("/incoming/b.txt", "text b");
    addRemoteFile("/incoming/c.zip", "archive c");

    source.setFolder("/incoming");
    source.setMatch(ingest::NamePattern::glob("*.zip"));
    source.setDelete(true);

    EXPECT_THAT(source.list(), ElementsAre("a.zip", "c.zip"));

    auto first = source.next();
    ASSERT_TRUE(first);
    EXPECT_EQ(first->name(), "a.zip");
    EXPECT_EQ(readTestFile(first->path()), "archive a");
    EXPECT_FALSE(remoteExists("/incoming/a.zip"));

    auto second = source.next();
    ASSERT_TRUE(second);
    EXPECT_EQ(second->name(), "c.zip");
    EXPECT_EQ(readTestFile(second->path()), "archive c");
    EXPECT_FALSE(remoteExists("/incoming/c.zip"));

    EXPECT_FALSE(source.next());
    EXPECT_TRUE(remoteExists("/incoming/b.txt"));
    EXPECT_TRUE(warnings.empty());
}

// . and .. are never listed
TEST_F(IngestSourceUnitTest, ListExcludesSelfAndParent)
{
    addRemoteFile("/incoming/one", "1");
    addRemoteFile("/incoming/.hidden", "h");
    addRemoteFile("/incoming/two", "2");

    EXPECT_THAT(source.list(), ElementsAre(".hidden", "one", "two"));
    EXPECT_EQ(mockSession->getServerRoot(), serverRoot->path());
}

TEST_F(IngestSourceUnitTest, ListRegexMatch)
{
    addRemoteFile("/incoming/feed-2023.csv", "");
    addRemoteFile("/incoming/feed-2023.csv.tmp", "");
    addRemoteFile("/incoming/other.csv", "");

    source.setMatch(ingest::NamePattern::regex("^feed-\\d+\\.csv$"));
    EXPECT_THAT(source.list(), ElementsAre("feed-2023.csv"));
}

// server order is kept as reported
TEST_F(IngestSourceUnitTest, ListKeepsServerOrder)
{
    ON_CALL(*mockSession, list(_, _, _, _))
        .WillByDefault(Invoke([](std::string const&, ingest::NamePattern const& wanted,
            ingest::NamePattern const& unwanted, std::vector<std::string>& names) {
            names.clear();
            for (auto&& name : {"zeta", ".", "alpha", "..", "mid"}) {
                if (wanted(name) && !unwanted(name)) {
                    names.push_back(name);
                }
            }
            return true;
        }));

    EXPECT_THAT(source.list(), ElementsAre("zeta", "alpha", "mid"));
}

// the listing is cached until reset
TEST_F(IngestSourceUnitTest, ListIdempotentUntilReset)
{
    EXPECT_CALL(*mockSession, list("/incoming", _, _, _)).Times(2);

    addRemoteFile("/incoming/first", "1");
    EXPECT_THAT(source.list(), ElementsAre("first"));

    addRemoteFile("/incoming/second", "2");
    EXPECT_THAT(source.list(), ElementsAre("first"));

    source.resetList();
    EXPECT_THAT(source.list(), ElementsAre("first", "second"));
}

TEST_F(IngestSourceUnitTest, SetListReplacesQueue)
{
    EXPECT_CALL(*mockSession, list(_, _, _, _)).Times(0);

    addRemoteFile("/incoming/chosen.txt", "chosen");
    source.setList({"chosen.txt"});

    auto file = source.next();
    ASSERT_TRUE(file);
    EXPECT_EQ(readTestFile(file->path()), "chosen");
    EXPECT_FALSE(source.next());
}

TEST_F(IngestSourceUnitTest, ListFailure)
{
    source.setFolder("/missing");
    EXPECT_THROW(source.list(), ingest::TransferError);
}

// N calls against M names yield M files then nothing
TEST_F(IngestSourceUnitTest, NextExhaustsList)
{
    addRemoteFile("/incoming/a", "a");
    addRemoteFile("/incoming/b", "b");

    EXPECT_CALL(*mockSession, getToLocal(_, _)).Times(2);

    auto fetched = std::vector<std::string>{};
    for (int i = 0; i < 5; i++) {
        if (auto file = source.next()) {
            fetched.push_back(file->remoteName());
        }
    }
    EXPECT_THAT(fetched, ElementsAre("a", "b"));
    EXPECT_TRUE(source.list().empty());
}

// a failed fetch consumes its name
TEST_F(IngestSourceUnitTest, FailedNextNotRequeued)
{
    addRemoteFile("/incoming/vanishing", "gone");
    EXPECT_THAT(source.list(), ElementsAre("vanishing"));
    fs::remove(serverPath("/incoming/vanishing"));

    EXPECT_THROW(source.next(), ingest::TransferError);
    EXPECT_TRUE(source.list().empty());
    EXPECT_FALSE(source.next());
}

// without backup or delete the remote original stays in place
TEST_F(IngestSourceUnitTest, DownloadLeavesRemote)
{
    EXPECT_CALL(*mockSession, rename(_, _)).Times(0);
    EXPECT_CALL(*mockSession, remove(_)).Times(0);

    auto const contents = std::string{"binary\0data\n", 12};
    addRemoteFile("/incoming/blob.bin", contents);

    auto const file = source.download("blob.bin");
    EXPECT_TRUE(file.isReadable());
    EXPECT_EQ(readTestFile(file.path()), contents);
    EXPECT_EQ(file.remoteName(), "blob.bin");
    EXPECT_EQ(file.tempDirectory()->root(), workspaceRoot->path());
    EXPECT_TRUE(remoteExists("/incoming/blob.bin"));
}

// released files take their workspace with them
TEST_F(IngestSourceUnitTest, DownloadWorkspaceReleased)
{
    addRemoteFile("/incoming/a.txt", "a");

    { auto const file = source.download("a.txt");
        EXPECT_EQ(workspaceCount(), 1u);
    }
    EXPECT_EQ(workspaceCount(), 0u);
}

TEST_F(IngestSourceUnitTest, DownloadFromOtherFolder)
{
    addRemoteFile("/other/x.txt", "x");
    EXPECT_CALL(*mockSession, setWorkingDirectory("/other"));

    auto const file = source.download("/other", "x.txt");
    EXPECT_EQ(readTestFile(file.path()), "x");
}

TEST_F(IngestSourceUnitTest, DownloadRequiresName)
{
    EXPECT_THROW(source.download(""), ingest::ConfigurationError);
    EXPECT_TRUE(connections.empty());
}

// a failed transfer leaves no workspace behind
TEST_F(IngestSourceUnitTest, WorkingDirectoryFailure)
{
    EXPECT_CALL(*mockSession, getToLocal(_, _)).Times(0);

    source.setFolder("/missing");
    try {
        source.download("a.txt");
        FAIL() << "download did not throw";
    } catch (ingest::TransferError const& ex) {
        EXPECT_THAT(ex.what(), HasSubstr("/missing"));
    }
    EXPECT_EQ(workspaceCount(), 0u);
}

TEST_F(IngestSourceUnitTest, TransferFailure)
{
    EXPECT_CALL(*mockSession, remove(_)).Times(0);
    source.setDelete(true);

    EXPECT_THROW(source.download("absent.txt"), ingest::TransferError);
    EXPECT_EQ(workspaceCount(), 0u);
}

// a transfer that reports success without producing a file is a local error
TEST_F(IngestSourceUnitTest, UnreadableDownload)
{
    ON_CALL(*mockSession, getToLocal(_, _)).WillByDefault(Return(true));
    EXPECT_CALL(*mockSession, remove(_)).Times(0);
    source.setDelete(true);

    EXPECT_THROW(source.download("ghost.txt"), ingest::LocalIOError);
    EXPECT_EQ(workspaceCount(), 0u);
}

// backup moves the original, creating the backup folder
TEST_F(IngestSourceUnitTest, BackupMovesRemote)
{
    addRemoteFile("/incoming/a.txt", "a");
    source.setBackup("/incoming/done");
    EXPECT_CALL(*mockSession, makePath("/incoming/done"));
    EXPECT_CALL(*mockSession, remove(_)).Times(0);

    auto const file = source.download("a.txt");
    EXPECT_EQ(readTestFile(file.path()), "a");
    EXPECT_FALSE(remoteExists("/incoming/a.txt"));
    EXPECT_TRUE(remoteExists("/incoming/done/a.txt"));
}

// a relative backup folder is relative to the remote folder
TEST_F(IngestSourceUnitTest, BackupRelativeFolder)
{
    addRemoteFile("/incoming/a.txt", "a");
    addRemoteFile("/incoming/b.txt", "b");
    source.setBackup("archive/2023");

    while (source.next()) {}

    EXPECT_TRUE(remoteExists("/incoming/archive/2023/a.txt"));
    EXPECT_TRUE(remoteExists("/incoming/archive/2023/b.txt"));
    EXPECT_TRUE(warnings.empty());
}

// a failed backup is fatal and leaves the original in place
TEST_F(IngestSourceUnitTest, BackupRenameFailure)
{
    addRemoteFile("/incoming/a.txt", "a");
    source.setBackup("/backup");
    ON_CALL(*mockSession, rename(_, _)).WillByDefault(Return(false));

    EXPECT_THROW(source.download("a.txt"), ingest::TransferError);
    EXPECT_TRUE(remoteExists("/incoming/a.txt"));
    EXPECT_EQ(workspaceCount(), 0u);
}

TEST_F(IngestSourceUnitTest, BackupMakePathFailure)
{
    addRemoteFile("/incoming/a.txt", "a");
    source.setBackup("/backup");
    ON_CALL(*mockSession, makePath(_)).WillByDefault(Return(false));
    EXPECT_CALL(*mockSession, rename(_, _)).Times(0);

    EXPECT_THROW(source.download("a.txt"), ingest::TransferError);
    EXPECT_TRUE(remoteExists("/incoming/a.txt"));
}

// a failed delete is only a warning
TEST_F(IngestSourceUnitTest, DeleteFailureWarns)
{
    addRemoteFile("/incoming/a.txt", "a");
    source.setDelete(true);
    ON_CALL(*mockSession, remove(_)).WillByDefault(Return(false));

    auto const file = source.download("a.txt");
    EXPECT_EQ(readTestFile(file.path()), "a");
    EXPECT_TRUE(remoteExists("/incoming/a.txt"));
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_THAT(warnings[0], HasSubstr("a.txt"));
}

// backup wins over delete, with a single warning per source
TEST_F(IngestSourceUnitTest, BackupAndDeleteConflict)
{
    addRemoteFile("/incoming/a.txt", "a");
    addRemoteFile("/incoming/b.txt", "b");
    source.setBackup("/backup");
    source.setDelete(true);
    EXPECT_CALL(*mockSession, remove(_)).Times(0);

    auto first = source.next();
    auto second = source.next();
    ASSERT_TRUE(first && second);

    EXPECT_TRUE(remoteExists("/backup/a.txt"));
    EXPECT_TRUE(remoteExists("/backup/b.txt"));
    EXPECT_EQ(warnings.size(), 1u);
}

// the session is opened once, lazily, with the configured user
TEST_F(IngestSourceUnitTest, SessionOpenedOnce)
{
    addRemoteFile("/incoming/a.txt", "a");
    source.setUser("feeder");
    EXPECT_TRUE(connections.empty());

    source.list();
    source.next();
    auto& session = source.session();

    EXPECT_EQ(&session, static_cast<ingest::RemoteSession*>(mockSession));
    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].first, "mockhost");
    EXPECT_EQ(connections[0].second, "feeder");
}

TEST_F(IngestSourceUnitTest, HostRequired)
{
    auto unconfigured = ingest::RemoteFileSource{};
    attachSession(unconfigured);

    EXPECT_THROW(unconfigured.session(), ingest::ConfigurationError);
    EXPECT_THROW(unconfigured.list(), ingest::ConfigurationError);
    EXPECT_TRUE(connections.empty());
}

TEST_F(IngestSourceUnitTest, SessionFactoryFailure)
{
    source.setSessionFactory([](std::string const&, std::string const&) {
        return std::unique_ptr<ingest::RemoteSession>{};
    });
    EXPECT_THROW(source.session(), ingest::ConnectionError);

    source.setSessionFactory([](std::string const& host, std::string const&)
        -> std::unique_ptr<ingest::RemoteSession> {
        throw std::runtime_error("refused by " + host);
    });
    EXPECT_THROW(source.session(), ingest::ConnectionError);
}

TEST_F(IngestSourceUnitTest, PolicyDefaults)
{
    auto plain = ingest::RemoteFileSource{};
    EXPECT_EQ(plain.host(), "");
    EXPECT_EQ(plain.folder(), INGEST_DEFAULT_FOLDER);
    EXPECT_EQ(plain.backup(), "");
    EXPECT_FALSE(plain.deleteEnabled());
    EXPECT_TRUE(plain.match()("anything at all"));
}

// subclass defaults apply unless a value is set explicitly
TEST_F(IngestSourceUnitTest, SubclassDefaults)
{
    addRemoteFile("/drop/daily.csv", "d");
    addRemoteFile("/drop/daily.log", "l");

    auto site = SiteFileSource{};
    site.setTempRoot(workspaceRoot->path());
    attachSession(site);

    EXPECT_EQ(site.host(), "files.example.com");
    EXPECT_THAT(site.list(), ElementsAre("daily.csv"));

    auto file = site.next();
    ASSERT_TRUE(file);
    EXPECT_EQ(readTestFile(file->path()), "d");
    EXPECT_FALSE(remoteExists("/drop/daily.csv"));
    EXPECT_TRUE(remoteExists("/drop/daily.log"));

    ASSERT_EQ(connections.size(), 1u);
    EXPECT_EQ(connections[0].first, "files.example.com");

    auto overridden = SiteFileSource{};
    overridden.setHost("other.example.com");
    overridden.setFolder("/elsewhere");
    overridden.setDelete(false);
    EXPECT_EQ(overridden.host(), "other.example.com");
    EXPECT_EQ(overridden.folder(), "/elsewhere");
    EXPECT_FALSE(overridden.deleteEnabled());
}
