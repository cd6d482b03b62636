#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "FakeSshBackend.h"
#include "TestUtils.h"
#include "Session/SessionManager.h"
#include "Transfer/DirectoryBrowser.h"
#include "Vault/ConnectionStore.h"
#include "Vault/CryptoVault.h"

namespace {

QStringList names(const QVector<BrowserEntry>& entries)
{
    QStringList out;
    for (const BrowserEntry& e : entries)
        out << e.name;
    return out;
}

void touch(const QString& path, const QByteArray& content = QByteArray())
{
    QFile f(path);
    ASSERT_TRUE(f.open(QIODevice::WriteOnly));
    f.write(content);
}

} // namespace

// ====================================================================
// Filter
// ====================================================================

TEST(BrowserFilterTest, SortsCaseInsensitively) {
    QVector<BrowserEntry> entries{
        { "beta", "/x/beta", false, 1 },
        { "Alpha", "/x/Alpha", true, 0 },
        { ".rc", "/x/.rc", false, 1 },
        { "alpha", "/x/alpha", false, 1 },
    };

    BrowserFilter f;
    applyBrowserFilter(&entries, f);
    EXPECT_EQ(names(entries), (QStringList{ "Alpha", "alpha", "beta" }));

    f.dirsOnly = true;
    applyBrowserFilter(&entries, f);
    EXPECT_EQ(names(entries), (QStringList{ "Alpha" }));
}

// ====================================================================
// Local side
// ====================================================================

class LocalBrowserTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        root = QDir(dir.path());
        ASSERT_TRUE(root.mkpath("sub/deeper"));
        ASSERT_TRUE(root.mkpath("Zeta"));
        touch(root.filePath("b.txt"), "bbb");
        touch(root.filePath("A.txt"));
        touch(root.filePath(".hidden"));
    }

    QTemporaryDir dir;
    QDir root;
    LocalDirectoryBrowser browser;
};

TEST_F(LocalBrowserTest, ListsSortedWithoutHidden) {
    QVector<BrowserEntry> entries;
    ASSERT_TRUE(browser.list(root.path(), BrowserFilter(), &entries));
    EXPECT_EQ(names(entries), (QStringList{ "A.txt", "b.txt", "sub", "Zeta" }));

    EXPECT_EQ(entries[1].size, 3u);
    EXPECT_FALSE(entries[1].isDir);
    EXPECT_TRUE(entries[2].isDir);
    EXPECT_EQ(entries[2].path, root.filePath("sub"));
}

TEST_F(LocalBrowserTest, DirsOnlyAndHidden) {
    BrowserFilter f;
    f.dirsOnly = true;
    QVector<BrowserEntry> entries;
    ASSERT_TRUE(browser.list(root.path(), f, &entries));
    EXPECT_EQ(names(entries), (QStringList{ "sub", "Zeta" }));

    f.dirsOnly = false;
    f.showHidden = true;
    ASSERT_TRUE(browser.list(root.path(), f, &entries));
    EXPECT_EQ(entries.first().name, QString(".hidden"));
}

TEST_F(LocalBrowserTest, NonDirectoryIsRefused) {
    TransferError code = TransferError::None;
    QVector<BrowserEntry> entries;
    EXPECT_FALSE(browser.list(root.filePath("b.txt"), BrowserFilter(), &entries, &code));
    EXPECT_EQ(code, TransferError::InvalidRequest);
    EXPECT_FALSE(browser.list(root.filePath("missing"), BrowserFilter(), &entries, &code));
    EXPECT_EQ(code, TransferError::InvalidRequest);
}

TEST_F(LocalBrowserTest, Navigation) {
    EXPECT_TRUE(browser.hasSubdirectories(root.path()));
    EXPECT_TRUE(browser.hasSubdirectories(root.filePath("sub")));
    EXPECT_FALSE(browser.hasSubdirectories(root.filePath("Zeta")));

    EXPECT_EQ(browser.parent(root.filePath("sub/deeper")), root.filePath("sub"));
    EXPECT_EQ(browser.parent("/"), QString("/"));
    EXPECT_EQ(browser.join(root.path(), "sub"), root.filePath("sub"));
    EXPECT_FALSE(browser.isRemote());
}

TEST_F(LocalBrowserTest, StartsInLastLocalDirectory) {
    CryptoVault vault(root.filePath("vault.bin"), testutil::fastKdf());
    ConnectionStore store(&vault);
    ASSERT_TRUE(store.initialize("master"));

    LocalDirectoryBrowser withStore(&store);
    EXPECT_EQ(withStore.startDirectory(), QDir::homePath());

    ASSERT_TRUE(store.setLastLocalDir(root.filePath("sub")));
    EXPECT_EQ(withStore.startDirectory(), root.filePath("sub"));

    ASSERT_TRUE(store.setLastLocalDir(root.filePath("gone")));
    EXPECT_EQ(withStore.startDirectory(), QDir::homePath());
}

// ====================================================================
// Remote side
// ====================================================================

class RemoteBrowserTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        vault.reset(new CryptoVault(dir.filePath("vault.bin"), testutil::fastKdf()));
        store.reset(new ConnectionStore(vault.get()));
        ASSERT_TRUE(store->initialize("master"));

        host = backend.addHost("srv");
        FakeSshBackend::addFile(*host, "/home/alice/notes.txt", "hello");
        FakeSshBackend::addFile(*host, "/home/alice/.profile", "x");
        FakeSshBackend::addDir(*host, "/home/alice/projects");
        FakeSshBackend::addDir(*host, "/var/www");

        manager.reset(new SessionManager(&backend, store.get()));

        ConnectionRecord r;
        r.host = "srv";
        r.user = "alice";
        r.credential = Credential::withPassword("secret");
        recordId = store->add(r);
        ASSERT_GT(recordId, 0);
        r.id = recordId;

        sessionId = manager->connectTo(r);
        ASSERT_TRUE(testutil::waitFor([&] { return manager->state(sessionId) == SessionState::Ready; }));
    }

    void TearDown() override {
        manager.reset();
    }

    QTemporaryDir dir;
    std::unique_ptr<CryptoVault> vault;
    std::unique_ptr<ConnectionStore> store;
    FakeSshBackend backend;
    std::shared_ptr<FakeHostState> host;
    std::unique_ptr<SessionManager> manager;
    int recordId = -1;
    int sessionId = -1;
};

TEST_F(RemoteBrowserTest, ListsHome) {
    RemoteDirectoryBrowser browser(manager.get(), sessionId, store.get());
    EXPECT_TRUE(browser.isRemote());

    QVector<BrowserEntry> entries;
    ASSERT_TRUE(browser.list("/home/alice", BrowserFilter(), &entries));
    EXPECT_EQ(names(entries), (QStringList{ "notes.txt", "projects" }));
    EXPECT_EQ(entries[0].path, QString("/home/alice/notes.txt"));
    EXPECT_EQ(entries[0].size, 5u);

    EXPECT_EQ(browser.parent("/home/alice/projects"), QString("/home/alice"));
    EXPECT_EQ(browser.parent("/home"), QString("/"));
    EXPECT_TRUE(browser.isDirectory("/var/www"));
    EXPECT_FALSE(browser.isDirectory("/home/alice/notes.txt"));
}

TEST_F(RemoteBrowserTest, BusyWhileTransferHoldsChannel) {
    RemoteDirectoryBrowser browser(manager.get(), sessionId);

    SftpLeasePtr lease = manager->acquireSftp(sessionId, nullptr, LeasePurpose::Transfer);
    ASSERT_NE(lease, nullptr);

    TransferError code = TransferError::None;
    QVector<BrowserEntry> entries;
    EXPECT_FALSE(browser.list("/home/alice", BrowserFilter(), &entries, &code));
    EXPECT_EQ(code, TransferError::SessionBusy);

    lease.reset();
    EXPECT_TRUE(browser.list("/home/alice", BrowserFilter(), &entries, &code));
}

// Start directory: remembered dir, then /home/<user>, then the server's home.
TEST_F(RemoteBrowserTest, StartDirectoryFallbacks) {
    RemoteDirectoryBrowser browser(manager.get(), sessionId, store.get());
    EXPECT_EQ(browser.startDirectory(), QString("/home/alice"));

    ASSERT_TRUE(store->setLastRemoteDir(recordId, "/var/www"));
    EXPECT_EQ(browser.startDirectory(), QString("/var/www"));

    ASSERT_TRUE(store->setLastRemoteDir(recordId, "/var/gone"));
    EXPECT_EQ(browser.startDirectory(), QString("/home/alice"));
}

TEST_F(RemoteBrowserTest, StartDirectoryFromServerHome) {
    FakeHostConfig cfg;
    cfg.home = "/srv/bob";
    backend.addHost("other", cfg);

    ConnectionRecord r;
    r.host = "other";
    r.user = "bob";
    r.credential = Credential::withPassword("secret");
    r.id = store->add(r);
    const int id = manager->connectTo(r);
    ASSERT_TRUE(testutil::waitFor([&] { return manager->state(id) == SessionState::Ready; }));

    RemoteDirectoryBrowser browser(manager.get(), id, store.get());
    EXPECT_EQ(browser.startDirectory(), QString("/srv/bob"));

    RemoteDirectoryBrowser unknown(manager.get(), 999, store.get());
    EXPECT_EQ(unknown.startDirectory(), QString("/"));
}
