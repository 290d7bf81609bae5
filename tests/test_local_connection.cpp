#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "ErrorHandler.hpp"
#include "LocalConnection.hpp"
#include "LocalConnectionFactory.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ftpsync;
namespace fs = std::filesystem;

class LocalConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() / "ftpsync_local_test";
        fs::remove_all(tempDir_);
        remoteDir_ = tempDir_ / "remote";
        localDir_ = tempDir_ / "local";
        fs::create_directories(remoteDir_);
        fs::create_directories(localDir_);

        config_.host = "localhost";
        config_.remote_root = remoteDir_.string();
    }

    void TearDown() override {
        fs::remove_all(tempDir_);
    }

    void writeFile(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream file(path);
        file << content;
    }

    std::string readFile(const fs::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    fs::path tempDir_;
    fs::path remoteDir_;
    fs::path localDir_;
    ConnectionConfig config_;
};

TEST_F(LocalConnectionTest, UploadCopiesIntoRoot) {
    LocalConnection connection(remoteDir_, "local#1");
    writeFile(localDir_ / "index.html", "<html/>");

    connection.upload(localDir_ / "index.html", "/site/index.html");

    EXPECT_EQ(readFile(remoteDir_ / "site" / "index.html"), "<html/>");
}

TEST_F(LocalConnectionTest, UploadOverwritesExisting) {
    LocalConnection connection(remoteDir_, "local#1");
    writeFile(remoteDir_ / "a.txt", "old");
    writeFile(localDir_ / "a.txt", "new");

    connection.upload(localDir_ / "a.txt", "a.txt");

    EXPECT_EQ(readFile(remoteDir_ / "a.txt"), "new");
}

TEST_F(LocalConnectionTest, UploadMissingFileThrows) {
    LocalConnection connection(remoteDir_, "local#1");

    try {
        connection.upload(localDir_ / "missing.txt", "missing.txt");
        FAIL() << "Expected TransferError";
    } catch (const TransferError& e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("550"));
    }
}

TEST_F(LocalConnectionTest, DownloadCopiesFromRoot) {
    LocalConnection connection(remoteDir_, "local#1");
    writeFile(remoteDir_ / "data" / "report.csv", "a,b\n");

    connection.download("data/report.csv", localDir_ / "out" / "report.csv");

    EXPECT_EQ(readFile(localDir_ / "out" / "report.csv"), "a,b\n");
}

TEST_F(LocalConnectionTest, RemoveDeletesRemoteFile) {
    LocalConnection connection(remoteDir_, "local#1");
    writeFile(remoteDir_ / "old.txt", "x");

    connection.remove("old.txt");

    EXPECT_FALSE(fs::exists(remoteDir_ / "old.txt"));
    EXPECT_THROW(connection.remove("old.txt"), TransferError);
}

TEST_F(LocalConnectionTest, RejectsPathsLeavingRoot) {
    LocalConnection connection(remoteDir_, "local#1");

    EXPECT_THROW(connection.resolve("../outside.txt"), TransferError);
    EXPECT_THROW(connection.resolve("a/../../outside.txt"), TransferError);
    EXPECT_THROW(connection.resolve(""), TransferError);
    EXPECT_EQ(connection.resolve("/a/b.txt"), remoteDir_ / "a" / "b.txt");
}

TEST_F(LocalConnectionTest, ClosedConnectionRefusesTransfers) {
    LocalConnection connection(remoteDir_, "local#1");
    writeFile(localDir_ / "a.txt", "a");

    connection.close();

    EXPECT_TRUE(connection.isClosed());
    EXPECT_THROW(connection.upload(localDir_ / "a.txt", "a.txt"), TransferError);
    EXPECT_THROW(connection.download("a.txt", localDir_ / "b.txt"), TransferError);
    EXPECT_THROW(connection.remove("a.txt"), TransferError);
}

TEST_F(LocalConnectionTest, CloseIsIdempotent) {
    int released = 0;
    {
        LocalConnection connection(remoteDir_, "local#1", [&released]() { ++released; });
        connection.close();
        EXPECT_NO_THROW(connection.close());
    }
    EXPECT_EQ(released, 1);
}

// Factory tests
TEST_F(LocalConnectionTest, FactoryOpensOneConnectionPerCall) {
    LocalConnectionFactory factory;

    auto first = factory(config_, std::nullopt, false);
    auto second = factory(config_, std::nullopt, false);

    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(first[0]->name(), "local#1");
    EXPECT_EQ(second[0]->name(), "local#2");
    EXPECT_EQ(factory.openCount(), 2u);
    EXPECT_EQ(factory.createdCount(), 2u);
}

TEST_F(LocalConnectionTest, FactoryEnforcesSessionLimit) {
    config_.max_connections = 1;
    LocalConnectionFactory factory;

    auto first = factory(config_, std::nullopt, false);

    try {
        factory(config_, std::nullopt, false);
        FAIL() << "Expected TooManyConnectionsError";
    } catch (const TooManyConnectionsError& e) {
        EXPECT_TRUE(ErrorHandler::isTooManyConnections(e));
    }
    EXPECT_EQ(factory.rejectedCount(), 1u);

    first[0]->close();
    EXPECT_EQ(factory.openCount(), 0u);
    EXPECT_NO_THROW(factory(config_, std::nullopt, false));
}

TEST_F(LocalConnectionTest, FactoryCopiesShareCounters) {
    LocalConnectionFactory factory;
    ConnectionFactory asFunction = factory;

    auto batch = asFunction(config_, std::nullopt, false);

    EXPECT_EQ(factory.openCount(), 1u);
    batch.clear();
    EXPECT_EQ(factory.openCount(), 0u);
}

TEST_F(LocalConnectionTest, FactoryRejectsMissingRoot) {
    config_.remote_root = (tempDir_ / "nowhere").string();
    LocalConnectionFactory factory;

    try {
        factory(config_, std::nullopt, false);
        FAIL() << "Expected ConnectionError";
    } catch (const ConnectionError& e) {
        EXPECT_FALSE(ErrorHandler::isTooManyConnections(e));
    }
    EXPECT_EQ(factory.openCount(), 0u);
}

TEST_F(LocalConnectionTest, FactoryJoinsRemotePath) {
    fs::create_directories(remoteDir_ / "sub");
    LocalConnectionFactory factory;

    auto batch = factory(config_, std::string("/sub"), false);
    auto local = std::dynamic_pointer_cast<LocalConnection>(batch.at(0));

    ASSERT_NE(local, nullptr);
    EXPECT_EQ(local->root(), remoteDir_ / "sub");
}
