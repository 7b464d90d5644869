#include "config/JsonSessionStore.hpp"
#include "core/LeafError.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class JsonSessionStoreTest : public ::testing::Test {
protected:
    fs::path tempDir;
    fs::path sessionFile;

    void SetUp() override {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        tempDir = fs::temp_directory_path() / ("leaflink_store_test_" + std::to_string(stamp));
        fs::create_directories(tempDir);
        sessionFile = tempDir / "session.json";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir, ec);
    }

    void writeRaw(const std::string& content) {
        std::ofstream file(sessionFile);
        file << content;
    }

    ErrorKind loadErrorKind(const JsonSessionStore& store) {
        try {
            store.load();
        } catch(const LeafError& e) {
            return e.kind();
        }
        return ErrorKind::NONE;
    }
};

TEST_F(JsonSessionStoreTest, SaveThenLoadRoundTrips) {
    JsonSessionStore store(sessionFile.string());
    store.save("192.168.1.100", "test-token-123");

    DeviceConfig config = store.load();
    EXPECT_EQ(config.address, "192.168.1.100");
    EXPECT_EQ(config.credential, "test-token-123");
}

TEST_F(JsonSessionStoreTest, ExistsOnlyAfterSave) {
    JsonSessionStore store(sessionFile.string());
    EXPECT_FALSE(store.exists());
    store.save("test", "test");
    EXPECT_TRUE(store.exists());
}

TEST_F(JsonSessionStoreTest, LoadFromEmptyStoreFails) {
    JsonSessionStore store(sessionFile.string());
    EXPECT_EQ(loadErrorKind(store), ErrorKind::PERSISTENCE);
}

TEST_F(JsonSessionStoreTest, SaveRejectsEmptyFields) {
    JsonSessionStore store(sessionFile.string());
    EXPECT_THROW(store.save("", "token"), LeafError);
    EXPECT_THROW(store.save("10.0.0.5", ""), LeafError);
    EXPECT_FALSE(store.exists());
}

TEST_F(JsonSessionStoreTest, FileIsOwnerOnly) {
    JsonSessionStore store(sessionFile.string());
    store.save("10.0.0.5", "T1");

    auto perms = fs::status(sessionFile).permissions();
    EXPECT_EQ(perms & fs::perms::all, fs::perms::owner_read | fs::perms::owner_write);
}

TEST_F(JsonSessionStoreTest, WritesIpAndTokenFields) {
    JsonSessionStore store(sessionFile.string());
    store.save("10.0.0.5", "T1");

    std::ifstream file(sessionFile);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("\"ip\""), std::string::npos);
    EXPECT_NE(content.find("\"token\""), std::string::npos);
}

TEST_F(JsonSessionStoreTest, MalformedJsonFails) {
    writeRaw("{ not json");
    JsonSessionStore store(sessionFile.string());
    EXPECT_TRUE(store.exists());
    EXPECT_EQ(loadErrorKind(store), ErrorKind::PERSISTENCE);
}

TEST_F(JsonSessionStoreTest, MissingTokenFails) {
    writeRaw(R"({"ip": "10.0.0.5"})");
    JsonSessionStore store(sessionFile.string());
    EXPECT_EQ(loadErrorKind(store), ErrorKind::PERSISTENCE);
}

TEST_F(JsonSessionStoreTest, SaveIntoMissingDirectoryFails) {
    JsonSessionStore store((tempDir / "missing" / "session.json").string());
    try {
        store.save("10.0.0.5", "T1");
        FAIL() << "expected PERSISTENCE";
    } catch(const LeafError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PERSISTENCE);
    }
}

TEST_F(JsonSessionStoreTest, DefaultPathIsInHomeDirectory) {
    const char* previous = std::getenv("HOME");
    std::string saved = previous ? previous : "";
    setenv("HOME", tempDir.c_str(), 1);

    JsonSessionStore store;
    EXPECT_EQ(store.getFilePath(), (tempDir / ".nanoleaf_config.json").string());

    if(previous) {
        setenv("HOME", saved.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}
