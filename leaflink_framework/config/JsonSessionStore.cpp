#include "config/JsonSessionStore.hpp"
#include "core/LeafError.hpp"
#include "utils/Logger.hpp"

#include <json/json.h>
#include <pwd.h>
#include <unistd.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

constexpr const char* kSessionFileName = ".nanoleaf_config.json";

}  // namespace

JsonSessionStore::JsonSessionStore(std::string filePath)
    : filePath_(filePath.empty() ? defaultPath() : std::move(filePath)) {}

std::string JsonSessionStore::defaultPath() {
    const char* home = std::getenv("HOME");
    if(home == nullptr || *home == '\0') {
        const passwd* entry = getpwuid(getuid());
        home = entry ? entry->pw_dir : nullptr;
    }
    if(home == nullptr) {
        return kSessionFileName;
    }
    return (fs::path(home) / kSessionFileName).string();
}

bool JsonSessionStore::exists() const {
    std::error_code ec;
    return fs::exists(filePath_, ec);
}

void JsonSessionStore::save(const std::string& address, const std::string& credential) {
    if(address.empty() || credential.empty()) {
        throw LeafError(ErrorKind::PERSISTENCE, "ip and token cannot be empty");
    }

    Json::Value root;
    root["ip"] = address;
    root["token"] = credential;

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";

    {
        std::ofstream file(filePath_, std::ios::out | std::ios::trunc);
        if(!file.is_open()) {
            throw LeafError(ErrorKind::PERSISTENCE, "failed to open session file for writing: " + filePath_);
        }
        file << Json::writeString(builder, root) << std::endl;
        if(!file) {
            throw LeafError(ErrorKind::PERSISTENCE, "failed to write session file: " + filePath_);
        }
    }

    std::error_code ec;
    fs::permissions(filePath_, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if(ec) {
        throw LeafError(ErrorKind::PERSISTENCE, "failed to restrict permissions of " + filePath_ + ": " + ec.message());
    }

    LOG_DEBUG("Session saved to ", filePath_);
}

DeviceConfig JsonSessionStore::load() const {
    if(!exists()) {
        throw LeafError(ErrorKind::PERSISTENCE, "session file does not exist: " + filePath_);
    }

    std::ifstream file(filePath_);
    if(!file.is_open()) {
        throw LeafError(ErrorKind::PERSISTENCE, "failed to open session file: " + filePath_);
    }

    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if(!Json::parseFromStream(builder, file, &root, &errs)) {
        throw LeafError(ErrorKind::PERSISTENCE, "failed to parse session file: " + errs);
    }
    if(!root.isObject()) {
        throw LeafError(ErrorKind::PERSISTENCE, "session file is not a JSON object");
    }

    DeviceConfig config;
    if(root["ip"].isString()) {
        config.address = root["ip"].asString();
    }
    if(root["token"].isString()) {
        config.credential = root["token"].asString();
    }
    if(config.address.empty() || config.credential.empty()) {
        throw LeafError(ErrorKind::PERSISTENCE, "invalid session: missing ip or token");
    }
    return config;
}
