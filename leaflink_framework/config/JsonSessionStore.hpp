#pragma once

#include <string>
#include "config/SessionStore.hpp"

/**
 * @brief JSON文件会话存储
 *
 * 文件格式：{ "ip": "...", "token": "..." }，权限仅限所有者读写(0600)
 */
class JsonSessionStore : public ISessionStore {
public:
    /**
     * @param filePath 会话文件路径，空字符串表示 defaultPath()
     */
    explicit JsonSessionStore(std::string filePath = "");

    bool exists() const override;

    void save(const std::string& address, const std::string& credential) override;

    DeviceConfig load() const override;

    const std::string& getFilePath() const { return filePath_; }

    /**
     * @brief 默认会话文件：$HOME/.nanoleaf_config.json
     */
    static std::string defaultPath();

private:
    std::string filePath_;
};
