#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "api/AsioHttpClient.hpp"
#include "api/HttpDeviceApi.hpp"
#include "config/ConfigHelper.hpp"
#include "config/ConfigParser.hpp"
#include "config/JsonSessionStore.hpp"
#include "core/OrchestrationService.hpp"
#include "net/NetworkScanner.hpp"
#include "utils/Logger.hpp"

// 全局变量只用于信号处理
std::atomic<bool> g_exitRequested{false};

/**
 * @brief 信号处理函数，只置位标志，由看门线程取消令牌
 */
void signalHandler(int) {
    g_exitRequested = true;
}

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <settings.json>] <command> [args]\n"
              << "\n"
              << "Commands:\n"
              << "  scan                 Scan the local network for devices\n"
              << "  pair [ip]            Pair with a device (scans first when no ip is given)\n"
              << "  on | off             Turn the paired device on or off\n"
              << "  brightness <0-100>   Set the brightness of the paired device\n"
              << "  info                 Show the paired device's properties\n"
              << "  effects              List the effects stored on the paired device\n"
              << "  effect <name>        Select an effect on the paired device\n"
              << "  status               Show the saved session and check that the device responds\n";
}

void printResult(const ServiceResult& result) {
    (result.success ? std::cout : std::cerr) << result.message << std::endl;
    if(!result.hasData()) {
        return;
    }

    if(const auto* list = result.get<AddressList>()) {
        for(const auto& address : list->addresses) {
            std::cout << "  " << address << std::endl;
        }
    } else if(const auto* credential = result.get<Credential>()) {
        std::cout << "  token: " << credential->token << std::endl;
    } else if(const auto* info = result.get<DeviceInfo>()) {
        for(const auto& entry : *info) {
            std::cout << "  " << entry.first << " = " << entry.second << std::endl;
        }
    } else if(const auto* config = result.get<DeviceConfig>()) {
        std::cout << "  ip: " << config->address << std::endl;
    } else if(const auto* effects = result.get<EffectList>()) {
        for(const auto& effect : effects->effects) {
            std::cout << "  " << effect << std::endl;
        }
    }
}

/**
 * @brief 设备相关命令需要先恢复保存的会话
 */
bool restoreSession(OrchestrationService& service) {
    ServiceResult loaded = service.loadConfiguration();
    if(!loaded.success) {
        std::cerr << loaded.message << std::endl;
        std::cerr << "Run 'pair' first." << std::endl;
        return false;
    }
    return true;
}

int runCommand(OrchestrationService& service, const std::string& command,
               const std::vector<std::string>& args, const CancellationToken& token) {
    ServiceResult result;

    if(command == "scan") {
        result = service.scan(token);
    } else if(command == "pair") {
        if(args.empty()) {
            ServiceResult scanned = service.scan(token);
            printResult(scanned);
            if(!scanned.success) {
                return 1;
            }
            result = service.pair(token);
        } else {
            result = service.pair(token, args[0]);
        }
    } else if(command == "on" || command == "off") {
        if(!restoreSession(service)) {
            return 1;
        }
        result = service.setPower(token, command == "on");
    } else if(command == "brightness") {
        if(args.empty()) {
            std::cerr << "brightness requires a value between 0 and 100" << std::endl;
            return 1;
        }
        int level = 0;
        try {
            size_t consumed = 0;
            level = std::stoi(args[0], &consumed);
            if(consumed != args[0].size()) {
                throw std::invalid_argument(args[0]);
            }
        } catch(const std::exception&) {
            std::cerr << "Invalid brightness value: " << args[0] << std::endl;
            return 1;
        }
        if(!restoreSession(service)) {
            return 1;
        }
        result = service.setBrightness(token, level);
    } else if(command == "info") {
        if(!restoreSession(service)) {
            return 1;
        }
        result = service.getInfo(token);
    } else if(command == "effects") {
        if(!restoreSession(service)) {
            return 1;
        }
        result = service.listEffects(token);
    } else if(command == "effect") {
        if(args.empty()) {
            std::cerr << "effect requires an effect name" << std::endl;
            return 1;
        }
        if(!restoreSession(service)) {
            return 1;
        }
        // 先拉取灯效列表，未知名称在本地被拒绝
        ServiceResult listed = service.listEffects(token);
        if(!listed.success) {
            printResult(listed);
            return 1;
        }
        result = service.setEffect(token, args[0]);
    } else if(command == "status") {
        if(!restoreSession(service)) {
            return 1;
        }
        const auto& session = service.getSession();
        std::cout << "Device: " << session.getAddress()
                  << " (" << DeviceSession::getStateName(session.getState()) << ")" << std::endl;
        result = service.checkReadiness(token);
        std::cout << "Ready: " << (session.isReady() ? "yes" : "no") << std::endl;
        if(!result.success) {
            std::cerr << result.message << std::endl;
            return 1;
        }
        std::cout << "Cached effects: " << service.getCachedEffects().size() << std::endl;
        return 0;
    } else {
        std::cerr << "Unknown command: " << command << std::endl;
        return 1;
    }

    printResult(result);
    return result.success ? 0 : 1;
}

}  // namespace

/**
 * @brief 主函数 - 命令行前端
 */
int main(int argc, char* argv[]) {
    try {
        std::string configFile;
        std::vector<std::string> positional;
        for(int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if(arg == "--config" && i + 1 < argc) {
                configFile = argv[++i];
            } else if(arg == "-h" || arg == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                positional.push_back(arg);
            }
        }
        if(positional.empty()) {
            printUsage(argv[0]);
            return 1;
        }

        // 获取配置并验证
        auto& config = ConfigHelper::getInstance();
        if(!configFile.empty() && !ConfigParser::loadFromFile(configFile)) {
            std::cerr << "Failed to load configuration from " << configFile << std::endl;
            return 1;
        }
        if(!config.validateAll()) {
            std::cerr << "Configuration validation failed!" << std::endl;
            return 1;
        }
        if(!config.initializeLogger()) {
            std::cerr << "Failed to initialize logger" << std::endl;
            return 1;
        }
        config.printConfig();

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        auto httpClient = std::make_shared<AsioHttpClient>();
        auto api = std::make_shared<HttpDeviceApi>(httpClient,
                                                   std::chrono::milliseconds(config.apiConfig.requestTimeoutMs));
        auto scanner = std::make_shared<NetworkScanner>();
        auto store = std::make_shared<JsonSessionStore>(config.resolveSessionFile());
        OrchestrationService service(api, scanner, store,
                                     std::chrono::milliseconds(config.scanConfig.scanTimeoutMs));

        CancellationToken token;
        std::atomic<bool> finished{false};
        std::thread watcher([&]() {
            while(!finished) {
                if(g_exitRequested) {
                    LOG_WARN("Interrupted, cancelling current operation");
                    token.cancel();
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });

        std::string command = positional.front();
        std::vector<std::string> args(positional.begin() + 1, positional.end());
        int exitCode = 1;
        try {
            exitCode = runCommand(service, command, args, token);
        } catch(const std::exception& e) {
            LOG_ERROR("Command '", command, "' failed: ", e.what());
        }

        finished = true;
        watcher.join();
        Logger::getInstance().flush();
        return exitCode;
    }
    catch(const std::exception& e) {
        std::cerr << "Application error: " << e.what() << std::endl;
        return 1;
    }
}
