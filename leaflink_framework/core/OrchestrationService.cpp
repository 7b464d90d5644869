#include "core/OrchestrationService.hpp"
#include "utils/Logger.hpp"

#include <algorithm>

namespace {

const char* const kNoAddressMessage = "No device IP provided. Please scan first.";
const char* const kNotPairedMessage = "Device not paired. Please scan and pair first.";

}  // namespace

OrchestrationService::OrchestrationService(std::shared_ptr<IDeviceApi> api,
                                           std::shared_ptr<IDeviceScanner> scanner,
                                           std::shared_ptr<ISessionStore> store,
                                           std::chrono::milliseconds scanTimeout)
    : api_(std::move(api)),
      scanner_(std::move(scanner)),
      store_(std::move(store)),
      scanTimeout_(scanTimeout) {
    if(!api_ || !scanner_ || !store_) {
        throw LeafError(ErrorKind::PRECONDITION, "OrchestrationService requires a device API, a scanner and a session store");
    }
}

template<typename Body>
ServiceResult OrchestrationService::runGuarded(const std::string& failurePrefix, Body&& body) {
    try {
        return body();
    } catch(const LeafError& e) {
        LOG_WARN(failurePrefix, e.what(), " [", errorKindName(e.kind()), "]");
        return ServiceResult::failure(e.kind(), failurePrefix + e.getMessage());
    } catch(const std::exception& e) {
        LOG_ERROR(failurePrefix, "unexpected exception: ", e.what());
        return ServiceResult::failure(ErrorKind::TRANSPORT, failurePrefix + e.what());
    }
}

// =================== 扫描与配对 ===================

ServiceResult OrchestrationService::scan(const CancellationToken& ctx) {
    return runGuarded("Scan failed: ", [&]() {
        LOG_INFO("Scanning for devices (timeout ", scanTimeout_.count(), " ms)");
        auto addresses = scanner_->scan(ctx.childWithTimeout(scanTimeout_));

        if(addresses.empty()) {
            LOG_INFO("No devices detected");
            return ServiceResult::failure(ErrorKind::NONE, "No devices detected", AddressList{});
        }

        // 扫描结果按主机号升序，取第一个；同一地址不重置已有的配对
        const std::string& target = addresses.front();
        if(session_.getAddress() != target) {
            session_.setAddress(target);
        }

        std::string message = "Found " + std::to_string(addresses.size()) + " device(s)";
        LOG_INFO(message, ", selected ", target);
        return ServiceResult::ok(message, AddressList{addresses});
    });
}

ServiceResult OrchestrationService::pair(const CancellationToken& ctx, const std::string& address) {
    if(address.empty()) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNoAddressMessage);
    }

    return runGuarded("Pairing failed: ", [&]() {
        LOG_INFO("Pairing with ", address);
        std::string credential = api_->pair(address, ctx);
        if(credential.empty()) {
            throw LeafError(ErrorKind::TRANSPORT, "device returned an empty credential");
        }

        if(session_.getAddress() != address) {
            session_.setAddress(address);
        }
        session_.commit(credential);

        std::string message = "Device paired successfully";
        try {
            store_->save(address, credential);
        } catch(const std::exception& e) {
            // 保存失败不影响已完成的配对
            LOG_WARN("Paired with ", address, " but failed to save configuration: ", e.what());
            message += std::string(" (warning: failed to save configuration: ") + e.what() + ")";
        }

        LOG_INFO(message);
        return ServiceResult::ok(message, Credential{credential});
    });
}

ServiceResult OrchestrationService::pair(const CancellationToken& ctx) {
    return pair(ctx, session_.getAddress());
}

// =================== 设备控制 ===================

ServiceResult OrchestrationService::setPower(const CancellationToken& ctx, const std::string& address,
                                             const std::string& credential, bool on) {
    if(!hasPairing(address, credential)) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNotPairedMessage);
    }

    std::string action = on ? "on" : "off";
    return runGuarded("Failed to turn " + action + " device: ", [&]() {
        api_->setPower(address, credential, on, ctx);
        return ServiceResult::ok("Device turned " + action + " successfully");
    });
}

ServiceResult OrchestrationService::setPower(const CancellationToken& ctx, bool on) {
    return setPower(ctx, session_.getAddress(), session_.getCredential(), on);
}

ServiceResult OrchestrationService::setBrightness(const CancellationToken& ctx, const std::string& address,
                                                  const std::string& credential, int level) {
    if(!hasPairing(address, credential)) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNotPairedMessage);
    }
    if(level < kMinBrightness || level > kMaxBrightness) {
        return ServiceResult::failure(ErrorKind::PRECONDITION,
                                      "Brightness must be between " + std::to_string(kMinBrightness) +
                                      " and " + std::to_string(kMaxBrightness) + ", got " + std::to_string(level));
    }

    return runGuarded("Failed to set device brightness: ", [&]() {
        api_->setBrightness(address, credential, level, ctx);
        return ServiceResult::ok("Brightness set to " + std::to_string(level) + " successfully");
    });
}

ServiceResult OrchestrationService::setBrightness(const CancellationToken& ctx, int level) {
    return setBrightness(ctx, session_.getAddress(), session_.getCredential(), level);
}

ServiceResult OrchestrationService::getInfo(const CancellationToken& ctx, const std::string& address,
                                            const std::string& credential) {
    if(!hasPairing(address, credential)) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNotPairedMessage);
    }

    return runGuarded("Failed to get device info: ", [&]() {
        DeviceInfo info = api_->getInfo(address, credential, ctx);
        return ServiceResult::ok("Device info retrieved successfully", std::move(info));
    });
}

ServiceResult OrchestrationService::getInfo(const CancellationToken& ctx) {
    return getInfo(ctx, session_.getAddress(), session_.getCredential());
}

// =================== 灯效 ===================

ServiceResult OrchestrationService::listEffects(const CancellationToken& ctx, const std::string& address,
                                                const std::string& credential) {
    if(!hasPairing(address, credential)) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNotPairedMessage);
    }

    return runGuarded("Failed to list effects: ", [&]() {
        auto effects = api_->listEffects(address, credential, ctx);
        if(address == session_.getAddress()) {
            cacheEffects(address, effects);
        }
        std::string message = "Found " + std::to_string(effects.size()) + " effect(s)";
        return ServiceResult::ok(message, EffectList{std::move(effects)});
    });
}

ServiceResult OrchestrationService::listEffects(const CancellationToken& ctx) {
    return listEffects(ctx, session_.getAddress(), session_.getCredential());
}

ServiceResult OrchestrationService::setEffect(const CancellationToken& ctx, const std::string& address,
                                              const std::string& credential, const std::string& effect) {
    if(!hasPairing(address, credential)) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNotPairedMessage);
    }
    if(effect.empty()) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, "No effect name provided");
    }
    if(address == cachedEffectsAddress_ &&
       std::find(cachedEffects_.begin(), cachedEffects_.end(), effect) == cachedEffects_.end()) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, "Unknown effect '" + effect + "'");
    }

    return runGuarded("Failed to set effect: ", [&]() {
        api_->setEffect(address, credential, effect, ctx);
        return ServiceResult::ok("Effect set to " + effect + " successfully");
    });
}

ServiceResult OrchestrationService::setEffect(const CancellationToken& ctx, const std::string& effect) {
    return setEffect(ctx, session_.getAddress(), session_.getCredential(), effect);
}

void OrchestrationService::cacheEffects(const std::string& address, std::vector<std::string> effects) {
    cachedEffectsAddress_ = address;
    cachedEffects_ = std::move(effects);
    LOG_DEBUG("Cached ", cachedEffects_.size(), " effect(s) for ", address);
}

void OrchestrationService::clearEffectCache() {
    cachedEffectsAddress_.clear();
    cachedEffects_.clear();
}

// =================== 会话管理 ===================

ServiceResult OrchestrationService::loadConfiguration() {
    return runGuarded("Failed to load configuration: ", [&]() {
        bool saved = false;
        DeviceConfig config;
        try {
            saved = store_->exists();
            if(saved) {
                config = store_->load();
            }
        } catch(const LeafError&) {
            throw;
        } catch(const std::exception& e) {
            throw LeafError(ErrorKind::PERSISTENCE, e.what());
        }

        if(!saved) {
            return ServiceResult::failure(ErrorKind::PRECONDITION, "No saved configuration found");
        }

        if(config.address != session_.getAddress()) {
            clearEffectCache();
        }
        session_.hydrate(config);
        LOG_INFO("Loaded saved session for ", config.address);
        return ServiceResult::ok("Configuration loaded successfully", config);
    });
}

ServiceResult OrchestrationService::checkReadiness(const CancellationToken& ctx) {
    if(!session_.isPaired()) {
        return ServiceResult::failure(ErrorKind::PRECONDITION, kNotPairedMessage);
    }

    const std::string address = session_.getAddress();
    const std::string credential = session_.getCredential();

    ServiceResult result = runGuarded("Device not reachable: ", [&]() {
        DeviceInfo info = api_->getInfo(address, credential, ctx);
        return ServiceResult::ok("Device is ready", std::move(info));
    });
    session_.markReady(result.success);

    if(result.success) {
        try {
            cacheEffects(address, api_->listEffects(address, credential, ctx));
        } catch(const std::exception& e) {
            LOG_WARN("Device ", address, " is ready but listing effects failed: ", e.what());
        }
    }
    return result;
}

ServiceResult OrchestrationService::disconnect() {
    session_.clear();
    clearEffectCache();
    LOG_INFO("Session cleared");
    return ServiceResult::ok("Disconnected");
}
