#include "core/DeviceSession.hpp"
#include "core/LeafError.hpp"
#include "utils/Logger.hpp"

void DeviceSession::setAddress(const std::string& address) {
    config_.address = address;
    config_.credential.clear();
    ready_ = false;

    if(address.empty()) {
        setState(SessionState::UNCONFIGURED);
        return;
    }

    LOG_DEBUG("Session target set to ", address);
    setState(SessionState::CONFIGURED);
}

void DeviceSession::commit(const std::string& credential) {
    if(config_.address.empty()) {
        throw LeafError(ErrorKind::PRECONDITION, "cannot commit credential: no device address set");
    }
    if(credential.empty()) {
        throw LeafError(ErrorKind::PRECONDITION, "cannot commit an empty credential");
    }

    config_.credential = credential;
    ready_ = false;
    setState(SessionState::PAIRED);
}

void DeviceSession::hydrate(const DeviceConfig& config) {
    setAddress(config.address);
    commit(config.credential);
}

void DeviceSession::clear() {
    config_ = DeviceConfig{};
    ready_ = false;
    setState(SessionState::UNCONFIGURED);
}

void DeviceSession::markReady(bool ready) {
    if(ready && state_ != SessionState::PAIRED) {
        LOG_WARN("Ignoring readiness for a session that is not paired");
        return;
    }
    if(ready_ != ready) {
        LOG_DEBUG("Session readiness: ", ready_, " -> ", ready);
    }
    ready_ = ready;
}

std::string DeviceSession::getStateName(SessionState state) {
    switch(state) {
        case SessionState::UNCONFIGURED: return "UNCONFIGURED";
        case SessionState::CONFIGURED:   return "CONFIGURED";
        case SessionState::PAIRED:       return "PAIRED";
        default:                         return "UNKNOWN";
    }
}

void DeviceSession::setState(SessionState newState) {
    SessionState oldState = state_;
    state_ = newState;

    // PAIRED -> PAIRED（重新配对）也通知观察者，凭据已变化
    if(oldState != newState || newState == SessionState::PAIRED) {
        LOG_DEBUG("Session state changed: ", getStateName(oldState), " -> ", getStateName(newState));
        if(stateCallback_) {
            stateCallback_(oldState, newState);
        }
    }
}
