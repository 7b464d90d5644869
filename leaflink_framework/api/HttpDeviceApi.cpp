#include "api/HttpDeviceApi.hpp"
#include "core/LeafError.hpp"
#include "net/DeviceProtocol.hpp"
#include "utils/Logger.hpp"

#include <sstream>

HttpDeviceApi::HttpDeviceApi(std::shared_ptr<IHttpClient> httpClient, std::chrono::milliseconds requestTimeout)
    : httpClient_(std::move(httpClient)), requestTimeout_(requestTimeout) {
    if(!httpClient_) {
        throw LeafError(ErrorKind::PRECONDITION, "HttpDeviceApi requires an HTTP client");
    }
}

std::string HttpDeviceApi::baseUrl(const std::string& address) {
    if(address.rfind("http", 0) == 0) {
        return address.back() == '/' ? address : address + "/";
    }
    return "http://" + address + ":" + std::to_string(protocol::kDevicePort) + "/";
}

std::string HttpDeviceApi::pair(const std::string& address, const CancellationToken& token) {
    auto response = execute("pairing", "POST", baseUrl(address) + "api/v1/new", nullptr, 200, token);

    Json::Value root = parseBody("pairing", response.body);
    if(!root.isObject() || !root.isMember("auth_token") || !root["auth_token"].isString()) {
        throw LeafError(ErrorKind::TRANSPORT, "pairing response carries no auth_token");
    }
    std::string credential = root["auth_token"].asString();
    if(credential.empty()) {
        throw LeafError(ErrorKind::TRANSPORT, "pairing response carries an empty auth_token");
    }

    LOG_INFO("Device ", address, " issued a new auth token");
    return credential;
}

DeviceInfo HttpDeviceApi::getInfo(const std::string& address, const std::string& credential,
                                  const CancellationToken& token) {
    auto response = execute("getinfo", "GET", baseUrl(address) + "api/v1/" + credential, nullptr, 200, token);

    Json::Value root = parseBody("getinfo", response.body);
    if(!root.isObject()) {
        throw LeafError(ErrorKind::TRANSPORT, "getinfo response is not a JSON object");
    }
    return flatten(root);
}

void HttpDeviceApi::setPower(const std::string& address, const std::string& credential, bool on,
                             const CancellationToken& token) {
    Json::Value body;
    body["on"]["value"] = on;
    execute("power", "PUT", baseUrl(address) + "api/v1/" + credential + "/state", &body, 204, token);
}

void HttpDeviceApi::setBrightness(const std::string& address, const std::string& credential, int level,
                                  const CancellationToken& token) {
    Json::Value body;
    body["brightness"]["value"] = level;
    execute("brightness", "PUT", baseUrl(address) + "api/v1/" + credential + "/state", &body, 204, token);
}

std::vector<std::string> HttpDeviceApi::listEffects(const std::string& address, const std::string& credential,
                                                    const CancellationToken& token) {
    auto response = execute("effects", "GET", baseUrl(address) + "api/v1/" + credential + "/effects/effectsList",
                            nullptr, 200, token);

    Json::Value root = parseBody("effects", response.body);
    if(!root.isArray()) {
        throw LeafError(ErrorKind::TRANSPORT, "effects response is not a JSON array");
    }

    std::vector<std::string> effects;
    for(const auto& item : root) {
        if(item.isString()) {
            effects.push_back(item.asString());
        }
    }
    return effects;
}

void HttpDeviceApi::setEffect(const std::string& address, const std::string& credential, const std::string& effect,
                              const CancellationToken& token) {
    Json::Value body;
    body["select"] = effect;
    execute("effect", "PUT", baseUrl(address) + "api/v1/" + credential + "/effects", &body, 204, token);
}

DeviceInfo HttpDeviceApi::flatten(const Json::Value& root) {
    DeviceInfo info;
    flattenInto(root, "", info);
    return info;
}

void HttpDeviceApi::flattenInto(const Json::Value& node, const std::string& prefix, DeviceInfo& out) {
    if(node.isObject()) {
        for(const auto& name : node.getMemberNames()) {
            flattenInto(node[name], prefix.empty() ? name : prefix + "." + name, out);
        }
        return;
    }
    if(node.isArray()) {
        for(Json::ArrayIndex i = 0; i < node.size(); ++i) {
            std::string index = std::to_string(i);
            flattenInto(node[i], prefix.empty() ? index : prefix + "." + index, out);
        }
        return;
    }
    if(prefix.empty()) {
        return;
    }
    out[prefix] = node.isNull() ? "" : node.asString();
}

HttpResponse HttpDeviceApi::execute(const std::string& operation, const std::string& method, const std::string& url,
                                    const Json::Value* body, int expectedStatus, const CancellationToken& token) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    request.timeout = requestTimeout_;
    if(body) {
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "";
        request.body = Json::writeString(builder, *body);
        request.headers["Content-Type"] = "application/json";
    }

    HttpResponse response;
    try {
        response = httpClient_->send(request, token);
    } catch(const LeafError& e) {
        LOG_WARN(operation, " request failed: ", e.what());
        throw LeafError(e.kind(), operation + " request failed: " + e.getMessage());
    }

    if(response.statusCode != expectedStatus) {
        std::ostringstream message;
        message << operation << " failed with status " << response.statusCode << ": " << response.body;
        LOG_WARN(message.str());
        throw LeafError(ErrorKind::TRANSPORT, message.str());
    }
    return response;
}

Json::Value HttpDeviceApi::parseBody(const std::string& operation, const std::string& body) {
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    std::istringstream stream(body);
    if(!Json::parseFromStream(builder, stream, &root, &errs)) {
        throw LeafError(ErrorKind::TRANSPORT, "failed to parse " + operation + " response: " + errs);
    }
    return root;
}
