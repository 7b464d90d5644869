#include "net/NetworkScanner.hpp"
#include "net/AsioConnector.hpp"
#include "net/SubnetDetector.hpp"

NetworkScanner::NetworkScanner()
    : NetworkScanner(std::make_shared<AsioConnector>(), [] { return SubnetDetector::detect(); }) {}

NetworkScanner::NetworkScanner(std::shared_ptr<IConnector> connector, PrefixProvider prefixProvider)
    : coordinator_(std::move(connector)), prefixProvider_(std::move(prefixProvider)) {}

std::vector<std::string> NetworkScanner::scan(const CancellationToken& token) {
    std::string prefix = prefixProvider_();

    std::vector<std::string> addresses;
    for(const auto& found : coordinator_.scan(prefix, token)) {
        addresses.push_back(found.toString());
    }
    return addresses;
}
