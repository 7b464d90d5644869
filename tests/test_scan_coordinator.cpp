#include "net/NetworkScanner.hpp"
#include "net/ScanCoordinator.hpp"
#include "TestDoubles.hpp"
#include <gtest/gtest.h>

using namespace std::chrono_literals;

class ScanCoordinatorTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeConnector> connector = std::make_shared<FakeConnector>();
};

TEST_F(ScanCoordinatorTest, ProbesEveryHostOnDevicePort) {
    ScanCoordinator coordinator(connector);
    auto found = coordinator.scan("192.168.1.", CancellationToken::withTimeout(10s));

    EXPECT_TRUE(found.empty());
    EXPECT_EQ(connector->probeCount.load(), protocol::kHostCount);
    EXPECT_EQ(connector->ports(), std::set<uint16_t>{protocol::kDevicePort});
    EXPECT_EQ(connector->timeouts(), std::set<long long>{protocol::kProbeTimeout.count()});
}

TEST_F(ScanCoordinatorTest, ReturnsReachableHostsOrderedBySuffix) {
    connector->openSuffixes = {200, 5, 42};
    ScanCoordinator coordinator(connector);
    auto found = coordinator.scan("10.0.0.", CancellationToken::withTimeout(10s));

    std::vector<std::string> addresses;
    for(const auto& address : found) {
        addresses.push_back(address.toString());
    }
    EXPECT_EQ(addresses, (std::vector<std::string>{"10.0.0.5", "10.0.0.42", "10.0.0.200"}));
}

TEST_F(ScanCoordinatorTest, EveryHostReachableYieldsNoDuplicates) {
    for(int suffix = 1; suffix <= 254; ++suffix) {
        connector->openSuffixes.insert(suffix);
    }
    ScanCoordinator coordinator(connector);
    auto found = coordinator.scan("172.16.3.", CancellationToken::withTimeout(10s));

    EXPECT_EQ(found.size(), 254u);
    EXPECT_EQ(found.begin()->toString(), "172.16.3.1");
    EXPECT_EQ(found.rbegin()->toString(), "172.16.3.254");
}

TEST_F(ScanCoordinatorTest, WorkerPoolBoundsConcurrency) {
    connector->probeDelay = 5ms;
    ScanCoordinator coordinator(connector, 8);
    coordinator.scan("192.168.1.", CancellationToken::withTimeout(10s));

    EXPECT_LE(connector->maxInFlight.load(), 8);
    EXPECT_EQ(connector->probeCount.load(), protocol::kHostCount);
}

// 截止时间不足以探测全部主机：只能得到取消错误，不能得到部分结果
TEST_F(ScanCoordinatorTest, ShortDeadlineCancelsWholeScan) {
    connector->openSuffixes = {1, 2, 3};
    connector->probeDelay = 300ms;
    ScanCoordinator coordinator(connector);

    try {
        coordinator.scan("192.168.1.", CancellationToken::withTimeout(100ms));
        FAIL() << "expected CANCELLED";
    } catch(const LeafError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CANCELLED);
    }
    EXPECT_EQ(connector->inFlight.load(), 0);
}

TEST_F(ScanCoordinatorTest, ExplicitCancelStopsScan) {
    connector->probeDelay = 300ms;
    ScanCoordinator coordinator(connector);
    CancellationToken token;
    token.cancel();

    try {
        coordinator.scan("192.168.1.", token);
        FAIL() << "expected CANCELLED";
    } catch(const LeafError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CANCELLED);
    }
    EXPECT_EQ(connector->inFlight.load(), 0);
    EXPECT_LT(connector->probeCount.load(), protocol::kHostCount);
}

TEST_F(ScanCoordinatorTest, NoProbeInFlightAfterNormalReturn) {
    connector->probeDelay = 2ms;
    ScanCoordinator coordinator(connector);
    coordinator.scan("192.168.1.", CancellationToken::withTimeout(10s));
    EXPECT_EQ(connector->inFlight.load(), 0);
}

TEST_F(ScanCoordinatorTest, LocalProbeFailureFailsWholeScan) {
    connector->openSuffixes = {10};
    connector->failingSuffixes = {77};
    ScanCoordinator coordinator(connector);

    try {
        coordinator.scan("192.168.1.", CancellationToken::withTimeout(10s));
        FAIL() << "expected TRANSPORT";
    } catch(const LeafError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::TRANSPORT);
        EXPECT_NE(std::string(e.what()).find("192.168.1.77"), std::string::npos);
    }
    EXPECT_EQ(connector->probeCount.load(), protocol::kHostCount);
}

TEST_F(ScanCoordinatorTest, RejectsMalformedPrefix) {
    ScanCoordinator coordinator(connector);
    for(const std::string prefix : {"", "192.168.1", "192.168.", "a.b.c.", "192.168.1.0."}) {
        try {
            coordinator.scan(prefix, CancellationToken::withTimeout(1s));
            FAIL() << "prefix '" << prefix << "' should be rejected";
        } catch(const LeafError& e) {
            EXPECT_EQ(e.kind(), ErrorKind::PRECONDITION);
        }
    }
    EXPECT_EQ(connector->probeCount.load(), 0);
}

TEST_F(ScanCoordinatorTest, WorkerCountDefaultsAndFloor) {
    EXPECT_EQ(ScanCoordinator(connector).getWorkerCount(), protocol::kScanWorkerCount);
    EXPECT_EQ(ScanCoordinator(connector, 0).getWorkerCount(), 1u);
}

TEST_F(ScanCoordinatorTest, RequiresConnector) {
    EXPECT_THROW(ScanCoordinator(nullptr), LeafError);
}

TEST(NetworkScannerTest, ConvertsResultToAddressStrings) {
    auto connector = std::make_shared<FakeConnector>();
    connector->openSuffixes = {9, 3};
    NetworkScanner scanner(connector, [] { return std::string("10.0.0."); });

    auto addresses = scanner.scan(CancellationToken::withTimeout(10s));
    EXPECT_EQ(addresses, (std::vector<std::string>{"10.0.0.3", "10.0.0.9"}));
}

TEST(NetworkScannerTest, PropagatesMissingInterface) {
    auto connector = std::make_shared<FakeConnector>();
    NetworkScanner scanner(connector, []() -> std::string {
        throw LeafError(ErrorKind::NO_INTERFACE, "no suitable network interface found");
    });

    try {
        scanner.scan(CancellationToken());
        FAIL() << "expected NO_INTERFACE";
    } catch(const LeafError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NO_INTERFACE);
    }
    EXPECT_EQ(connector->probeCount.load(), 0);
}
