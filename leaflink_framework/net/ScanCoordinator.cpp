#include "net/ScanCoordinator.hpp"
#include "net/SubnetDetector.hpp"
#include "core/LeafError.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"

#include <condition_variable>
#include <mutex>

namespace {

constexpr std::chrono::milliseconds kDispatchSlice{20};
constexpr std::chrono::milliseconds kCollectSlice{20};

/**
 * @brief 工作线程共享的报告汇总，唯一需要加锁的共享结构
 */
class ScanReportCollector {
public:
    ScanReportCollector(std::string prefix, int expected)
        : prefix_(std::move(prefix)), expected_(expected) {}

    void reportFound(int suffix) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            found_.insert(DiscoveredAddress{prefix_, suffix});
            ++reports_;
        }
        condition_.notify_all();
    }

    void reportMissing() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reports_;
        }
        condition_.notify_all();
    }

    // 探测被取消打断，这份"未找到"不可信
    void reportAborted() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reports_;
            ++aborted_;
        }
        condition_.notify_all();
    }

    void reportError(int suffix, const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++reports_;
            if(firstError_.empty()) {
                firstError_ = prefix_ + std::to_string(suffix) + ": " + message;
            }
        }
        condition_.notify_all();
    }

    /**
     * @brief 等待收齐全部报告
     * @return 收齐且没有被取消打断的探测返回 true
     */
    bool waitForAll(const CancellationToken& token) {
        std::unique_lock<std::mutex> lock(mutex_);
        while(reports_ < expected_) {
            if(aborted_ > 0 || token.isCancelled()) {
                return false;
            }
            condition_.wait_for(lock, kCollectSlice);
        }
        return aborted_ == 0;
    }

    int reports() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return reports_;
    }

    std::string firstError() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return firstError_;
    }

    std::set<DiscoveredAddress> found() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return found_;
    }

private:
    const std::string prefix_;
    const int expected_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::set<DiscoveredAddress> found_;
    int reports_ = 0;
    int aborted_ = 0;
    std::string firstError_;
};

}  // namespace

ScanCoordinator::ScanCoordinator(std::shared_ptr<IConnector> connector, size_t workerCount,
                                 std::chrono::milliseconds probeTimeout)
    : connector_(std::move(connector)), workerCount_(workerCount > 0 ? workerCount : 1), probeTimeout_(probeTimeout) {
    if(!connector_) {
        throw LeafError(ErrorKind::PRECONDITION, "ScanCoordinator requires a connector");
    }
}

std::set<DiscoveredAddress> ScanCoordinator::scan(const std::string& prefix, const CancellationToken& token) {
    // 前缀必须是合法的三段式 "a.b.c."
    std::string normalized;
    try {
        normalized = SubnetDetector::prefixOf(prefix + "1");
    } catch(const LeafError&) {
        throw LeafError(ErrorKind::PRECONDITION, "invalid scan prefix: '" + prefix + "'");
    }
    if(normalized != prefix) {
        throw LeafError(ErrorKind::PRECONDITION, "invalid scan prefix: '" + prefix + "'");
    }

    LOG_INFO("Scanning ", prefix, protocol::kFirstHostSuffix, "-", protocol::kLastHostSuffix,
             " on port ", protocol::kDevicePort, " with ", workerCount_, " workers");
    auto start = std::chrono::steady_clock::now();

    ScanReportCollector collector(prefix, protocol::kHostCount);
    bool completed = false;
    {
        // 队列容量等于线程数，分发循环在队列满时阻塞
        utils::ThreadPool pool(workerCount_, workerCount_);

        for(int suffix = protocol::kFirstHostSuffix; suffix <= protocol::kLastHostSuffix; ++suffix) {
            auto job = [this, &collector, &token, &prefix, suffix] {
                if(token.isCancelled()) {
                    collector.reportAborted();
                    return;
                }
                std::string address = prefix + std::to_string(suffix);
                try {
                    if(connector_->probe(address, protocol::kDevicePort, probeTimeout_, token)) {
                        LOG_DEBUG("Device port open on ", address);
                        collector.reportFound(suffix);
                    } else if(token.isCancelled()) {
                        collector.reportAborted();
                    } else {
                        collector.reportMissing();
                    }
                } catch(const std::exception& e) {
                    collector.reportError(suffix, e.what());
                }
            };

            bool queued = false;
            while(!queued && !token.isCancelled()) {
                queued = pool.submitFor(job, kDispatchSlice);
            }
            if(!queued) {
                LOG_DEBUG("Dispatch stopped at suffix ", suffix, ": ", CancellationToken::reasonText(token.reason()));
                break;
            }
        }

        completed = collector.waitForAll(token);
        size_t discarded = pool.shutdown(!completed);
        pool.join();
        if(discarded > 0) {
            LOG_DEBUG("Discarded ", discarded, " queued probe(s)");
        }
    }

    auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if(!completed) {
        auto reason = token.isCancelled() ? token.reason() : CancellationToken::Reason::CANCELLED;
        LOG_WARN("Scan of ", prefix, "0/24 cancelled after ", elapsedMs, " ms (",
                 collector.reports(), "/", protocol::kHostCount, " hosts reported)");
        throw LeafError(ErrorKind::CANCELLED,
                        std::string("scan cancelled before all hosts were probed: ") + CancellationToken::reasonText(reason));
    }

    std::string error = collector.firstError();
    if(!error.empty()) {
        LOG_ERROR("Scan of ", prefix, "0/24 failed: ", error);
        throw LeafError(ErrorKind::TRANSPORT, "probe failed for " + error);
    }

    auto found = collector.found();
    LOG_INFO("Scan of ", prefix, "0/24 finished in ", elapsedMs, " ms, ", found.size(), " device(s) found");
    return found;
}
