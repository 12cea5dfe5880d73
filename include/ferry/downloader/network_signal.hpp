#pragma once

/*
 * Connectivity publisher.
 *
 * NetworkSignal holds the last known reachability status and notifies
 * subscribers on transitions only. On Linux, LinkStateMonitor feeds it by polling
 * the kernel's per-interface operstate under /sys/class/net.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace ferry::downloader {

enum class LinkType { Wifi, Cellular, Ethernet, Unknown };

const char* linkTypeName(LinkType t) noexcept;

struct NetworkStatus {
    bool connected{true};
    LinkType link{LinkType::Unknown};

    /// Metered links (cellular) may be excluded from bulk transfers by policy.
    [[nodiscard]] bool isExpensive() const noexcept { return link == LinkType::Cellular; }

    bool operator==(const NetworkStatus&) const = default;
};

class NetworkSignal {
public:
    using Listener = std::function<void(const NetworkStatus&)>;
    using SubscriptionId = std::uint64_t;

    explicit NetworkSignal(NetworkStatus initial = {});

    /// Listeners run on the publishing thread, outside the state lock. A listener
    /// must not unsubscribe itself from inside the callback.
    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);

    /// Records the new status; listeners are notified only when it differs.
    void publish(NetworkStatus status);

    [[nodiscard]] NetworkStatus status() const;
    [[nodiscard]] bool isConnected() const;
    [[nodiscard]] LinkType linkType() const;
    [[nodiscard]] bool shouldProceed(bool allowsCellular) const;

    /// Blocks until connected or the timeout elapses. Returns the connected state.
    bool waitForConnection(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::mutex publishMutex_; // keeps transitions delivered in publish order
    NetworkStatus status_;
    std::map<SubscriptionId, Listener> listeners_;
    SubscriptionId nextId_{1};
};

class LinkStateMonitor {
public:
    LinkStateMonitor(std::shared_ptr<NetworkSignal> signal,
                   std::chrono::milliseconds interval = std::chrono::seconds(2),
                   std::filesystem::path sysfsRoot = "/sys/class/net");
    ~LinkStateMonitor();

    LinkStateMonitor(const LinkStateMonitor&) = delete;
    LinkStateMonitor& operator=(const LinkStateMonitor&) = delete;

    void start();
    void stop();
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    /// Reads the current interface table without publishing.
    [[nodiscard]] NetworkStatus readOnce() const;
    /// readOnce() + publish.
    void refresh();

    static LinkType classify(std::string_view interfaceName, bool hasWirelessDir);

private:
    void pollLoop();

    std::shared_ptr<NetworkSignal> signal_;
    std::chrono::milliseconds interval_;
    std::filesystem::path root_;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread pollThread_;
};

} // namespace ferry::downloader
