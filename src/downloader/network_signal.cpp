/*
 * ferry/src/downloader/network_signal.cpp
 */

#include <ferry/downloader/network_signal.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace ferry::downloader {

namespace fs = std::filesystem;

const char* linkTypeName(LinkType t) noexcept {
    switch (t) {
        case LinkType::Wifi:
            return "wifi";
        case LinkType::Cellular:
            return "cellular";
        case LinkType::Ethernet:
            return "ethernet";
        case LinkType::Unknown:
            return "unknown";
    }
    return "unknown";
}

// ---------- NetworkSignal ----------

NetworkSignal::NetworkSignal(NetworkStatus initial) : status_(initial) {}

NetworkSignal::SubscriptionId NetworkSignal::subscribe(Listener listener) {
    std::lock_guard lk(mutex_);
    const auto id = nextId_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

void NetworkSignal::unsubscribe(SubscriptionId id) {
    // Waits for an in-flight publish so the listener is never invoked afterwards.
    std::lock_guard pl(publishMutex_);
    std::lock_guard lk(mutex_);
    listeners_.erase(id);
}

void NetworkSignal::publish(NetworkStatus status) {
    std::lock_guard pl(publishMutex_);
    std::vector<Listener> targets;
    {
        std::lock_guard lk(mutex_);
        if (status == status_)
            return;
        status_ = status;
        targets.reserve(listeners_.size());
        for (const auto& [id, l] : listeners_)
            targets.push_back(l);
    }
    cv_.notify_all();
    spdlog::info("NetworkSignal: {} ({})", status.connected ? "connected" : "disconnected",
                 linkTypeName(status.link));
    for (const auto& l : targets)
        l(status);
}

NetworkStatus NetworkSignal::status() const {
    std::lock_guard lk(mutex_);
    return status_;
}

bool NetworkSignal::isConnected() const {
    std::lock_guard lk(mutex_);
    return status_.connected;
}

LinkType NetworkSignal::linkType() const {
    std::lock_guard lk(mutex_);
    return status_.link;
}

bool NetworkSignal::shouldProceed(bool allowsCellular) const {
    std::lock_guard lk(mutex_);
    if (!status_.connected)
        return false;
    return allowsCellular || !status_.isExpensive();
}

bool NetworkSignal::waitForConnection(std::chrono::milliseconds timeout) const {
    std::unique_lock lk(mutex_);
    return cv_.wait_for(lk, timeout, [this] { return status_.connected; });
}

// ---------- LinkStateMonitor ----------

LinkStateMonitor::LinkStateMonitor(std::shared_ptr<NetworkSignal> signal,
                               std::chrono::milliseconds interval, fs::path sysfsRoot)
    : signal_(std::move(signal)), interval_(interval), root_(std::move(sysfsRoot)) {}

LinkStateMonitor::~LinkStateMonitor() {
    stop();
}

void LinkStateMonitor::start() {
    if (running_.exchange(true))
        return;
    refresh();
    pollThread_ = std::thread([this] { pollLoop(); });
    spdlog::debug("LinkStateMonitor: polling {} every {}ms", root_.string(), interval_.count());
}

void LinkStateMonitor::stop() {
    if (running_.exchange(false)) {
        cv_.notify_all();
        if (pollThread_.joinable())
            pollThread_.join();
    }
}

void LinkStateMonitor::refresh() {
    if (signal_)
        signal_->publish(readOnce());
}

LinkType LinkStateMonitor::classify(std::string_view name, bool hasWirelessDir) {
    if (hasWirelessDir || name.starts_with("wl"))
        return LinkType::Wifi;
    if (name.starts_with("wwan") || name.starts_with("rmnet") || name.starts_with("ccmni"))
        return LinkType::Cellular;
    if (name.starts_with("en") || name.starts_with("eth"))
        return LinkType::Ethernet;
    return LinkType::Unknown;
}

NetworkStatus LinkStateMonitor::readOnce() const {
    NetworkStatus result{false, LinkType::Unknown};
    std::error_code ec;
    fs::directory_iterator it(root_, ec);
    if (ec) {
        spdlog::debug("LinkStateMonitor: cannot read {}: {}", root_.string(), ec.message());
        return result;
    }

    // Preference when several links are up: ethernet, wifi, unknown, cellular.
    auto rank = [](LinkType t) {
        switch (t) {
            case LinkType::Ethernet:
                return 3;
            case LinkType::Wifi:
                return 2;
            case LinkType::Unknown:
                return 1;
            case LinkType::Cellular:
                return 0;
        }
        return 0;
    };

    for (const auto& entry : it) {
        const auto name = entry.path().filename().string();
        if (name == "lo")
            continue;
        std::ifstream in(entry.path() / "operstate");
        std::string state;
        if (!in || !std::getline(in, state))
            continue;
        if (state != "up")
            continue;
        std::error_code wec;
        const auto type = classify(name, fs::exists(entry.path() / "wireless", wec));
        if (!result.connected || rank(type) > rank(result.link)) {
            result.connected = true;
            result.link = type;
        }
    }
    return result;
}

void LinkStateMonitor::pollLoop() {
    std::unique_lock lk(mutex_);
    while (running_.load()) {
        cv_.wait_for(lk, interval_, [this] { return !running_.load(); });
        if (!running_.load())
            break;
        lk.unlock();
        refresh();
        lk.lock();
    }
}

} // namespace ferry::downloader
