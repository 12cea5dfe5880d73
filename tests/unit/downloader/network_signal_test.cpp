#include <gtest/gtest.h>
#include <ferry/downloader/network_signal.hpp>

#include "test_support.h"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ferry::downloader;
using namespace ferry::downloader::test;
using namespace std::chrono_literals;

TEST(NetworkSignalTest, NotifiesOnTransitionsOnly) {
    NetworkSignal signal;
    std::vector<NetworkStatus> seen;
    signal.subscribe([&](const NetworkStatus& s) { seen.push_back(s); });

    signal.publish({true, LinkType::Unknown}); // same as initial
    signal.publish({false, LinkType::Unknown});
    signal.publish({false, LinkType::Unknown});
    signal.publish({true, LinkType::Wifi});

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_FALSE(seen[0].connected);
    EXPECT_TRUE(seen[1].connected);
    EXPECT_EQ(seen[1].link, LinkType::Wifi);
    EXPECT_EQ(signal.linkType(), LinkType::Wifi);
}

TEST(NetworkSignalTest, UnsubscribedListenerIsNotCalled) {
    NetworkSignal signal;
    int calls = 0;
    auto id = signal.subscribe([&](const NetworkStatus&) { ++calls; });
    signal.publish({false, LinkType::Unknown});
    signal.unsubscribe(id);
    signal.publish({true, LinkType::Unknown});
    EXPECT_EQ(calls, 1);
}

TEST(NetworkSignalTest, CellularPolicy) {
    NetworkSignal signal({true, LinkType::Cellular});
    EXPECT_TRUE(signal.status().isExpensive());
    EXPECT_TRUE(signal.shouldProceed(true));
    EXPECT_FALSE(signal.shouldProceed(false));

    signal.publish({true, LinkType::Wifi});
    EXPECT_TRUE(signal.shouldProceed(false));

    signal.publish({false, LinkType::Unknown});
    EXPECT_FALSE(signal.shouldProceed(true));
}

TEST(NetworkSignalTest, WaitForConnection) {
    auto signal = std::make_shared<NetworkSignal>(NetworkStatus{false, LinkType::Unknown});
    EXPECT_FALSE(signal->waitForConnection(20ms));

    std::thread publisher([&] {
        std::this_thread::sleep_for(30ms);
        signal->publish({true, LinkType::Ethernet});
    });
    EXPECT_TRUE(signal->waitForConnection(2s));
    publisher.join();
}

TEST(LinkStateMonitorTest, ClassifiesInterfaceNames) {
    EXPECT_EQ(LinkStateMonitor::classify("wlan0", false), LinkType::Wifi);
    EXPECT_EQ(LinkStateMonitor::classify("foo0", true), LinkType::Wifi);
    EXPECT_EQ(LinkStateMonitor::classify("wwan0", false), LinkType::Cellular);
    EXPECT_EQ(LinkStateMonitor::classify("rmnet_data0", false), LinkType::Cellular);
    EXPECT_EQ(LinkStateMonitor::classify("enp3s0", false), LinkType::Ethernet);
    EXPECT_EQ(LinkStateMonitor::classify("eth0", false), LinkType::Ethernet);
    EXPECT_EQ(LinkStateMonitor::classify("tun0", false), LinkType::Unknown);
}

TEST(LinkStateMonitorTest, ReadsOperstateFromSysfsTree) {
    TempDir tmp;
    write_file(tmp.path / "lo" / "operstate", "unknown\n");
    write_file(tmp.path / "wwan0" / "operstate", "up\n");
    write_file(tmp.path / "eth0" / "operstate", "down\n");

    auto signal = std::make_shared<NetworkSignal>();
    LinkStateMonitor monitor(signal, 1h, tmp.path);
    auto status = monitor.readOnce();
    EXPECT_TRUE(status.connected);
    EXPECT_EQ(status.link, LinkType::Cellular);

    write_file(tmp.path / "eth0" / "operstate", "up\n");
    monitor.refresh();
    EXPECT_EQ(signal->linkType(), LinkType::Ethernet);

    write_file(tmp.path / "eth0" / "operstate", "down\n");
    write_file(tmp.path / "wwan0" / "operstate", "down\n");
    monitor.refresh();
    EXPECT_FALSE(signal->isConnected());
}

TEST(LinkStateMonitorTest, MissingRootReportsDisconnected) {
    auto signal = std::make_shared<NetworkSignal>();
    LinkStateMonitor monitor(signal, 1h, "/nonexistent/ferry/sys/class/net");
    EXPECT_FALSE(monitor.readOnce().connected);
}

TEST(LinkStateMonitorTest, StartPublishesAndStopJoins) {
    TempDir tmp;
    write_file(tmp.path / "wlan0" / "operstate", "up\n");
    auto signal = std::make_shared<NetworkSignal>(NetworkStatus{false, LinkType::Unknown});
    LinkStateMonitor monitor(signal, 10ms, tmp.path);
    monitor.start();
    EXPECT_TRUE(monitor.isRunning());
    EXPECT_TRUE(signal->isConnected());

    write_file(tmp.path / "wlan0" / "operstate", "down\n");
    EXPECT_TRUE(wait_until([&] { return !signal->isConnected(); }));
    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());
}
