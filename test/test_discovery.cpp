// test/test_discovery.cpp

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "discovery.h"
#include "fake_transport.h"
#include "manual_scheduler.h"

using namespace GridLink;
using namespace std::chrono_literals;
using Testing::FakeTransport;
using Testing::ManualScheduler;

namespace {

Arguments device_reply(const std::string& id, const std::string& name, int port) {
    return Arguments{id, name, port};
}

Discovery::Request lan_request() {
    Discovery::Request request;
    request.host = "192.168.1.5";
    request.me = "192.168.1.10";
    request.port = 12002;
    request.window = 1000ms;
    return request;
}

} // namespace

class DiscoveryTest : public ::testing::Test {
protected:
    FakeTransport transport_;
    ManualScheduler scheduler_;
    std::vector<DeviceIdentity> found_;

    Discovery::DeviceCallback collect() {
        return [this](const DeviceIdentity& device) { found_.push_back(device); };
    }
};

TEST_F(DiscoveryTest, SendsListRequestWithReplyAddress) {
    Discovery::list_devices(transport_, scheduler_, lan_request(), collect());

    auto sent = transport_.sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].host, "192.168.1.5");
    EXPECT_EQ(sent[0].port, 12002);
    EXPECT_EQ(sent[0].message.address(), "/serialosc/list");
    EXPECT_EQ(Args::get_string(sent[0].message.args(), 0), "192.168.1.10");
    EXPECT_EQ(Args::get_int(sent[0].message.args(), 1), transport_.last_receiver_port());
}

TEST_F(DiscoveryTest, ReplyBecomesDeviceIdentityOnRequestedHost) {
    Discovery::list_devices(transport_, scheduler_, lan_request(), collect());
    int reply_port = transport_.last_receiver_port();

    ASSERT_TRUE(transport_.deliver(reply_port, "192.168.1.5:12002", "/serialosc/device",
                                   device_reply("m0", "monome128", 13000)));

    ASSERT_EQ(found_.size(), 1u);
    EXPECT_EQ(found_[0], (DeviceIdentity{"m0", "monome128", "192.168.1.5", 13000}));
}

TEST_F(DiscoveryTest, OnlyRepliesInsideTheWindowAreReported) {
    Discovery::list_devices(transport_, scheduler_, lan_request(), collect());
    int reply_port = transport_.last_receiver_port();

    transport_.deliver(reply_port, "", "/serialosc/device", device_reply("m0", "monome128", 13000));
    scheduler_.advance(400ms);
    transport_.deliver(reply_port, "", "/serialosc/device", device_reply("m1", "monome64", 13001));
    scheduler_.advance(600ms);

    EXPECT_FALSE(transport_.deliver(reply_port, "", "/serialosc/device",
                                    device_reply("m2", "arc4", 13002)));

    ASSERT_EQ(found_.size(), 2u);
    EXPECT_EQ(found_[0].id, "m0");
    EXPECT_EQ(found_[1].id, "m1");
}

TEST_F(DiscoveryTest, WindowEndClosesChannel) {
    Discovery::list_devices(transport_, scheduler_, lan_request(), collect());
    int reply_port = transport_.last_receiver_port();

    EXPECT_TRUE(transport_.is_open(reply_port));
    EXPECT_EQ(transport_.open_transmitters(), 1u);

    scheduler_.advance(999ms);
    EXPECT_TRUE(transport_.is_open(reply_port));

    scheduler_.advance(1ms);
    EXPECT_FALSE(transport_.is_open(reply_port));
    EXPECT_EQ(transport_.open_transmitters(), 0u);
    EXPECT_EQ(scheduler_.pending(), 0u);
}

TEST_F(DiscoveryTest, MalformedAndUnrelatedRepliesAreIgnored) {
    Discovery::list_devices(transport_, scheduler_, lan_request(), collect());
    int reply_port = transport_.last_receiver_port();

    transport_.deliver(reply_port, "", "/serialosc/device", Arguments{std::string("m0")});
    transport_.deliver(reply_port, "", "/serialosc/device", Arguments{1, 2, 3});
    transport_.deliver(reply_port, "", "/serialosc/add", device_reply("m0", "monome128", 13000));
    transport_.deliver(reply_port, "", "/serialosc/device", device_reply("m1", "monome64", 13001));

    ASSERT_EQ(found_.size(), 1u);
    EXPECT_EQ(found_[0].id, "m1");
}

TEST_F(DiscoveryTest, FailingCallbackDoesNotStopLaterReplies) {
    int calls = 0;
    Discovery::list_devices(transport_, scheduler_, lan_request(),
        [&calls](const DeviceIdentity&) {
            ++calls;
            throw std::runtime_error("callback failed");
        });
    int reply_port = transport_.last_receiver_port();

    transport_.deliver(reply_port, "", "/serialosc/device", device_reply("m0", "monome128", 13000));
    transport_.deliver(reply_port, "", "/serialosc/device", device_reply("m1", "monome64", 13001));

    EXPECT_EQ(calls, 2);
}

TEST_F(DiscoveryTest, ListPropertiesInterrogatesDevice) {
    std::vector<DeviceProperty> properties;

    Discovery::Request request = lan_request();
    request.port = 13000;

    Discovery::list_properties(transport_, scheduler_, request,
        [&properties](const DeviceProperty& property) { properties.push_back(property); });
    int reply_port = transport_.last_receiver_port();

    auto sent = transport_.sent_to("192.168.1.5", 13000);
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].message, (Message("/sys/info", {std::string("192.168.1.10"), reply_port})));

    transport_.deliver(reply_port, "", "/sys/id", Arguments{std::string("m0")});
    transport_.deliver(reply_port, "", "/sys/size", Arguments{16, 8});
    scheduler_.advance(1000ms);
    transport_.deliver(reply_port, "", "/sys/rotation", Arguments{0});

    ASSERT_EQ(properties.size(), 2u);
    EXPECT_EQ(properties[0].key, "/sys/id");
    EXPECT_EQ(properties[1].key, "/sys/size");
    EXPECT_EQ(properties[1].value, (Arguments{16, 8}));
}
