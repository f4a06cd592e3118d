#include <string>

#include <gtest/gtest.h>

#include <topology/device/loopback_device.hh>

TEST(loopback_device, errors) {
    topod::loopback_device device("deviceA");
    try {
        device.ports();
        FAIL() << "ports() succeeded before connect()";
    } catch (const topod::device_error& err) {
        EXPECT_EQ("deviceA", err.device());
        EXPECT_EQ("ports", err.operation());
        EXPECT_EQ(std::string("deviceA: ports: not connected"), err.what());
    }
    device.fail_connect(1);
    try {
        device.connect();
        FAIL() << "connect() did not fail";
    } catch (const topod::device_error& err) {
        EXPECT_EQ("connect", err.operation());
        EXPECT_EQ(std::string("deviceA: connect: connection refused"), err.what());
    }
    device.connect();
    EXPECT_EQ(1, device.num_connects());
    topod::packet_out packet;
    packet.egress_port = 1;
    try {
        device.emit(packet);
        FAIL() << "emit() succeeded without arbitration";
    } catch (const topod::device_error& err) {
        EXPECT_EQ("emit", err.operation());
    }
    EXPECT_TRUE(device.arbitrate(1));
    device.install_intercept_rules();
    device.close();
    EXPECT_THROW(device.pipeline(), topod::device_error);
}
