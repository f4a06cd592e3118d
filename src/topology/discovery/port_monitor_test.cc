#include <sstream>

#include <gtest/gtest.h>

#include <topology/discovery/port_monitor.hh>

TEST(port_monitor, changes) {
    topod::port_monitor monitor;
    auto changes = monitor.update({{"eth1", 1, "UP", 0}, {"eth2", 2, "DOWN", 0}});
    ASSERT_EQ(2u, changes.size());
    EXPECT_TRUE(changes[0].added());
    EXPECT_TRUE(changes[0].went_up());
    EXPECT_TRUE(changes[1].added());
    EXPECT_FALSE(changes[1].went_down());
    EXPECT_TRUE(monitor.up(1));
    EXPECT_FALSE(monitor.up(2));
    // nothing has changed
    EXPECT_TRUE(monitor.update({{"eth1", 1, "UP", 0}, {"eth2", 2, "DOWN", 0}}).empty());
    changes = monitor.update({{"eth1", 1, "DOWN", 1}, {"eth2", 2, "UP", 1}});
    ASSERT_EQ(2u, changes.size());
    EXPECT_EQ(1u, changes[0].number());
    EXPECT_TRUE(changes[0].went_down());
    EXPECT_EQ(2u, changes[1].number());
    EXPECT_TRUE(changes[1].went_up());
    std::stringstream tmp;
    tmp << changes[0];
    EXPECT_EQ("port 1: UP -> DOWN", tmp.str());
}

TEST(port_monitor, removed) {
    topod::port_monitor monitor;
    monitor.update({{"eth1", 1, "UP", 0}, {"eth2", 2, "UP", 0}});
    auto changes = monitor.update({{"eth2", 2, "UP", 0}});
    ASSERT_EQ(1u, changes.size());
    EXPECT_TRUE(changes[0].removed());
    EXPECT_TRUE(changes[0].went_down());
    EXPECT_EQ(1u, changes[0].number());
    EXPECT_EQ(1u, monitor.size());
}

TEST(port_monitor, flap) {
    topod::port_monitor monitor;
    monitor.update({{"eth1", 1, "UP", 0}});
    // the port went down and up again between two enumerations
    auto changes = monitor.update({{"eth1", 1, "UP", 2}});
    ASSERT_EQ(1u, changes.size());
    EXPECT_FALSE(changes[0].went_down());
    EXPECT_FALSE(changes[0].went_up());
}
