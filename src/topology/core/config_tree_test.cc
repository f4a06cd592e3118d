#include <sstream>
#include <vector>

#include <gtest/gtest.h>

#include <topology/core/config_tree.hh>
#include <topology/core/configurable.hh>
#include <topology/core/error.hh>
#include <topology/test/manual_clock.hh>

using topo::typed_value;

TEST(config_tree, add_get_remove) {
    topo::config_tree tree;
    tree.add("state/link[port=1]/egress-port", typed_value::of_uint(7));
    tree.add("state/link[port=1]/egress-device", typed_value::of_string("b"));
    tree.add("state/link[port=10]/egress-port", typed_value::of_uint(3));
    tree.add("state/links", typed_value{});
    EXPECT_EQ(4u, tree.size());
    EXPECT_EQ(7u, tree.get("state/link[port=1]/egress-port").uint_value());
    EXPECT_TRUE(tree.contains("state/links"));
    EXPECT_THROW(tree.get("state/link[port=2]/egress-port"), topo::error);
    EXPECT_TRUE(tree.remove("state/link[port=1]"));
    EXPECT_FALSE(tree.contains("state/link[port=1]/egress-port"));
    EXPECT_TRUE(tree.contains("state/link[port=10]/egress-port"));
    EXPECT_FALSE(tree.remove("state/link[port=1]"));
}

TEST(config_tree, list) {
    topo::config_tree tree;
    tree.add("config/b", typed_value::of_int(2));
    tree.add("config/a", typed_value::of_int(1));
    tree.add("configuration", typed_value::of_int(3));
    auto all = tree.list("config");
    ASSERT_EQ(2u, all.size());
    EXPECT_EQ("config/a", all[0].path);
    EXPECT_EQ("config/b", all[1].path);
}

TEST(config_tree, subscribe) {
    topo::config_tree tree;
    std::vector<topo::notification> received;
    auto id = tree.subscribe([&received] (const topo::notification& n) {
        received.emplace_back(n);
    });
    EXPECT_EQ(1u, tree.num_subscribers());
    topo::notification n;
    n.updates.emplace_back("config/a", typed_value::of_int(1));
    n.deletes.emplace_back("state/link[port=1]");
    tree.publish(n);
    tree.unsubscribe(id);
    tree.publish(n);
    ASSERT_EQ(1u, received.size());
    EXPECT_EQ(1u, received.front().updates.size());
    EXPECT_EQ("state/link[port=1]", received.front().deletes.front());
    std::stringstream tmp;
    tmp << received.front();
    EXPECT_NE(tmp.str().find("config/a"), std::string::npos) << tmp.str();
}

TEST(config_tree, path_starts_with) {
    EXPECT_TRUE(topo::path_starts_with("config/a", "config"));
    EXPECT_TRUE(topo::path_starts_with("config", "config"));
    EXPECT_FALSE(topo::path_starts_with("configuration", "config"));
    EXPECT_FALSE(topo::path_starts_with("con", "config"));
}

TEST(typed_value, conversions) {
    EXPECT_EQ(5, typed_value::of_uint(5).int_value());
    EXPECT_EQ(5u, typed_value::of_int(5).uint_value());
    EXPECT_THROW(typed_value::of_int(-5).uint_value(), topo::error);
    EXPECT_THROW(typed_value::of_string("5").int_value(), topo::error);
    EXPECT_THROW(typed_value{}.bool_value(), topo::error);
    EXPECT_EQ(typed_value::of_string("a"), typed_value::of_string("a"));
    EXPECT_NE(typed_value::of_int(1), typed_value::of_uint(1));
}

class counting_component: public topo::configurable, public topo::exportable {
public:
    topo::config_tree t;
    int updates = 0;
    int refreshes = 0;
    void update_config() override { ++updates; }
    void refresh_config() override { ++refreshes; }
    topo::config_tree& tree() noexcept override { return t; }
    const topo::config_tree& tree() const noexcept override { return t; }
};

class clock_component: public counting_component {
public:
    topo::clock& c;
    explicit clock_component(topo::clock& rhs): c(rhs) {}
    topo::clock& tree_clock() const noexcept override { return c; }
};

TEST(configurable, apply) {
    counting_component c;
    topo::path_value_array updates;
    updates.emplace_back("config/emitFrequency", typed_value::of_int(10));
    topo::apply(c, c, updates);
    EXPECT_EQ(1, c.updates);
    EXPECT_EQ(10, c.t.get("config/emitFrequency").int_value());
    updates.emplace_back("state/agent-id", typed_value::of_string("x"));
    EXPECT_THROW(topo::apply(c, c, updates), topo::error);
    EXPECT_EQ(1, c.updates);
    EXPECT_FALSE(c.t.contains("state/agent-id"));
    auto all = topo::snapshot(c, c, "config");
    EXPECT_EQ(1, c.refreshes);
    EXPECT_EQ(1u, all.size());
}

TEST(configurable, timestamp) {
    using namespace std::chrono;
    topo::test::manual_clock clock{system_clock::time_point(seconds(1000))};
    clock_component c(clock);
    std::vector<topo::notification> received;
    c.t.subscribe([&received] (const topo::notification& n) { received.emplace_back(n); });
    topo::path_value_array updates;
    updates.emplace_back("config/emitFrequency", typed_value::of_int(10));
    topo::apply(c, c, updates);
    clock.advance(seconds(1));
    topo::apply(c, c, updates);
    ASSERT_EQ(2u, received.size());
    EXPECT_EQ(duration_cast<nanoseconds>(seconds(1000)).count(), received[0].timestamp);
    EXPECT_EQ(duration_cast<nanoseconds>(seconds(1001)).count(), received[1].timestamp);
}
