#include <vector>

#include <gtest/gtest.h>

#include <topology/core/error.hh>
#include <topology/discovery/tree_exporter.hh>
#include <topology/test/manual_clock.hh>

using topo::typed_value;

namespace {

    struct recorder {
        std::vector<topo::notification> all;
        explicit recorder(topo::config_tree& tree) {
            tree.subscribe([this] (const topo::notification& n) { this->all.emplace_back(n); });
        }
    };

}

TEST(tree_exporter, populate) {
    topo::config_tree tree;
    topo::test::manual_clock clock;
    topod::tree_exporter exporter(tree, clock);
    exporter.populate("agent-1", topod::config{});
    EXPECT_EQ("agent-1", tree.get("state/agent-id").string_value());
    EXPECT_EQ(5, tree.get("config/emitFrequency").int_value());
    EXPECT_EQ(30, tree.get("config/maxLinkAge").int_value());
    EXPECT_EQ(60, tree.get("config/pipelineValidationFrequency").int_value());
    EXPECT_EQ(60, tree.get("config/portRediscoveryFrequency").int_value());
    EXPECT_EQ(2, tree.get("config/linkPruneFrequency").int_value());
    EXPECT_EQ(1800, tree.get("config/maxHostAge").int_value());
    EXPECT_TRUE(tree.get("config/emitOnConfigured").bool_value());
    EXPECT_TRUE(tree.get("state/links").empty());
    topod::config c;
    c.emit_frequency = 1;
    exporter.read(c);
    EXPECT_EQ(topod::config{}, c);
}

TEST(tree_exporter, read_errors) {
    topo::config_tree tree;
    topo::test::manual_clock clock;
    topod::tree_exporter exporter(tree, clock);
    topod::config c;
    EXPECT_THROW(exporter.read(c), topo::error);
    exporter.populate("agent-1", c);
    tree.add("config/maxLinkAge", typed_value::of_string("30s"));
    c.max_link_age = 10;
    EXPECT_THROW(exporter.read(c), topo::error);
    EXPECT_EQ(10, c.max_link_age);
}

TEST(tree_exporter, links) {
    using namespace std::chrono;
    topo::config_tree tree;
    topo::test::manual_clock clock;
    topod::tree_exporter exporter(tree, clock);
    recorder r(tree);
    topod::link l;
    l.ingress_port = 1;
    l.egress_port = 7;
    l.egress_device = "deviceB";
    l.last_update = topod::time_point{} + seconds(3);
    exporter.add_link(l);
    EXPECT_EQ(7u, tree.get("state/link[port=1]/egress-port").uint_value());
    EXPECT_EQ("deviceB", tree.get("state/link[port=1]/egress-device").string_value());
    EXPECT_EQ(3000000000u, tree.get("state/link[port=1]/create-time").uint_value());
    ASSERT_EQ(1u, r.all.size());
    EXPECT_EQ(3u, r.all.back().updates.size());
    exporter.remove_link(1);
    EXPECT_FALSE(tree.contains("state/link[port=1]/egress-port"));
    ASSERT_EQ(2u, r.all.size());
    ASSERT_EQ(1u, r.all.back().deletes.size());
    EXPECT_EQ("state/link[port=1]", r.all.back().deletes.front());
    EXPECT_EQ(duration_cast<nanoseconds>(clock.now().time_since_epoch()).count(),
              r.all.back().timestamp);
}

TEST(tree_exporter, hosts) {
    topo::config_tree tree;
    topo::test::manual_clock clock;
    topod::tree_exporter exporter(tree, clock);
    topod::host h;
    h.mac = "0a:0b:0c:0d:0e:0f";
    h.ip = "10.0.0.5";
    h.port = 3;
    exporter.add_host(h);
    EXPECT_EQ(3u, tree.get("state/host[mac=0a:0b:0c:0d:0e:0f]/port").uint_value());
    EXPECT_EQ("10.0.0.5", tree.get("state/host[mac=0a:0b:0c:0d:0e:0f]/ip-address").string_value());
    EXPECT_TRUE(tree.contains("state/host[mac=0a:0b:0c:0d:0e:0f]/create-time"));
    exporter.remove_host(h.mac);
    EXPECT_TRUE(tree.list("state/host[mac=0a:0b:0c:0d:0e:0f]").empty());
}
