#include <fstream>
#include <sstream>
#include <stdexcept>

#include <gtest/gtest.h>

#include <topology/discovery/config.hh>

namespace {

    const topo::logger quiet("test", topo::logger::levels::none);

    std::string temporary_file(const char* name) {
        return ::testing::TempDir() + name;
    }

}

TEST(config, defaults) {
    topod::config c;
    EXPECT_EQ(5, c.emit_frequency);
    EXPECT_EQ(30, c.max_link_age);
    EXPECT_EQ(60, c.pipeline_validation_frequency);
    EXPECT_EQ(60, c.port_rediscovery_frequency);
    EXPECT_EQ(2, c.link_prune_frequency);
    EXPECT_EQ(1800, c.max_host_age);
    EXPECT_TRUE(c.emit_on_configured);
    EXPECT_TRUE(c.valid());
}

TEST(config, set) {
    topod::config c;
    EXPECT_TRUE(c.set("emit-frequency", "10s"));
    EXPECT_TRUE(c.set("max-link-age", "1m"));
    EXPECT_TRUE(c.set("max-host-age", "1h"));
    EXPECT_TRUE(c.set("emit-on-configured", "no"));
    EXPECT_FALSE(c.set("unknown", "1"));
    EXPECT_EQ(10, c.emit_frequency);
    EXPECT_EQ(60, c.max_link_age);
    EXPECT_EQ(3600, c.max_host_age);
    EXPECT_FALSE(c.emit_on_configured);
    EXPECT_THROW(c.set("emit-frequency", "often"), std::invalid_argument);
    EXPECT_TRUE(c.set("link-prune-frequency", "0s"));
    EXPECT_FALSE(c.valid());
}

TEST(config, period_limits) {
    topod::config c;
    c.max_host_age = topod::max_period;
    EXPECT_TRUE(c.valid());
    c.max_host_age = topod::max_period + 1;
    EXPECT_FALSE(c.valid());
    c = topod::config{};
    EXPECT_THROW(c.set("emit-frequency", "10000000000"), std::out_of_range);
    c.emit_frequency = 10000000000L;
    EXPECT_FALSE(c.valid());
    c = topod::config{};
    c.max_link_age = -1;
    EXPECT_FALSE(c.valid());
}

TEST(config, missing_file) {
    auto c = topod::load_config(temporary_file("topod-missing.properties"), quiet);
    EXPECT_EQ(topod::config{}, c);
}

TEST(config, unparsable_file) {
    const auto filename = temporary_file("topod-unparsable.properties");
    {
        std::ofstream out(filename);
        out << "emit-frequency=10s\nmax-link-age=forever\n";
    }
    EXPECT_EQ(topod::config{}, topod::load_config(filename, quiet));
    {
        std::ofstream out(filename);
        out << "emit-frequency=10s\nno-such-key=1\n";
    }
    EXPECT_EQ(topod::config{}, topod::load_config(filename, quiet));
    {
        std::ofstream out(filename);
        out << "emit-frequency=0\n";
    }
    EXPECT_EQ(topod::config{}, topod::load_config(filename, quiet));
    {
        std::ofstream out(filename);
        out << "emit-frequency=10000000000\n";
    }
    EXPECT_EQ(topod::config{}, topod::load_config(filename, quiet));
}

TEST(config, save_and_load) {
    const auto filename = temporary_file("topod-saved.properties");
    topod::config c;
    c.emit_frequency = 1;
    c.max_link_age = 4;
    c.pipeline_validation_frequency = 7;
    c.port_rediscovery_frequency = 8;
    c.link_prune_frequency = 3;
    c.max_host_age = 100;
    c.emit_on_configured = false;
    ASSERT_TRUE(topod::save_config(filename, c, quiet));
    EXPECT_EQ(c, topod::load_config(filename, quiet));
}

TEST(config, save_failure) {
    topod::config c;
    EXPECT_FALSE(topod::save_config("/nonexistent-directory/topod.properties", c, quiet));
}

TEST(config, comments) {
    const auto filename = temporary_file("topod-comments.properties");
    {
        std::ofstream out(filename);
        out << "# discovery tunables\n\nemit-frequency = 2s # faster\r\nmax-link-age=10\n";
    }
    auto c = topod::load_config(filename, quiet);
    EXPECT_EQ(2, c.emit_frequency);
    EXPECT_EQ(10, c.max_link_age);
    EXPECT_EQ(60, c.pipeline_validation_frequency);
}
