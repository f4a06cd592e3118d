#include <sstream>
#include <stdexcept>
#include <unordered_map>

#include <gtest/gtest.h>

#include <topology/core/properties.hh>

class my_properties: public topo::properties {
public:
    std::unordered_map<std::string,std::string> all;
    void property(const std::string& key, const std::string& value) override {
        if (key == "bad") { throw std::invalid_argument("bad key"); }
        all[key] = value;
    }
};

TEST(properties, read_1) {
    my_properties props;
    std::stringstream in;
    in << R"(a=1
b = 2

# comment
c=3 # comment)";
    props.read(in, "string");
    EXPECT_EQ(props.all["a"], std::string("1"));
    EXPECT_EQ(props.all["b"], std::string("2"));
    EXPECT_EQ(props.all["c"], std::string("3"));
}

TEST(properties, read_2) {
    my_properties props;
    const char* argv[] = {"a=1", "b=2", "c=3", 0};
    props.read(3, argv);
    EXPECT_EQ(props.all["a"], std::string("1"));
    EXPECT_EQ(props.all["b"], std::string("2"));
    EXPECT_EQ(props.all["c"], std::string("3"));
}

TEST(properties, read_crlf) {
    my_properties props;
    std::stringstream in;
    in << "a=1\r\nb=2\r\nc=3\r\n";
    props.read(in, "string");
    EXPECT_EQ(props.all["a"], std::string("1"));
    EXPECT_EQ(props.all["b"], std::string("2"));
    EXPECT_EQ(props.all["c"], std::string("3"));
}

TEST(properties, errors) {
    {
        my_properties props;
        std::stringstream in;
        in << "a=1\nno-value\n";
        try {
            props.read(in, "file");
            FAIL() << "no exception";
        } catch (const std::runtime_error& err) {
            EXPECT_NE(std::string(err.what()).find("file:2"), std::string::npos) << err.what();
        }
    }
    {
        my_properties props;
        std::stringstream in;
        in << "bad=1\n";
        EXPECT_THROW(props.read(in, "file"), std::runtime_error);
    }
    {
        my_properties props;
        EXPECT_THROW(props.open("/nonexistent/topod.properties"), std::runtime_error);
    }
}

TEST(properties, duration) {
    using namespace std::chrono;
    using topo::string_to_duration;
    EXPECT_EQ(seconds(5), string_to_duration("5"));
    EXPECT_EQ(seconds(5), string_to_duration("5s"));
    EXPECT_EQ(milliseconds(100), string_to_duration("100ms"));
    EXPECT_EQ(minutes(30), string_to_duration(" 30m "));
    EXPECT_EQ(hours(48), string_to_duration("2d"));
    EXPECT_THROW(string_to_duration(""), std::invalid_argument);
    EXPECT_THROW(string_to_duration("-5s"), std::invalid_argument);
    EXPECT_THROW(string_to_duration("5y"), std::invalid_argument);
    EXPECT_THROW(string_to_duration("10000000000"), std::out_of_range);
    EXPECT_THROW(string_to_duration("200000d"), std::out_of_range);
    EXPECT_THROW(string_to_duration("99999999999999999999"), std::out_of_range);
    EXPECT_EQ(1800, topo::string_to_seconds("30m"));
    EXPECT_EQ(0, topo::string_to_seconds("500ms"));
}

TEST(properties, boolean) {
    using topo::string_to_bool;
    EXPECT_TRUE(string_to_bool("yes"));
    EXPECT_TRUE(string_to_bool("On"));
    EXPECT_TRUE(string_to_bool("1"));
    EXPECT_FALSE(string_to_bool("no"));
    EXPECT_FALSE(string_to_bool("FALSE"));
    EXPECT_THROW(string_to_bool("maybe"), std::invalid_argument);
}

TEST(properties, write) {
    std::stringstream out;
    topo::write_property(out, "emit-frequency", "5s");
    my_properties props;
    props.read(out, "string");
    EXPECT_EQ(props.all["emit-frequency"], std::string("5s"));
}
