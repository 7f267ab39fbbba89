#include <gtest/gtest.h>

#include <lp/util/simple_json.h>

using lp::SimpleJson;

TEST(SimpleJson, ParsesFlatObject) {
    SimpleJson j;
    ASSERT_TRUE(j.parse(R"({"name":"laptop","port":7001,"on":true,"neg":-3})"));
    EXPECT_EQ(j.getString("name"), "laptop");
    EXPECT_EQ(j.getUint("port"), 7001u);
    EXPECT_TRUE(j.getBool("on"));
    EXPECT_EQ(j.getInt("neg"), -3);
    EXPECT_FALSE(j.hasKey("missing"));
    EXPECT_EQ(j.getInt("missing", 42), 42);
}

TEST(SimpleJson, UnsignedRejectsNegative) {
    SimpleJson j;
    ASSERT_TRUE(j.parse(R"({"v":-1})"));
    EXPECT_EQ(j.getUint("v", 9), 9u);
}

TEST(SimpleJson, EscapesSurviveSerialize) {
    SimpleJson out;
    out.setString("pem", "-----BEGIN-----\nAB\"C\\\n-----END-----\n");
    out.setBool("flag", false);

    SimpleJson in;
    ASSERT_TRUE(in.parse(out.serialize()));
    EXPECT_EQ(in.getString("pem"), "-----BEGIN-----\nAB\"C\\\n-----END-----\n");
    EXPECT_FALSE(in.getBool("flag", true));
    EXPECT_EQ(out.serialize().find('\n'), std::string::npos);
}

TEST(SimpleJson, RejectsMalformed) {
    SimpleJson j;
    EXPECT_FALSE(j.parse(""));
    EXPECT_FALSE(j.parse("[1,2]"));
    EXPECT_FALSE(j.parse(R"({"a":1)"));
    EXPECT_FALSE(j.parse(R"({"a" 1})"));
    EXPECT_FALSE(j.parse(R"({"a":"unterminated})"));
}

TEST(SimpleJson, NestedArrayKeptRaw) {
    SimpleJson j;
    ASSERT_TRUE(j.parse(R"({"trusted_clients":[{"fingerprint":"AA"},{"fingerprint":"BB"}]})"));

    std::vector<std::string> items;
    ASSERT_TRUE(SimpleJson::splitObjectArray(j.getString("trusted_clients"), items));
    ASSERT_EQ(items.size(), 2u);

    SimpleJson second;
    ASSERT_TRUE(second.parse(items[1]));
    EXPECT_EQ(second.getString("fingerprint"), "BB");
}

TEST(SimpleJson, SplitRejectsNonArray) {
    std::vector<std::string> items;
    EXPECT_FALSE(SimpleJson::splitObjectArray(R"({"a":1})", items));
    EXPECT_TRUE(SimpleJson::splitObjectArray("[]", items));
    EXPECT_TRUE(items.empty());
}
