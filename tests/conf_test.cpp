#include <gtest/gtest.h>
#include "test_env.hpp"
#include "hintc/conf.hpp"

using namespace hintc;

namespace {

void clear_env(){
    _putenv("HINTC_STRATEGY=");
    _putenv("HINTC_DEBUG=");
    _putenv("HINTC_DIAG_JSON=");
}

struct ConfTest : ::testing::Test {
    void SetUp() override { clear_env(); }
    void TearDown() override { clear_env(); }
};

} // namespace

TEST_F(ConfTest, DefaultsWhenUnset){
    CheckConf c = detect_conf();
    EXPECT_EQ(c.strategy, Strategy::O1);
    EXPECT_FALSE(c.debug);
    EXPECT_FALSE(c.diag_json);
}

TEST_F(ConfTest, ReadsEnvironment){
    _putenv("HINTC_STRATEGY=on");
    _putenv("HINTC_DEBUG=1");
    _putenv("HINTC_DIAG_JSON=1");
    CheckConf c = detect_conf();
    EXPECT_EQ(c.strategy, Strategy::On);
    EXPECT_TRUE(c.debug);
    EXPECT_TRUE(c.diag_json);

    _putenv("HINTC_STRATEGY=O0");
    _putenv("HINTC_DEBUG=yes");
    EXPECT_EQ(detect_conf().strategy, Strategy::O0);
    EXPECT_FALSE(detect_conf().debug); // only "1" enables
}

TEST_F(ConfTest, InvalidStrategyKeepsDefault){
    _putenv("HINTC_STRATEGY=O7");
    EXPECT_EQ(detect_conf().strategy, Strategy::O1);
}

TEST(Strategy, NamesRoundTrip){
    for(Strategy s : {Strategy::O0, Strategy::O1, Strategy::On}){
        Strategy parsed = Strategy::O1;
        ASSERT_TRUE(parse_strategy(strategy_name(s), parsed));
        EXPECT_EQ(parsed, s);
    }
    Strategy keep = Strategy::On;
    EXPECT_FALSE(parse_strategy("fast", keep));
    EXPECT_FALSE(parse_strategy("", keep));
    EXPECT_EQ(keep, Strategy::On);
    EXPECT_TRUE(parse_strategy("o1", keep));
    EXPECT_EQ(keep, Strategy::O1);
}
