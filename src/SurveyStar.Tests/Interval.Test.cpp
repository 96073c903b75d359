#include "pch.h"

#include "SurveyStar.Core/interval.h"

TEST(TestCore_Interval, CreateEmpty) {
    using namespace sstar::core;
    auto empty = DoubleInterval{};

    ASSERT_EQ(0.0, empty.length());
    ASSERT_EQ(0.0, empty.lower());
    ASSERT_EQ(0.0, empty.upper());
    ASSERT_TRUE(empty.contains(0.0));
}

TEST(TestCore_Interval, ContainsAndOverlaps) {
    using namespace sstar::core;
    auto adults = DoubleInterval{19.0, 65.0};
    auto young = DoubleInterval{19.0, 25.0};
    auto senior = DoubleInterval{66.0, 100.0};
    auto pension = DoubleInterval{60.0, 70.0};

    ASSERT_EQ(46.0, adults.length());
    ASSERT_TRUE(adults.contains(young));
    ASSERT_FALSE(young.contains(adults));
    ASSERT_FALSE(adults.overlaps(senior));
    ASSERT_TRUE(adults.overlaps(pension));
    ASSERT_TRUE(senior.overlaps(pension));
    ASSERT_TRUE(young.overlaps(DoubleInterval{25.0, 30.0}));
}

TEST(TestCore_Interval, BoundsAreInclusive) {
    using namespace sstar::core;
    auto band = DoubleInterval{19.0, 25.0};

    ASSERT_TRUE(band.contains(19.0));
    ASSERT_TRUE(band.contains(25.0));
    ASSERT_FALSE(band.contains(18.999));
    ASSERT_FALSE(band.contains(25.001));
}

TEST(TestCore_Interval, CreateInvertedThrows) {
    using namespace sstar::core;

    ASSERT_THROW(DoubleInterval(1.5, -1.5), SurveyStarException);
}

TEST(TestCore_Interval, Comparable) {
    using namespace sstar::core;

    auto cat = DoubleInterval{0.0, 10.0};
    auto gato = DoubleInterval{0.0, 10.0};
    auto dog = DoubleInterval{0.0, 5.0};

    ASSERT_EQ(cat, gato);
    ASSERT_NE(cat, dog);
    ASSERT_LT(dog, cat);
}

TEST(TestCore_Interval, ParseFromString) {
    using namespace sstar::core;

    auto ages = parse_double_interval("19-25");
    ASSERT_EQ(DoubleInterval(19.0, 25.0), ages);
    ASSERT_EQ("19-25", ages.to_string());

    ASSERT_EQ(DoubleInterval(0.5, 2.5), parse_double_interval(" 0.5 - 2.5 "));
    ASSERT_EQ(DoubleInterval(-1.5, 0.0), parse_double_interval("-1.5-0"));
    ASSERT_EQ(DoubleInterval(36.0, 50.0), parse_double_interval("36;50", ';'));
}

TEST(TestCore_Interval, ParseInvalidStringThrows) {
    using namespace sstar::core;

    ASSERT_THROW(parse_double_interval(""), std::invalid_argument);
    ASSERT_THROW(parse_double_interval("19"), std::invalid_argument);
    ASSERT_THROW(parse_double_interval("a-b"), std::invalid_argument);
    ASSERT_THROW(parse_double_interval("1-2-3"), std::invalid_argument);
    ASSERT_THROW(parse_double_interval("18a-25"), std::invalid_argument);
    ASSERT_THROW(parse_double_interval("nan-1"), std::invalid_argument);
    ASSERT_THROW(parse_double_interval("25-19"), std::invalid_argument);
}
