#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <string>

#include "duel/foundation/game_serializer.hpp"

using namespace duel::foundation;

namespace sertest {

enum class Grade : uint8_t { Low = 0, Mid = 1, High = 2 };

struct Inner {
    int32_t count = 0;
    std::string label;
};

struct Outer {
    uint64_t id = 0;
    double ratio = 0.0;
    bool flag = false;
    Grade grade = Grade::Low;
    std::optional<uint64_t> maybe;
    Inner inner;
};

} // namespace sertest

DUEL_SERIALIZABLE(sertest::Inner, 1,
    field("count", &sertest::Inner::count),
    field("label", &sertest::Inner::label)
);

DUEL_SERIALIZABLE(sertest::Outer, 2,
    field("id", &sertest::Outer::id),
    field("ratio", &sertest::Outer::ratio),
    field("flag", &sertest::Outer::flag),
    field("grade", &sertest::Outer::grade),
    field("maybe", &sertest::Outer::maybe),
    field("inner", &sertest::Outer::inner)
);

class GameSerializerTest : public ::testing::Test {
protected:
    GameSerializer& serializer_ = GameSerializer::instance();
};

// ===========================================================================
// Writing
// ===========================================================================

TEST_F(GameSerializerTest, WritesFieldsInDeclarationOrder) {
    sertest::Outer value;
    value.id = 9;
    value.ratio = 2.5;
    value.flag = true;
    value.grade = sertest::Grade::High;
    value.inner.count = -3;
    value.inner.label = "guard";

    EXPECT_EQ(serializer_.serializeJson(value),
              "{\"__v\":2,\"id\":9,\"ratio\":2.5,\"flag\":true,\"grade\":2,"
              "\"maybe\":null,\"inner\":{\"__v\":1,\"count\":-3,\"label\":\"guard\"}}");
}

TEST_F(GameSerializerTest, OptionalWithValueIsWrittenInline) {
    sertest::Outer value;
    value.maybe = 77;
    auto json = serializer_.serializeJson(value);
    EXPECT_NE(json.find("\"maybe\":77"), std::string::npos);
}

TEST_F(GameSerializerTest, EscapesStrings) {
    sertest::Inner value;
    value.label = "a\"b\\c\n";
    EXPECT_EQ(serializer_.serializeJson(value),
              "{\"__v\":1,\"count\":0,\"label\":\"a\\\"b\\\\c\\n\"}");
}

TEST_F(GameSerializerTest, SameValueSerializesIdentically) {
    sertest::Outer value;
    value.id = 1;
    value.ratio = 0.1;
    EXPECT_EQ(serializer_.serializeJson(value), serializer_.serializeJson(value));
}
