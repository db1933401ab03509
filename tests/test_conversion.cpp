/// @file test_conversion.cpp
/// @brief Tests for to_value/from_value and the struct mapping macros.

#include <recdata/recdata.hpp>

#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

using namespace recdata;

namespace wav {

struct FormatChunk {
    std::string id;
    int channels = 0;
    uint64_t sample_rate = 0;
    bool extensible = false;
    std::vector<int> channel_map;
    std::optional<std::string> label;
};

RECDATA_DEFINE_RECORD_NON_INTRUSIVE(FormatChunk, id, channels, sample_rate, extensible,
                                    channel_map, label)

class Marker {
public:
    Marker() = default;
    Marker(int64_t position, std::string name) : position_(position), name_(std::move(name)) {}

    int64_t position() const { return position_; }
    const std::string& name() const { return name_; }

    RECDATA_DEFINE_RECORD_INTRUSIVE(Marker, position_, name_)

private:
    int64_t position_ = 0;
    std::string name_;
};

struct File {
    FormatChunk format;
    std::vector<Marker> markers;
};

RECDATA_DEFINE_RECORD_NON_INTRUSIVE(File, format, markers)

} // namespace wav

// ═══════════════════════════════════════════════════════════════════════════════
// Scalars and STL containers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Conversion, Scalars) {
    EXPECT_TRUE(to_value(true).is_bool());
    EXPECT_EQ(to_value(42).as_integer(), 42);
    EXPECT_DOUBLE_EQ(to_value(1.5f).as_float(), 1.5);
    EXPECT_EQ(to_value(std::string("s")).as_text(), "s");

    EXPECT_EQ(from_value<int>(Value(7)), 7);
    EXPECT_EQ(from_value<uint64_t>(Value(7)), 7u);
    EXPECT_EQ(from_value<std::string>(Value("x")), "x");
}

TEST(Conversion, BytesStayBinary) {
    Bytes raw{0x00, 0x01};
    Value v = to_value(raw);
    EXPECT_TRUE(v.is_bytes());
    EXPECT_EQ(from_value<Bytes>(v), raw);
}

TEST(Conversion, VectorToSequence) {
    Value v = to_value(std::vector<int>{3, 1, 2});
    ASSERT_TRUE(v.is_sequence());
    EXPECT_EQ(v.as_sequence(), (Sequence{3, 1, 2}));
    EXPECT_EQ(from_value<std::vector<int>>(v), (std::vector<int>{3, 1, 2}));
}

TEST(Conversion, MapToRecord) {
    std::map<std::string, int> m{{"b", 2}, {"a", 1}};
    Value v = to_value(m);
    ASSERT_TRUE(v.is_record());
    EXPECT_EQ(v.as_record().keys(), (std::vector<std::string>{"a", "b"}));

    auto back = from_value<std::unordered_map<std::string, int>>(v);
    EXPECT_EQ(back.at("b"), 2);
}

TEST(Conversion, Optional) {
    std::optional<int> none;
    EXPECT_TRUE(to_value(none).is_null());
    EXPECT_EQ(to_value(std::optional<int>(3)).as_integer(), 3);

    EXPECT_FALSE(from_value<std::optional<int>>(Value()).has_value());
    EXPECT_EQ(from_value<std::optional<int>>(Value(4)).value(), 4);
}

TEST(Conversion, FromValueOr) {
    EXPECT_EQ(from_value_or<int>(Value("nope"), -1), -1);
    EXPECT_EQ(from_value_or<int>(Value(5), -1), 5);
}

TEST(Conversion, MismatchThrows) {
    EXPECT_THROW(static_cast<void>(from_value<std::vector<int>>(Value(1))), TypeError);
}

TEST(Conversion, NarrowIntegersAreRangeChecked) {
    EXPECT_EQ(from_value<unsigned>(Value(4000000000u)), 4000000000u);
    EXPECT_EQ(from_value<int>(Value(-5)), -5);

    EXPECT_THROW(static_cast<void>(from_value<unsigned>(Value(-1))), TypeError);
    EXPECT_THROW(static_cast<void>(from_value<unsigned>(Value(int64_t{1} << 40))), TypeError);
    EXPECT_THROW(static_cast<void>(from_value<int>(Value(int64_t{1} << 40))), TypeError);
    EXPECT_THROW(static_cast<void>(from_value<int>(Value(int64_t{-1} << 40))), TypeError);
    EXPECT_EQ(from_value_or<unsigned>(Value(-1), 7u), 7u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Struct mapping
// ═══════════════════════════════════════════════════════════════════════════════

TEST(StructMapping, NonIntrusiveToRecord) {
    wav::FormatChunk fc{"fmt ", 2, 44100, false, {0, 1}, std::nullopt};
    Value v = to_value(fc);

    ASSERT_TRUE(v.is_record());
    const Record& r = v.as_record();
    EXPECT_EQ(r.keys(), (std::vector<std::string>{"id", "channels", "sample_rate", "extensible",
                                                  "channel_map", "label"}));
    EXPECT_EQ(r.attr("channels").as_integer(), 2);
    EXPECT_EQ(r.attr("sample_rate").as_uinteger(), 44100u);
    EXPECT_TRUE(r.attr("label").is_null());
}

TEST(StructMapping, RoundTrip) {
    wav::FormatChunk fc{"fmt ", 1, 8000, true, {0}, std::string("mono")};
    auto back = from_value<wav::FormatChunk>(to_value(fc));

    EXPECT_EQ(back.id, "fmt ");
    EXPECT_EQ(back.channels, 1);
    EXPECT_EQ(back.sample_rate, 8000u);
    EXPECT_TRUE(back.extensible);
    EXPECT_EQ(back.channel_map, (std::vector<int>{0}));
    EXPECT_EQ(back.label.value(), "mono");
}

TEST(StructMapping, Intrusive) {
    wav::Marker m(1024, "loop");
    Value v = to_value(m);
    EXPECT_EQ(v["position_"].as_integer(), 1024);

    auto back = from_value<wav::Marker>(v);
    EXPECT_EQ(back.position(), 1024);
    EXPECT_EQ(back.name(), "loop");
}

TEST(StructMapping, NestedStructs) {
    wav::File f;
    f.format.id = "fmt ";
    f.markers = {wav::Marker(1, "a"), wav::Marker(2, "b")};

    Value v = to_value(f);
    EXPECT_EQ(v.as_record().search_all("^name_$").size(), 2u);
    EXPECT_EQ(v["format"]["id"].as_text(), "fmt ");

    auto back = from_value<wav::File>(v);
    ASSERT_EQ(back.markers.size(), 2u);
    EXPECT_EQ(back.markers[1].name(), "b");
}

TEST(StructMapping, MissingFieldThrows) {
    Value partial(Record{{"id", "fmt "}});
    EXPECT_THROW(static_cast<void>(from_value<wav::FormatChunk>(partial)), KeyNotFoundError);
}
