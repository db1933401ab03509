/// @file test_sequence.cpp
/// @brief Unit tests for recdata::Sequence.

#include <recdata/recdata.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using namespace recdata;

// ═══════════════════════════════════════════════════════════════════════════════
// Construction and access
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Sequence, DefaultIsEmpty) {
    Sequence s;
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.size(), 0u);
}

TEST(Sequence, InitializerListMixedKinds) {
    Sequence s{1, "two", 3.0, Record{{"x", 4}}};
    ASSERT_EQ(s.size(), 4u);
    EXPECT_TRUE(s[0].is_integer());
    EXPECT_TRUE(s[1].is_text());
    EXPECT_TRUE(s[2].is_float());
    EXPECT_TRUE(s[3].is_record());
}

TEST(Sequence, FromIteratorRange) {
    std::vector<Value> items{1, 2, 3};
    Sequence s(items.begin(), items.end());
    EXPECT_EQ(s.size(), 3u);
    EXPECT_EQ(s.back().as_integer(), 3);
}

TEST(Sequence, FromStorage) {
    Sequence s(Sequence::storage_type{Value(1), Value(2)});
    EXPECT_EQ(s.size(), 2u);
    EXPECT_EQ(s.front().as_integer(), 1);
}

TEST(Sequence, OutOfRangeThrows) {
    Sequence s{1, 2};
    EXPECT_THROW(static_cast<void>(s.at(2)), IndexOutOfRangeError);
    EXPECT_THROW(static_cast<void>(s[10]), IndexOutOfRangeError);

    Sequence empty;
    EXPECT_THROW(static_cast<void>(empty.front()), IndexOutOfRangeError);
    EXPECT_THROW(static_cast<void>(empty.back()), IndexOutOfRangeError);
}

TEST(Sequence, OutOfRangeCarriesIndexAndSize) {
    Sequence s{1, 2};
    try {
        static_cast<void>(s.at(7));
        FAIL() << "expected IndexOutOfRangeError";
    } catch (const IndexOutOfRangeError& e) {
        EXPECT_EQ(e.index(), 7u);
        EXPECT_EQ(e.size(), 2u);
    }
}

TEST(Sequence, TryAt) {
    Sequence s{"a"};
    auto ok = s.try_at(0);
    EXPECT_TRUE(ok.has_value());
    EXPECT_EQ(ok.value.as_text(), "a");

    auto bad = s.try_at(1);
    EXPECT_FALSE(bad.has_value());
    EXPECT_EQ(bad.ec, errc::index_out_of_range);
}

TEST(Sequence, IterationInOrder) {
    Sequence s{1, 2, 3};
    int64_t sum = 0;
    int64_t last = 0;
    for (const auto& v : s) {
        EXPECT_GT(v.as_integer(), last);
        last = v.as_integer();
        sum += last;
    }
    EXPECT_EQ(sum, 6);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Modifiers
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Sequence, AppendAndEmplace) {
    Sequence s;
    s.append(1);
    s.push_back("two");
    s.emplace_back(3.5);
    EXPECT_EQ(s.size(), 3u);
    EXPECT_DOUBLE_EQ(s[2].as_float(), 3.5);
}

TEST(Sequence, Extend) {
    Sequence s{1};
    s.extend(Sequence{2, 3});
    EXPECT_EQ(s, (Sequence{1, 2, 3}));
}

TEST(Sequence, ExtendWithItself) {
    Sequence s{1, 2};
    s.extend(s);
    EXPECT_EQ(s, (Sequence{1, 2, 1, 2}));
}

TEST(Sequence, InsertClampsIndex) {
    Sequence s{1, 3};
    s.insert(1, 2);
    s.insert(100, 4);
    s.insert(0, 0);
    EXPECT_EQ(s, (Sequence{0, 1, 2, 3, 4}));
}

TEST(Sequence, EraseByIndex) {
    Sequence s{1, 2, 3};
    s.erase(1);
    EXPECT_EQ(s, (Sequence{1, 3}));
    EXPECT_THROW(s.erase(2), IndexOutOfRangeError);
}

TEST(Sequence, RemoveFirstEqual) {
    Sequence s{1, 2, 1};
    EXPECT_TRUE(s.remove(1));
    EXPECT_EQ(s, (Sequence{2, 1}));
    EXPECT_FALSE(s.remove(5));
}

TEST(Sequence, Pop) {
    Sequence s{1, 2, 3};
    EXPECT_EQ(s.pop().as_integer(), 3);
    EXPECT_EQ(s.pop(0).as_integer(), 1);
    EXPECT_EQ(s, (Sequence{2}));
    EXPECT_THROW(s.pop(1), IndexOutOfRangeError);

    s.pop();
    EXPECT_THROW(s.pop(), IndexOutOfRangeError);
}

TEST(Sequence, Clear) {
    Sequence s{1, 2};
    s.clear();
    EXPECT_TRUE(s.empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Slicing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Sequence, Slice) {
    Sequence s{0, 1, 2, 3, 4};
    EXPECT_EQ(s.slice(1, 3), (Sequence{1, 2}));
    EXPECT_EQ(s.slice(3, 100), (Sequence{3, 4}));
    EXPECT_TRUE(s.slice(4, 2).empty());
    EXPECT_TRUE(s.slice(10, 20).empty());
}

TEST(Sequence, SliceSharesNestedContainers) {
    Sequence s{Record{{"x", 1}}, 2};
    Sequence part = s.slice(0, 1);
    part[0]["x"] = 9;
    EXPECT_EQ(s[0]["x"].as_integer(), 9);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Equality
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Sequence, EqualityIsOrderSensitive) {
    EXPECT_EQ((Sequence{1, 2}), (Sequence{1, 2}));
    EXPECT_NE((Sequence{1, 2}), (Sequence{2, 1}));
    EXPECT_NE((Sequence{1, 2}), (Sequence{1, 2, 3}));
}

TEST(Sequence, EqualityRecursesIntoRecords) {
    Sequence a{Record{{"x", 1}, {"_tag", "a"}}};
    Sequence b{Record{{"x", 1}, {"_tag", "b"}}};
    EXPECT_EQ(a, b);
}

TEST(Sequence, SharedSelfReference) {
    auto s = std::make_shared<Sequence>(Sequence{1});
    s->push_back(Value(s));
    EXPECT_EQ(s->size(), 2u);
    EXPECT_EQ(s->at(1).identity(), s.get());
    EXPECT_EQ(*s, *s);
    // Break the cycle so the sequence is released.
    s->pop();
}
