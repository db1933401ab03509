/// @file test_search.cpp
/// @brief Tests for recursive regex search over records and sequences.

#include <recdata/recdata.hpp>

#include <gtest/gtest.h>

#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

using namespace recdata;

// ═══════════════════════════════════════════════════════════════════════════════
// Single-result search
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Search, FindsValueByKey) {
    Record r{{"x", 1}, {"y", 2}};
    auto hit = r.search("^x$");
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->as_integer(), 1);
}

TEST(Search, NotFoundIsEmpty) {
    Record r{{"x", 1}, {"y", 2}};
    EXPECT_FALSE(r.search("^z$").has_value());
}

TEST(Search, MatchIsAnchoredAtKeyStart) {
    Record r{{"width", 640}};
    EXPECT_TRUE(r.search("wid").has_value());
    EXPECT_FALSE(r.search("dth").has_value());
    EXPECT_TRUE(r.search(".*dth").has_value());
}

TEST(Search, ReturnsFirstInInsertionOrder) {
    Record r{{"size_b", 2}, {"size_a", 1}};
    EXPECT_EQ(r.search("size")->as_integer(), 2);
}

TEST(Search, DescendsBeforeTestingLaterKeys) {
    Record r{{"inner", Record{{"x", 1}}}, {"x", 2}};
    EXPECT_EQ(r.search("^x$")->as_integer(), 1);
}

TEST(Search, ContainerKeysAreNotMatched) {
    Record r{{"x", Record{{"y", 1}}}};
    EXPECT_FALSE(r.search("^x$").has_value());
    EXPECT_EQ(r.search("^y$")->as_integer(), 1);
}

TEST(Search, ThroughMixedNesting) {
    Record r{{"chunks", Sequence{Record{{"id", "fmt "}},
                                 Record{{"sub", Sequence{Record{{"deep", 42}}}}}}}};
    EXPECT_EQ(r.search("^deep$")->as_integer(), 42);
    EXPECT_EQ(r.search("^id$")->as_text(), "fmt ");
}

TEST(Search, SequenceSkipsScalars) {
    Sequence s{1, "x", Record{{"x", 3}}};
    EXPECT_EQ(s.search("^x$")->as_integer(), 3);
    Sequence scalars{1, 2, 3};
    EXPECT_FALSE(scalars.search(".*").has_value());
}

TEST(Search, PrivateKeysAreSearchable) {
    Record r{{"_offset", 16}};
    EXPECT_EQ(r.search("^_offset$")->as_integer(), 16);
}

TEST(Search, PrecompiledPattern) {
    Record r{{"Name", "a"}};
    std::regex icase("^name$", std::regex::ECMAScript | std::regex::icase);
    EXPECT_EQ(r.search(icase)->as_text(), "a");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Collecting search
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SearchAll, DiscoveryOrderAcrossSequence) {
    Sequence s{Record{{"x", 1}}, Record{{"x", 2}}, Record{{"y", 3}}};
    auto all = s.search_all("^x$");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].as_integer(), 1);
    EXPECT_EQ(all[1].as_integer(), 2);
}

TEST(SearchAll, DepthFirstOrder) {
    Record r{{"v1", 1}, {"nested", Record{{"v2", 2}, {"more", Sequence{Record{{"v3", 3}}}}}}, {"v4", 4}};
    auto all = r.search_all("^v");
    ASSERT_EQ(all.size(), 4u);
    for (size_t i = 0; i < all.size(); ++i)
        EXPECT_EQ(all[i].as_integer(), static_cast<int64_t>(i + 1));
}

TEST(SearchAll, EmptyWhenNothingMatches) {
    Record r{{"a", 1}};
    EXPECT_TRUE(r.search_all("^b").empty());
    EXPECT_TRUE(Record{}.search_all(".*").empty());
}

TEST(SearchAll, ContainerValuesAreNeverReturned) {
    Value inner(Record{{"k", 1}});
    Record r{{"hit", 1}, {"wrap", Sequence{Record{{"hit", inner}}}}};
    auto all = r.search_all("^hit$");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].as_integer(), 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors and cycles
// ═══════════════════════════════════════════════════════════════════════════════

TEST(SearchErrors, MalformedPatternThrows) {
    Record r{{"a", 1}};
    EXPECT_THROW(static_cast<void>(r.search("(")), PatternError);
    EXPECT_THROW(static_cast<void>(r.search_all("[a-")), PatternError);
    EXPECT_THROW(static_cast<void>(Sequence{}.search("(")), PatternError);
}

TEST(SearchErrors, PatternErrorCarriesCode) {
    try {
        static_cast<void>(compile_pattern("(unclosed"));
        FAIL() << "expected PatternError";
    } catch (const PatternError& e) {
        EXPECT_EQ(e.code(), errc::invalid_pattern);
        EXPECT_NE(std::string(e.what()).find("(unclosed"), std::string::npos);
    }
}

TEST(SearchErrors, RegexErrorWhileMatchingIsNoMatch) {
    EXPECT_FALSE(detail::match_or_skip([]() -> bool {
        throw std::regex_error(std::regex_constants::error_complexity);
    }));
    EXPECT_TRUE(detail::match_or_skip([] { return true; }));
}

TEST(SearchErrors, OtherErrorsWhileMatchingPropagate) {
    EXPECT_THROW(detail::match_or_skip([]() -> bool { throw std::runtime_error("boom"); }),
                 std::runtime_error);
}

TEST(SearchCycles, SelfReferenceTerminates) {
    auto r = std::make_shared<Record>(Record{{"a", 1}});
    (*r)["self"] = Value(r);

    EXPECT_FALSE(r->search("^b$").has_value());
    auto all = r->search_all("^a$");
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].as_integer(), 1);
    EXPECT_EQ(detail::search_path().depth(), 0u);

    r->erase("self");
}

TEST(SearchCycles, CycleThroughSequence) {
    auto rec = std::make_shared<Record>();
    auto seq = std::make_shared<Sequence>();
    seq->push_back(Value(rec));
    (*rec)["items"] = Value(seq);
    (*rec)["leaf"] = 7;

    EXPECT_EQ(seq->search("^leaf$")->as_integer(), 7);
    EXPECT_EQ(seq->search_all("^leaf$").size(), 1u);

    seq->clear();
}
