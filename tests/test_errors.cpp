/// @file test_errors.cpp
/// @brief Tests for the recdata error category, exception types and the
/// exception-free result type.

#include <recdata/recdata.hpp>

#include <gtest/gtest.h>

#include <string>
#include <system_error>

using namespace recdata;

// ═══════════════════════════════════════════════════════════════════════════════
// Error code system (error_category, error_code, system_error)
// ═══════════════════════════════════════════════════════════════════════════════

TEST(ErrorCode, CategoryName) {
    EXPECT_STREQ(recdata_category().name(), "recdata");
}

TEST(ErrorCode, MakeErrorCode) {
    auto ec = make_error_code(errc::key_not_found);
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_EQ(&ec.category(), &recdata_category());
    EXPECT_EQ(ec.message(), "key not found");
}

TEST(ErrorCode, SuccessIsNoError) {
    std::error_code ec = errc::ok;
    EXPECT_FALSE(static_cast<bool>(ec));
}

TEST(ErrorCode, EveryCodeHasMessage) {
    for (errc e : {errc::index_out_of_range, errc::reserved_name, errc::invalid_field_name,
                   errc::type_mismatch, errc::invalid_pattern}) {
        EXPECT_NE(make_error_code(e).message(), "unknown recdata error");
    }
    EXPECT_EQ(recdata_category().message(999), "unknown recdata error");
}

TEST(ErrorCode, ConditionComparison) {
    std::error_code ec = make_error_code(errc::type_mismatch);
    EXPECT_EQ(ec, make_error_condition(errc::type_mismatch));
    EXPECT_NE(ec, make_error_condition(errc::key_not_found));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Exception types
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Exceptions, KeyNotFoundCarriesKey) {
    Record r;
    try {
        static_cast<void>(r.at("missing"));
        FAIL() << "expected KeyNotFoundError";
    } catch (const KeyNotFoundError& e) {
        EXPECT_EQ(e.key(), "missing");
        EXPECT_EQ(e.code(), errc::key_not_found);
        EXPECT_NE(std::string(e.what()).find("missing"), std::string::npos);
    }
}

TEST(Exceptions, PopItemOnEmptyRecord) {
    Record r;
    try {
        r.popitem();
        FAIL() << "expected KeyNotFoundError";
    } catch (const KeyNotFoundError& e) {
        EXPECT_TRUE(e.key().empty());
        EXPECT_NE(std::string(e.what()).find("empty"), std::string::npos);
    }
}

TEST(Exceptions, AllAreSystemErrors) {
    Record r{{"keys", 1}};
    Sequence s;

    EXPECT_THROW(static_cast<void>(r.at("x")), std::system_error);
    EXPECT_THROW(static_cast<void>(s.at(0)), std::system_error);
    EXPECT_THROW(static_cast<void>(r.attr("keys")), std::system_error);
    EXPECT_THROW(static_cast<void>(r.attr("no way")), std::system_error);
    EXPECT_THROW(static_cast<void>(Value(1).as_text()), std::system_error);
    EXPECT_THROW(static_cast<void>(r.search(")")), std::system_error);
}

TEST(Exceptions, CodesMatchKinds) {
    Record r{{"copy", 1}};
    try {
        static_cast<void>(r.attr("copy"));
        FAIL();
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), errc::reserved_name);
    }
    try {
        r.set_attr("0bad", 1);
        FAIL();
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), errc::invalid_field_name);
    }
    try {
        static_cast<void>(Value().as_record());
        FAIL();
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code(), errc::type_mismatch);
    }
}

TEST(Exceptions, ReservedNameMessageNamesField) {
    try {
        static_cast<void>(Record{}.attr("values"));
        FAIL();
    } catch (const ReservedNameError& e) {
        EXPECT_NE(std::string(e.what()).find("\"values\""), std::string::npos);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Exception-free access
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Result, BoolConversion) {
    Record r{{"a", 1}};
    auto ok = r.try_at("a");
    auto bad = r.try_at("b");

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(bad));
    EXPECT_TRUE(bad.value.is_null());
}

TEST(Result, StructuredBinding) {
    Sequence s{5};
    auto [val, ec] = s.try_at(0);
    EXPECT_FALSE(static_cast<bool>(ec));
    EXPECT_EQ(val.as_integer(), 5);
}
