/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStringUtils.h>

#include <boost/test/unit_test.hpp>

#include <set>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(CStringUtilsTest)

using TStrVec = std::vector<std::string>;

BOOST_AUTO_TEST_CASE(testNumericConversions) {
    int i{0};
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToType("-42", i));
    BOOST_REQUIRE_EQUAL(-42, i);
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("12abc", i) == false);
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("", i) == false);
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("3000000000", i) == false);

    unsigned long long u{0};
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToType("18446744073709551615", u));
    BOOST_REQUIRE_EQUAL(18446744073709551615ull, u);
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("-1", u) == false);

    double d{0.0};
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToType("2.5e-3", d));
    BOOST_REQUIRE_CLOSE(0.0025, d, 1e-10);
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("inf", d) == false);
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("1.0x", d) == false);

    std::size_t size{0};
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToType("17", size));
    BOOST_REQUIRE_EQUAL(17, size);
}

BOOST_AUTO_TEST_CASE(testBoolConversions) {
    bool b{false};
    for (const auto& yes : {"true", "YES", "On", "1"}) {
        b = false;
        BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToType(yes, b));
        BOOST_TEST_REQUIRE(b);
    }
    for (const auto& no : {"false", "No", "OFF", "0"}) {
        b = true;
        BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToType(no, b));
        BOOST_TEST_REQUIRE(b == false);
    }
    BOOST_TEST_REQUIRE(rca::core::CStringUtils::stringToTypeSilent("maybe", b) == false);
}

BOOST_AUTO_TEST_CASE(testTypeToString) {
    BOOST_REQUIRE_EQUAL("123", rca::core::CStringUtils::typeToString(123));
    BOOST_REQUIRE_EQUAL("0.3333", rca::core::CStringUtils::typeToStringPrecise(1.0 / 3.0, 4));
}

BOOST_AUTO_TEST_CASE(testTrimWhitespace) {
    std::string str{" \t hello world \r\n"};
    rca::core::CStringUtils::trimWhitespace(str);
    BOOST_REQUIRE_EQUAL("hello world", str);

    str = " \t\n ";
    rca::core::CStringUtils::trimWhitespace(str);
    BOOST_TEST_REQUIRE(str.empty());
}

BOOST_AUTO_TEST_CASE(testTokenise) {
    TStrVec tokens;
    std::string remainder;

    rca::core::CStringUtils::tokenise(",", "a,b,,c", tokens, remainder);
    BOOST_REQUIRE_EQUAL(3, tokens.size());
    BOOST_REQUIRE_EQUAL("a", tokens[0]);
    BOOST_REQUIRE_EQUAL("b", tokens[1]);
    BOOST_REQUIRE_EQUAL("", tokens[2]);
    BOOST_REQUIRE_EQUAL("c", remainder);

    // The whole delimiter must match
    rca::core::CStringUtils::tokenise("::", "x:y::z", tokens, remainder);
    BOOST_REQUIRE_EQUAL(1, tokens.size());
    BOOST_REQUIRE_EQUAL("x:y", tokens[0]);
    BOOST_REQUIRE_EQUAL("z", remainder);

    rca::core::CStringUtils::tokenise(",", "single", tokens, remainder);
    BOOST_TEST_REQUIRE(tokens.empty());
    BOOST_REQUIRE_EQUAL("single", remainder);
}

BOOST_AUTO_TEST_CASE(testJoinAndMatches) {
    BOOST_REQUIRE_EQUAL("a, b, c", rca::core::CStringUtils::join(TStrVec{"a", "b", "c"}, ", "));
    BOOST_REQUIRE_EQUAL("x|y", rca::core::CStringUtils::join(std::set<std::string>{"y", "x"}, "|"));
    BOOST_REQUIRE_EQUAL("", rca::core::CStringUtils::join(TStrVec{}, ","));

    BOOST_REQUIRE_EQUAL("mixed case", rca::core::CStringUtils::toLower("MiXeD CASE"));

    BOOST_REQUIRE_EQUAL(3, rca::core::CStringUtils::numMatches("db db and db", "db"));
    BOOST_REQUIRE_EQUAL(1, rca::core::CStringUtils::numMatches("aaaa", "aaa"));
    BOOST_REQUIRE_EQUAL(0, rca::core::CStringUtils::numMatches("anything", ""));
}

BOOST_AUTO_TEST_SUITE_END()
