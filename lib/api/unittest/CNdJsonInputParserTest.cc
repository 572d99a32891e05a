/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CProgramCounters.h>

#include <api/CNdJsonInputParser.h>

#include <test/CProgramCounterClearingFixture.h>

#include <boost/test/unit_test.hpp>

#include <functional>
#include <sstream>
#include <string>
#include <vector>

BOOST_FIXTURE_TEST_SUITE(CNdJsonInputParserTest, rca::test::CProgramCounterClearingFixture)

using namespace rca;

namespace {

class CTypeCollector {
public:
    explicit CTypeCollector(std::size_t stopAfter = 0) : m_StopAfter(stopAfter) {}

    bool operator()(const rapidjson::Document& document) {
        auto i = document.FindMember("type");
        m_Types.push_back(i != document.MemberEnd() && i->value.IsString()
                              ? i->value.GetString()
                              : std::string{});
        return m_StopAfter == 0 || m_Types.size() < m_StopAfter;
    }

    const std::vector<std::string>& types() const { return m_Types; }

private:
    std::size_t m_StopAfter;
    std::vector<std::string> m_Types;
};
}

BOOST_AUTO_TEST_CASE(testReadStream) {
    std::istringstream input{
        "{\"type\":\"metric\",\"service\":\"checkout\",\"metric\":\"error_rate\",\"ts\":60,\"value\":0.5}\n"
        "\n"
        "   \n"
        "{\"type\":\"deployment\",\"service\":\"checkout\",\"id\":\"d-1\",\"ts\":\"2024-03-01T12:00:00Z\"}\r\n"
        "{\"type\":\"log\",\"service\":\"checkout\",\"ts\":61,\"message\":\"line one\\nline two\"}"};

    CTypeCollector collector;
    api::CNdJsonInputParser parser{input};
    BOOST_TEST_REQUIRE(parser.readStream(std::ref(collector)));

    BOOST_REQUIRE_EQUAL(3, collector.types().size());
    BOOST_REQUIRE_EQUAL("metric", collector.types()[0]);
    BOOST_REQUIRE_EQUAL("deployment", collector.types()[1]);
    BOOST_REQUIRE_EQUAL("log", collector.types()[2]);
    BOOST_REQUIRE_EQUAL(3, parser.numberRecordsRead());
    BOOST_REQUIRE_EQUAL(0, parser.numberRecordsRejected());
}

BOOST_AUTO_TEST_CASE(testInvalidLinesAreSkipped) {
    std::istringstream input{"{\"type\":\"metric\"}\n"
                             "{\"type\":\"metric\",\n"
                             "not json at all\n"
                             "[1, 2, 3]\n"
                             "\"a string\"\n"
                             "{\"type\":\"tick\",\"ts\":120}\n"};

    CTypeCollector collector;
    api::CNdJsonInputParser parser{input};
    BOOST_TEST_REQUIRE(parser.readStream(std::ref(collector)));

    BOOST_REQUIRE_EQUAL(2, collector.types().size());
    BOOST_REQUIRE_EQUAL("tick", collector.types()[1]);
    BOOST_REQUIRE_EQUAL(2, parser.numberRecordsRead());
    BOOST_REQUIRE_EQUAL(4, parser.numberRecordsRejected());
    BOOST_REQUIRE_EQUAL(4, core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected));
}

BOOST_AUTO_TEST_CASE(testHandlerStopsReading) {
    std::istringstream input{"{\"type\":\"a\"}\n{\"type\":\"b\"}\n{\"type\":\"c\"}\n"};

    CTypeCollector collector{2};
    api::CNdJsonInputParser parser{input};
    BOOST_TEST_REQUIRE(parser.readStream(std::ref(collector)) == false);
    BOOST_REQUIRE_EQUAL(2, collector.types().size());
    BOOST_REQUIRE_EQUAL(2, parser.numberRecordsRead());

    // Reading resumes from where the handler stopped.
    CTypeCollector remainder;
    BOOST_TEST_REQUIRE(parser.readStream(std::ref(remainder)));
    BOOST_REQUIRE_EQUAL(1, remainder.types().size());
    BOOST_REQUIRE_EQUAL("c", remainder.types()[0]);
}

BOOST_AUTO_TEST_CASE(testEmptyStream) {
    std::istringstream input;

    CTypeCollector collector;
    api::CNdJsonInputParser parser{input};
    BOOST_TEST_REQUIRE(parser.readStream(std::ref(collector)));
    BOOST_TEST_REQUIRE(collector.types().empty());
    BOOST_REQUIRE_EQUAL(0, parser.numberRecordsRead());
}

BOOST_AUTO_TEST_SUITE_END()
