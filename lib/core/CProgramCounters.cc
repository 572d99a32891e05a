/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CProgramCounters.h>

#include <core/CLogger.h>
#include <core/CRapidJsonLineWriter.h>

#include <rapidjson/ostreamwrapper.h>

#include <ostream>
#include <string>

namespace rca {
namespace core {

namespace {

using TGenericLineWriter = core::CRapidJsonLineWriter<rapidjson::OStreamWrapper>;

const std::string NAME_TYPE("name");
const std::string DESCRIPTION_TYPE("description");
const std::string COUNTER_TYPE("value");

//! Helper function to add a string/int pair to JSON writer
void addStringInt(TGenericLineWriter& writer,
                  const std::string& name,
                  const std::string& description,
                  std::uint64_t counter) {
    writer.StartObject();
    writer.addStringField(NAME_TYPE, name);
    writer.addStringField(DESCRIPTION_TYPE, description);
    writer.addUIntField(COUNTER_TYPE, counter);
    writer.EndObject();
}
}

CProgramCounters& CProgramCounters::instance() {
    return ms_Instance;
}

CProgramCounters::TCounter& CProgramCounters::counter(counter_t::ECounterTypes counterType) {
    return counter(static_cast<std::size_t>(counterType));
}

CProgramCounters::TCounter& CProgramCounters::counter(std::size_t index) {
    if (index >= ms_Instance.m_Counters.size()) {
        LOG_WARN(<< "Bad index " << index);
        return ms_Instance.m_DummyCounter;
    }
    return ms_Instance.m_Counters[index];
}

void CProgramCounters::reset() {
    for (auto& counter : ms_Instance.m_Counters) {
        counter = 0;
    }
}

CProgramCounters CProgramCounters::ms_Instance;

std::ostream& operator<<(std::ostream& o, const CProgramCounters& counters) {
    rapidjson::OStreamWrapper writeStream(o);
    TGenericLineWriter writer(writeStream);

    writer.StartArray();

    // Take care to print in definition order, skipping 0 values
    for (const auto& ctr : counters.m_CounterDefinitions) {
        std::uint64_t value{counters.m_Counters[static_cast<std::size_t>(ctr.s_Type)]};
        if (value != 0) {
            addStringInt(writer, ctr.s_Name, ctr.s_Description, value);
        }
    }

    writer.EndArray();
    writeStream.Flush();

    return o;
}
}
}
