/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CTelemetryRecordHandler.h>

#include <core/CLogger.h>
#include <core/CProgramCounters.h>
#include <core/CTimeUtils.h>

#include <model/CRcaError.h>
#include <model/ModelTypes.h>

#include <api/CRcaEngine.h>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cmath>
#include <initializer_list>
#include <limits>

namespace rca {
namespace api {
namespace {
const std::string TYPE{"type"};
const std::string TS{"ts"};

//! Read a string field, writing objects and arrays as JSON text.
bool readText(const rapidjson::Value& record, const char* name, std::string& result) {
    auto i = record.FindMember(name);
    if (i == record.MemberEnd() || i->value.IsNull()) {
        return false;
    }
    const rapidjson::Value& value{i->value};
    if (value.IsString()) {
        result.assign(value.GetString(), value.GetStringLength());
        return true;
    }
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer{buffer};
    value.Accept(writer);
    result.assign(buffer.GetString(), buffer.GetSize());
    return true;
}

//! Read a string field, trying \p names in order.
std::string readFirst(const rapidjson::Value& record, std::initializer_list<const char*> names) {
    std::string result;
    for (const auto& name : names) {
        if (readText(record, name, result)) {
            break;
        }
    }
    return result;
}

bool readDouble(const rapidjson::Value& record, const char* name, double& result) {
    auto i = record.FindMember(name);
    if (i == record.MemberEnd() || i->value.IsNumber() == false) {
        return false;
    }
    result = i->value.GetDouble();
    return true;
}

bool decodeChangeCommon(const rapidjson::Value& record, model::SChangeEvent& change) {
    change.s_Service = readFirst(record, {"service"});
    return CTelemetryRecordHandler::decodeTime(record, change.s_Time);
}

std::string defaultId(const std::string& key, core_t::TTime time) {
    return key + "@" + core::CTimeUtils::toIso8601(time);
}
}

CTelemetryRecordHandler::CTelemetryRecordHandler(CRcaEngine& engine) : m_Engine(engine) {
}

bool CTelemetryRecordHandler::handleRecord(const rapidjson::Value& record) {
    std::string type;
    if (record.IsObject() == false || readText(record, TYPE.c_str(), type) == false) {
        this->reject("unknown", "missing record type");
        return true;
    }

    // Records the engine rejects are counted by the engine.
    bool accepted{false};
    if (type == "metric") {
        model::SMetricSample sample;
        if (decodeMetric(record, sample) == false) {
            this->reject(type, "invalid metric sample");
            return true;
        }
        accepted = m_Engine.addMetric(sample);
    } else if (type == "log") {
        model::SLogEntry entry;
        if (decodeLog(record, entry) == false) {
            this->reject(type, "invalid log entry");
            return true;
        }
        accepted = m_Engine.addLog(entry);
    } else if (type == model_t::print(model_t::E_Deployment) ||
               type == model_t::print(model_t::E_ConfigChange) ||
               type == model_t::print(model_t::E_FlagChange)) {
        model::SChangeEvent change;
        bool decoded{type == model_t::print(model_t::E_Deployment)
                         ? decodeDeployment(record, change)
                         : (type == model_t::print(model_t::E_ConfigChange)
                                ? decodeConfigChange(record, change)
                                : decodeFlagChange(record, change))};
        if (decoded == false) {
            this->reject(type, "invalid change event");
            return true;
        }
        accepted = m_Engine.addChange(change);
    } else if (type == "label") {
        if (this->handleLabel(record)) {
            ++m_Handled;
        }
        return true;
    } else if (type == "rerun") {
        if (this->handleRerun(record)) {
            ++m_Handled;
        }
        return true;
    } else if (type == "tick") {
        if (this->handleTick(record)) {
            ++m_Handled;
        }
        return true;
    } else {
        this->reject(type, "unsupported record type");
        return true;
    }

    if (accepted) {
        ++m_Handled;
    } else {
        ++m_Rejected;
    }
    return true;
}

std::size_t CTelemetryRecordHandler::numberRejected() const {
    return m_Rejected;
}

std::size_t CTelemetryRecordHandler::numberHandled() const {
    return m_Handled;
}

bool CTelemetryRecordHandler::decodeTime(const rapidjson::Value& record, core_t::TTime& time) {
    auto i = record.FindMember(TS.c_str());
    if (i == record.MemberEnd()) {
        return false;
    }
    if (i->value.IsString()) {
        return core::CTimeUtils::fromIso8601(i->value.GetString(), time);
    }
    if (i->value.IsInt64()) {
        time = i->value.GetInt64();
        return true;
    }
    if (i->value.IsNumber()) {
        // The bounds are exact powers of two so the comparisons are exact.
        static const double MINIMUM{static_cast<double>(std::numeric_limits<core_t::TTime>::min())};
        static const double MAXIMUM{-MINIMUM};
        double seconds{std::floor(i->value.GetDouble())};
        if (std::isfinite(seconds) == false || seconds < MINIMUM || seconds >= MAXIMUM) {
            LOG_DEBUG(<< "Timestamp " << i->value.GetDouble() << " is out of range");
            return false;
        }
        time = static_cast<core_t::TTime>(seconds);
        return true;
    }
    return false;
}

bool CTelemetryRecordHandler::decodeMetric(const rapidjson::Value& record,
                                           model::SMetricSample& sample) {
    sample.s_Service = readFirst(record, {"service"});
    sample.s_Metric = readFirst(record, {"metric", "name"});
    return sample.s_Service.empty() == false && sample.s_Metric.empty() == false &&
           readDouble(record, "value", sample.s_Value) && decodeTime(record, sample.s_Time);
}

bool CTelemetryRecordHandler::decodeLog(const rapidjson::Value& record, model::SLogEntry& entry) {
    entry.s_Service = readFirst(record, {"service"});
    if (entry.s_Service.empty() || decodeTime(record, entry.s_Time) == false) {
        return false;
    }
    std::string level{readFirst(record, {"level"})};
    if (level.empty() == false && model_t::parseLogLevel(level, entry.s_Level) == false) {
        LOG_DEBUG(<< "Unknown log level '" << level << "'");
        return false;
    }
    entry.s_Signature = readFirst(record, {"event", "signature"});
    entry.s_Message = readFirst(record, {"message"});
    entry.s_TraceId = readFirst(record, {"trace_id"});
    return true;
}

bool CTelemetryRecordHandler::decodeDeployment(const rapidjson::Value& record,
                                               model::SChangeEvent& change) {
    if (decodeChangeCommon(record, change) == false) {
        return false;
    }
    model::SDeploymentPayload payload;
    payload.s_CommitSha = readFirst(record, {"commit_sha"});
    payload.s_Version = readFirst(record, {"version"});
    payload.s_Author = readFirst(record, {"author"});
    payload.s_DiffSummary = readFirst(record, {"diff_summary"});
    change.s_Id = readFirst(record, {"id"});
    if (change.s_Id.empty()) {
        change.s_Id = payload.s_CommitSha.empty() ? payload.s_Version : payload.s_CommitSha;
    }
    change.s_Payload = std::move(payload);
    return change.s_Id.empty() == false;
}

bool CTelemetryRecordHandler::decodeConfigChange(const rapidjson::Value& record,
                                                 model::SChangeEvent& change) {
    if (decodeChangeCommon(record, change) == false) {
        return false;
    }
    model::SConfigChangePayload payload;
    payload.s_Key = readFirst(record, {"key", "config_key"});
    if (payload.s_Key.empty()) {
        return false;
    }
    payload.s_OldValue = readFirst(record, {"old_value", "old_value_hash"});
    payload.s_NewValue = readFirst(record, {"new_value", "new_value_hash"});
    payload.s_DiffSummary = readFirst(record, {"diff_summary"});
    payload.s_Source = readFirst(record, {"source"});
    change.s_Id = readFirst(record, {"id"});
    if (change.s_Id.empty()) {
        change.s_Id = defaultId(payload.s_Key, change.s_Time);
    }
    change.s_Payload = std::move(payload);
    return true;
}

bool CTelemetryRecordHandler::decodeFlagChange(const rapidjson::Value& record,
                                               model::SChangeEvent& change) {
    if (decodeChangeCommon(record, change) == false) {
        return false;
    }
    model::SFlagChangePayload payload;
    payload.s_FlagName = readFirst(record, {"flag_name", "flag"});
    if (payload.s_FlagName.empty()) {
        return false;
    }
    payload.s_OldState = readFirst(record, {"old_state"});
    payload.s_NewState = readFirst(record, {"new_state"});
    change.s_Id = readFirst(record, {"id"});
    if (change.s_Id.empty()) {
        change.s_Id = defaultId(payload.s_FlagName, change.s_Time);
    }
    change.s_Payload = std::move(payload);
    return true;
}

bool CTelemetryRecordHandler::handleLabel(const rapidjson::Value& record) {
    std::string incidentId{readFirst(record, {"incident_id"})};
    std::string suspectId{readFirst(record, {"suspect_id"})};

    bool isCause{false};
    auto label = record.FindMember("label");
    if (label == record.MemberEnd()) {
        this->reject("label", "missing label value");
        return false;
    }
    if (label->value.IsBool()) {
        isCause = label->value.GetBool();
    } else if (label->value.IsNumber() &&
               (label->value.GetDouble() == 0.0 || label->value.GetDouble() == 1.0)) {
        isCause = label->value.GetDouble() == 1.0;
    } else {
        this->reject("label", "label value must be 0 or 1");
        return false;
    }

    core_t::TTime time{m_Engine.now()};
    if (record.HasMember(TS.c_str()) && decodeTime(record, time) == false) {
        this->reject("label", "invalid timestamp");
        return false;
    }

    try {
        m_Engine.submitLabel(incidentId, suspectId, isCause, time,
                             readFirst(record, {"annotator"}), readFirst(record, {"notes"}));
    } catch (const model::CRcaError& e) {
        this->reject("label", e.what());
        return false;
    }
    return true;
}

bool CTelemetryRecordHandler::handleRerun(const rapidjson::Value& record) {
    std::string incidentId{readFirst(record, {"incident_id"})};
    try {
        m_Engine.rerun(incidentId);
    } catch (const model::CRcaError& e) {
        this->reject("rerun", e.what());
        return false;
    }
    return true;
}

bool CTelemetryRecordHandler::handleTick(const rapidjson::Value& record) {
    core_t::TTime time{0};
    if (decodeTime(record, time) == false) {
        this->reject("tick", "invalid timestamp");
        return false;
    }
    m_Engine.tick(time);
    return true;
}

void CTelemetryRecordHandler::reject(const std::string& type, const std::string& reason) {
    LOG_WARN(<< "Rejecting " << type << " record: " << reason);
    ++core::CProgramCounters::counter(counter_t::E_RcaNumberRecordsRejected);
    ++m_Rejected;
}
}
}
