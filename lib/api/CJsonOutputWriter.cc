/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <api/CJsonOutputWriter.h>

#include <core/CLogger.h>

#include <model/CRankingModel.h>
#include <model/ModelTypes.h>

#include <api/CRcaEngine.h>

#include <cstdint>
#include <ostream>

namespace rca {
namespace api {
namespace {

// JSON field names
const std::string INCIDENTS("incidents");
const std::string ANOMALIES("anomalies");
const std::string SUSPECTS("suspects");
const std::string ACTIVITY("activity");
const std::string MODELS("models");
const std::string ACTIVE_MODEL("active_model");
const std::string EVALUATION("evaluation");
const std::string ID("id");
const std::string TITLE("title");
const std::string STATUS("status");
const std::string START_TS("start_ts");
const std::string END_TS("end_ts");
const std::string SUMMARY("summary");
const std::string SERVICES("services");
const std::string SERVICE("service");
const std::string METRIC("metric");
const std::string RCA_STATUS("rca_status");
const std::string RCA_FAILED("rca_failed");
const std::string SUSPECTS_COUNT("suspects_count");
const std::string SCORE("score");
const std::string DETECTOR("detector");
const std::string OPEN("open");
const std::string DETAILS("details");
const std::string BASELINE_MEDIAN("baseline_median");
const std::string BASELINE_SPREAD("baseline_spread");
const std::string DIRECTION("direction");
const std::string AGGREGATE("aggregate");
const std::string THRESHOLD("threshold");
const std::string INCIDENT_ID("incident_id");
const std::string RANK("rank");
const std::string SUSPECT_TYPE("suspect_type");
const std::string SUSPECT_KEY("suspect_key");
const std::string CHANGE_TS("change_ts");
const std::string SCORED_BY("scored_by");
const std::string EVIDENCE("evidence");
const std::string SEQUENCE("sequence");
const std::string TS("ts");
const std::string TYPE("type");
const std::string MESSAGE("message");
const std::string METADATA("metadata");
const std::string VERSION("version");
const std::string TRAINED_ON("trained_on");
const std::string AUC("auc");
const std::string CREATED_AT("created_at");
const std::string NUM_INCIDENTS("num_incidents");
const std::string NUM_WITH_TRUE_CAUSE("num_with_true_cause");
const std::string PRECISION_AT_1("precision_at_1");
const std::string PRECISION_AT_3("precision_at_3");
const std::string MRR("mrr");
const std::string AVG_TIME_TO_DETECT("avg_time_to_detect_minutes");
const std::string INDIVIDUAL_RESULTS("individual_results");
const std::string TRUE_CAUSE_RANK("true_cause_rank");
const std::string TIME_TO_DETECT("time_to_detect_minutes");
}

CJsonOutputWriter::CJsonOutputWriter(std::ostream& strmOut)
    : m_WriteStream(strmOut), m_Writer(m_WriteStream) {
}

void CJsonOutputWriter::writeResults(const CRcaEngine& engine,
                                     const CEvaluator::SSummary* evaluation) {
    m_Writer.StartObject();

    m_Writer.Key(INCIDENTS);
    m_Writer.StartArray();
    for (const auto& incident : engine.incidents()) {
        m_Writer.StartObject();
        this->writeIncident(incident);

        m_Writer.Key(ANOMALIES);
        m_Writer.StartArray();
        for (const auto& anomaly : engine.anomalies(incident.s_Id)) {
            this->writeAnomaly(anomaly);
        }
        m_Writer.EndArray();

        m_Writer.Key(SUSPECTS);
        m_Writer.StartArray();
        for (const auto& suspect : engine.suspects(incident.s_Id)) {
            this->writeSuspect(suspect);
        }
        m_Writer.EndArray();

        m_Writer.EndObject();
    }
    m_Writer.EndArray();

    m_Writer.Key(ACTIVITY);
    m_Writer.StartArray();
    std::uint64_t cursor{0};
    for (;;) {
        CActivityLog::TEventVec events{engine.activity().eventsSince(cursor)};
        if (events.empty()) {
            break;
        }
        for (const auto& event : events) {
            this->writeEvent(event);
        }
        cursor = events.back().s_Sequence;
    }
    m_Writer.EndArray();

    this->writeModels(engine.models());

    if (evaluation != nullptr) {
        m_Writer.Key(EVALUATION);
        this->writeEvaluation(*evaluation);
    }

    m_Writer.EndObject();
    m_Writer.Flush();
}

void CJsonOutputWriter::writeIncident(const model::SIncident& incident) {
    m_Writer.addStringField(ID, incident.s_Id);
    m_Writer.addStringField(TITLE, incident.s_Title);
    m_Writer.addStringField(STATUS, model_t::print(incident.s_Status));
    m_Writer.addTimeField(START_TS, incident.s_Start);
    m_Writer.addOptionalTimeField(END_TS, incident.s_End);
    m_Writer.addStringField(SUMMARY, incident.s_Summary);
    m_Writer.Key(SERVICES);
    m_Writer.StartArray();
    for (const auto& service : incident.s_Services) {
        m_Writer.String(service);
    }
    m_Writer.EndArray();
    m_Writer.addStringField(RCA_STATUS, model_t::print(incident.s_RcaStatus));
    m_Writer.addUIntField(SUSPECTS_COUNT, incident.s_SuspectsCount);
    m_Writer.addBoolField(RCA_FAILED, incident.s_RcaFailed);
}

void CJsonOutputWriter::writeAnomaly(const model::SAnomaly& anomaly) {
    m_Writer.StartObject();
    m_Writer.addStringField(ID, anomaly.s_Id);
    m_Writer.addStringField(SERVICE, anomaly.s_Service);
    m_Writer.addStringField(METRIC, anomaly.s_Metric);
    m_Writer.addTimeField(START_TS, anomaly.s_Start);
    m_Writer.addTimeField(END_TS, anomaly.s_End);
    m_Writer.addDoubleField(SCORE, anomaly.s_Score);
    m_Writer.addStringField(DETECTOR, anomaly.s_Detector);
    m_Writer.addBoolField(OPEN, anomaly.s_Open);
    m_Writer.Key(DETAILS);
    m_Writer.StartObject();
    m_Writer.addDoubleField(BASELINE_MEDIAN, anomaly.s_Details.s_BaselineMedian);
    m_Writer.addDoubleField(BASELINE_SPREAD, anomaly.s_Details.s_BaselineSpread);
    m_Writer.addStringField(DIRECTION, model_t::print(anomaly.s_Details.s_Direction));
    m_Writer.addDoubleField(AGGREGATE, anomaly.s_Details.s_Aggregate);
    m_Writer.addDoubleField(THRESHOLD, anomaly.s_Details.s_Threshold);
    m_Writer.EndObject();
    m_Writer.EndObject();
}

void CJsonOutputWriter::writeSuspect(const model::SSuspect& suspect) {
    m_Writer.StartObject();
    m_Writer.addStringField(ID, suspect.s_Id);
    m_Writer.addStringField(INCIDENT_ID, suspect.s_IncidentId);
    m_Writer.addUIntField(RANK, suspect.s_Rank);
    m_Writer.addDoubleField(SCORE, suspect.s_Score);
    m_Writer.addStringField(SUSPECT_TYPE, model_t::print(suspect.s_Type));
    m_Writer.addStringField(SUSPECT_KEY, suspect.s_Key);
    m_Writer.addStringField(SERVICE, suspect.s_Service);
    m_Writer.addTimeField(CHANGE_TS, suspect.s_ChangeTime);
    m_Writer.addStringField(SCORED_BY, suspect.s_ScoredBy);
    m_Writer.Key(EVIDENCE);
    this->writeEvidence(suspect.s_Evidence);
    m_Writer.EndObject();
}

void CJsonOutputWriter::writeEvidence(const model::SEvidence& evidence) {
    m_Writer.StartObject();
    for (const auto& field : evidence.toMap()) {
        m_Writer.addDoubleField(field.first, field.second);
    }
    m_Writer.EndObject();
}

void CJsonOutputWriter::writeEvent(const CActivityLog::SEvent& event) {
    m_Writer.StartObject();
    m_Writer.addUIntField(SEQUENCE, event.s_Sequence);
    m_Writer.addTimeField(TS, event.s_Time);
    m_Writer.addStringField(TYPE, CActivityLog::print(event.s_Type));
    m_Writer.addStringField(SERVICE, event.s_Service);
    m_Writer.addStringField(MESSAGE, event.s_Message);
    m_Writer.Key(METADATA);
    m_Writer.StartObject();
    for (const auto& entry : event.s_Metadata) {
        m_Writer.addStringField(entry.first, entry.second);
    }
    m_Writer.EndObject();
    m_Writer.EndObject();
}

void CJsonOutputWriter::writeModels(const model::CRankingModelRegistry& registry) {
    model::CRankingModelRegistry::TRankingModelCPtr active{registry.active()};
    m_Writer.Key(ACTIVE_MODEL);
    if (active != nullptr) {
        m_Writer.String(active->version());
    } else {
        m_Writer.Null();
    }

    m_Writer.Key(MODELS);
    m_Writer.StartArray();
    for (const auto& version : registry.versions()) {
        m_Writer.StartObject();
        m_Writer.addStringField(VERSION, version->version());
        m_Writer.addUIntField(TRAINED_ON, version->trainedOn());
        m_Writer.addDoubleField(AUC, version->auc());
        m_Writer.addTimeField(CREATED_AT, version->createdAt());
        m_Writer.EndObject();
    }
    m_Writer.EndArray();
}

void CJsonOutputWriter::writeEvaluation(const CEvaluator::SSummary& evaluation) {
    m_Writer.StartObject();
    m_Writer.addUIntField(NUM_INCIDENTS, evaluation.s_NumberIncidents);
    m_Writer.addUIntField(NUM_WITH_TRUE_CAUSE, evaluation.s_NumberWithTrueCause);
    this->writeOptionalDouble(PRECISION_AT_1, evaluation.s_PrecisionAt1);
    this->writeOptionalDouble(PRECISION_AT_3, evaluation.s_PrecisionAt3);
    this->writeOptionalDouble(MRR, evaluation.s_MeanReciprocalRank);
    this->writeOptionalDouble(AVG_TIME_TO_DETECT, evaluation.s_MeanTimeToDetectMinutes);
    m_Writer.Key(INDIVIDUAL_RESULTS);
    m_Writer.StartArray();
    for (const auto& result : evaluation.s_Incidents) {
        m_Writer.StartObject();
        m_Writer.addStringField(INCIDENT_ID, result.s_IncidentId);
        m_Writer.Key(TRUE_CAUSE_RANK);
        if (result.s_HasTrueCause && result.s_TrueCauseRank > 0) {
            m_Writer.Uint64(result.s_TrueCauseRank);
        } else {
            m_Writer.Null();
        }
        this->writeOptionalDouble(TIME_TO_DETECT, result.s_TimeToDetectMinutes);
        m_Writer.EndObject();
    }
    m_Writer.EndArray();
    m_Writer.EndObject();
}

void CJsonOutputWriter::writeOptionalDouble(const std::string& name,
                                            const CEvaluator::TOptionalDouble& value) {
    m_Writer.Key(name);
    if (value) {
        m_Writer.Double(*value);
    } else {
        m_Writer.Null();
    }
}
}
}
