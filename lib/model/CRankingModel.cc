/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CRankingModel.h>

#include <core/CLogger.h>
#include <core/CRapidJsonLineWriter.h>

#include <model/CRcaError.h>

#include <rapidjson/document.h>
#include <rapidjson/ostreamwrapper.h>

#include <cmath>
#include <ostream>

namespace rca {
namespace model {
namespace {
const std::string VERSION_TAG{"version"};
const std::string TRAINED_ON_TAG{"trained_on"};
const std::string AUC_TAG{"auc"};
const std::string CREATED_AT_TAG{"created_at"};
const std::string FEATURE_NAMES_TAG{"feature_names"};
const std::string MEANS_TAG{"means"};
const std::string SCALES_TAG{"scales"};
const std::string WEIGHTS_TAG{"weights"};
const std::string BIAS_TAG{"bias"};

using TDoubleVec = std::vector<double>;

template<typename WRITER>
void writeDoubleArray(const std::string& name, const TDoubleVec& values, WRITER& writer) {
    writer.Key(name);
    writer.StartArray();
    for (auto value : values) {
        writer.Double(value);
    }
    writer.EndArray();
}

bool readDoubleArray(const rapidjson::Value& doc, const std::string& name, TDoubleVec& result) {
    auto i = doc.FindMember(name.c_str());
    if (i == doc.MemberEnd() || i->value.IsArray() == false) {
        LOG_ERROR(<< "Missing or invalid '" << name << "' in ranking model");
        return false;
    }
    result.clear();
    for (const auto& value : i->value.GetArray()) {
        if (value.IsNumber() == false) {
            LOG_ERROR(<< "Non-numeric value in '" << name << "' in ranking model");
            return false;
        }
        result.push_back(value.GetDouble());
    }
    return true;
}
}

CRankingModel::CRankingModel(std::string version,
                             model_t::TStrVec featureNames,
                             maths::CLogisticRegression regression,
                             std::size_t trainedOn,
                             double auc,
                             core_t::TTime createdAt)
    : m_Version{std::move(version)}, m_FeatureNames{std::move(featureNames)},
      m_Regression{std::move(regression)}, m_TrainedOn{trainedOn}, m_Auc{auc}, m_CreatedAt{createdAt} {
}

bool CRankingModel::isValid() const {
    if (m_Regression.fitted() == false || m_Regression.dimension() != m_FeatureNames.size()) {
        return false;
    }
    SEvidence evidence;
    for (const auto& name : m_FeatureNames) {
        if (!evidence.value(name)) {
            return false;
        }
    }
    return true;
}

double CRankingModel::score(const SEvidence& evidence) const {
    TDoubleVec x;
    if (evidence.toFeatureVector(m_FeatureNames, x) == false) {
        throw CModelSchemaError("Evidence is missing features required by model " + m_Version);
    }
    double result;
    if (m_Regression.predict(x, result) == false || std::isfinite(result) == false) {
        throw CModelSchemaError("Model " + m_Version + " failed to predict");
    }
    return result;
}

void CRankingModel::persist(std::ostream& strm) const {
    rapidjson::OStreamWrapper wrapper{strm};
    core::CRapidJsonLineWriter<rapidjson::OStreamWrapper> writer{wrapper};

    writer.StartObject();
    writer.addStringField(VERSION_TAG, m_Version);
    writer.addUIntField(TRAINED_ON_TAG, m_TrainedOn);
    writer.addDoubleField(AUC_TAG, m_Auc);
    writer.addIntField(CREATED_AT_TAG, m_CreatedAt);
    writer.Key(FEATURE_NAMES_TAG);
    writer.StartArray();
    for (const auto& name : m_FeatureNames) {
        writer.String(name);
    }
    writer.EndArray();
    writeDoubleArray(MEANS_TAG, m_Regression.means(), writer);
    writeDoubleArray(SCALES_TAG, m_Regression.scales(), writer);
    writeDoubleArray(WEIGHTS_TAG, m_Regression.weights(), writer);
    writer.addDoubleField(BIAS_TAG, m_Regression.bias());
    writer.EndObject();
    writer.Flush();
}

std::unique_ptr<CRankingModel> CRankingModel::restore(const std::string& json) {
    rapidjson::Document doc;
    if (doc.Parse(json.c_str()).HasParseError()) {
        LOG_ERROR(<< "JSON parse error " << doc.GetParseError() << " in ranking model");
        return nullptr;
    }
    if (doc.IsObject() == false) {
        LOG_ERROR(<< "Ranking model is not a JSON object");
        return nullptr;
    }

    auto version = doc.FindMember(VERSION_TAG.c_str());
    auto trainedOn = doc.FindMember(TRAINED_ON_TAG.c_str());
    auto auc = doc.FindMember(AUC_TAG.c_str());
    auto createdAt = doc.FindMember(CREATED_AT_TAG.c_str());
    auto bias = doc.FindMember(BIAS_TAG.c_str());
    auto featureNames = doc.FindMember(FEATURE_NAMES_TAG.c_str());
    if (version == doc.MemberEnd() || version->value.IsString() == false ||
        trainedOn == doc.MemberEnd() || trainedOn->value.IsUint64() == false ||
        auc == doc.MemberEnd() || auc->value.IsNumber() == false ||
        createdAt == doc.MemberEnd() || createdAt->value.IsInt64() == false ||
        bias == doc.MemberEnd() || bias->value.IsNumber() == false ||
        featureNames == doc.MemberEnd() || featureNames->value.IsArray() == false) {
        LOG_ERROR(<< "Ranking model is missing required fields");
        return nullptr;
    }

    model_t::TStrVec names;
    for (const auto& name : featureNames->value.GetArray()) {
        if (name.IsString() == false) {
            LOG_ERROR(<< "Invalid feature name in ranking model");
            return nullptr;
        }
        names.emplace_back(name.GetString(), name.GetStringLength());
    }

    TDoubleVec means;
    TDoubleVec scales;
    TDoubleVec weights;
    if (readDoubleArray(doc, MEANS_TAG, means) == false ||
        readDoubleArray(doc, SCALES_TAG, scales) == false ||
        readDoubleArray(doc, WEIGHTS_TAG, weights) == false) {
        return nullptr;
    }

    maths::CLogisticRegression regression;
    if (regression.parameters(std::move(means), std::move(scales), std::move(weights),
                              bias->value.GetDouble()) == false) {
        LOG_ERROR(<< "Inconsistent parameters in ranking model");
        return nullptr;
    }

    return std::make_unique<CRankingModel>(
        std::string{version->value.GetString(), version->value.GetStringLength()},
        std::move(names), std::move(regression),
        static_cast<std::size_t>(trainedOn->value.GetUint64()), auc->value.GetDouble(),
        static_cast<core_t::TTime>(createdAt->value.GetInt64()));
}
}
}
