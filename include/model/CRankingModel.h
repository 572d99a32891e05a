/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CRankingModel_h
#define INCLUDED_rca_model_CRankingModel_h

#include <core/CoreTypes.h>

#include <maths/CLogisticRegression.h>

#include <model/CEvidence.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <string>

namespace rca {
namespace model {

//! \brief A versioned, learned suspect scoring model.
//!
//! DESCRIPTION:\n
//! Wraps a logistic regression over evidence features together with the
//! feature schema it was trained on, the number of labels it was trained
//! on and its validation AUC. The predicted probability that a suspect is
//! the cause is its score.
//!
//! Models are immutable once built and are persisted as JSON.
class MODEL_EXPORT CRankingModel {
public:
    CRankingModel(std::string version,
                  model_t::TStrVec featureNames,
                  maths::CLogisticRegression regression,
                  std::size_t trainedOn,
                  double auc,
                  core_t::TTime createdAt);
    virtual ~CRankingModel() = default;

    const std::string& version() const { return m_Version; }
    const model_t::TStrVec& featureNames() const { return m_FeatureNames; }
    std::size_t trainedOn() const { return m_TrainedOn; }
    double auc() const { return m_Auc; }
    core_t::TTime createdAt() const { return m_CreatedAt; }
    const maths::CLogisticRegression& regression() const { return m_Regression; }

    //! Check the model can score evidence with the current schema.
    bool isValid() const;

    //! Get the score of \p evidence.
    //!
    //! \throws CModelSchemaError If the evidence doesn't provide every
    //! feature the model was trained on or the model can't predict.
    virtual double score(const SEvidence& evidence) const;

    //! Write the model as a single line JSON object.
    void persist(std::ostream& strm) const;

    //! Read a model written by persist.
    //!
    //! \return Null if \p json isn't a valid model.
    static std::unique_ptr<CRankingModel> restore(const std::string& json);

private:
    std::string m_Version;
    model_t::TStrVec m_FeatureNames;
    maths::CLogisticRegression m_Regression;
    std::size_t m_TrainedOn;
    double m_Auc;
    core_t::TTime m_CreatedAt;
};
}
}

#endif // INCLUDED_rca_model_CRankingModel_h
