/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CFeedbackStore_h
#define INCLUDED_rca_model_CFeedbackStore_h

#include <core/CNonCopyable.h>

#include <model/CLabel.h>
#include <model/ImportExport.h>
#include <model/ModelTypes.h>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace rca {
namespace model {

//! \brief An append only store of suspect labels.
//!
//! DESCRIPTION:\n
//! Every label submitted is retained. For training, a later label for
//! the same (incident, suspect) pair supersedes earlier ones.
class MODEL_EXPORT CFeedbackStore : private core::CNonCopyable {
public:
    //! Append \p label, assigning its sequence number.
    //!
    //! \return The sequence number.
    std::uint64_t append(SLabel label);

    //! Get every label in submission order.
    TLabelVec labels() const;

    //! Get the latest label for each (incident, suspect) pair in order of
    //! their first submission.
    TLabelVec latestLabels() const;

    //! Get the number of labels submitted.
    std::size_t size() const;

    //! Get the fraction of labelled incidents, other than \p excludeIncidentId,
    //! in which a change of \p type to \p service was confirmed as the cause.
    double historicalRisk(model_t::ESuspectType type,
                          const std::string& service,
                          const std::string& excludeIncidentId) const;

private:
    mutable std::mutex m_Mutex;
    TLabelVec m_Labels;
};
}
}

#endif // INCLUDED_rca_model_CFeedbackStore_h
