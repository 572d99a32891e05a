/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_model_CRankingModelRegistry_h
#define INCLUDED_rca_model_CRankingModelRegistry_h

#include <core/CNonCopyable.h>

#include <model/CRankingModel.h>
#include <model/ImportExport.h>

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rca {
namespace model {

//! \brief Holds every ranking model version and which one is active.
//!
//! DESCRIPTION:\n
//! Versions are retained after they are superseded so that an operator
//! can roll back to any of them.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Scorers take a snapshot of the active model with active() and keep
//! using it for the whole run. Activation swaps the pointer atomically
//! so it never blocks, or is blocked by, scoring.
class MODEL_EXPORT CRankingModelRegistry : private core::CNonCopyable {
public:
    using TRankingModelCPtr = std::shared_ptr<const CRankingModel>;
    using TRankingModelCPtrVec = std::vector<TRankingModelCPtr>;

public:
    //! Get a snapshot of the active model, null if there is none.
    TRankingModelCPtr active() const;

    //! Add \p model to the history and optionally activate it.
    //!
    //! \return False if \p model is null, invalid or its version exists.
    bool publish(TRankingModelCPtr model, bool activate = true);

    //! Activate the retained version \p version.
    //!
    //! \return False if there is no such version.
    bool activate(const std::string& version);

    //! Stop using any model, i.e. score heuristically.
    void deactivate();

    //! Get every retained version in publication order.
    TRankingModelCPtrVec versions() const;

    //! Get an unused version identifier.
    std::string nextVersion() const;

private:
    mutable std::mutex m_HistoryMutex;
    TRankingModelCPtrVec m_History;
    //! Only accessed with std::atomic_load and std::atomic_store.
    TRankingModelCPtr m_Active;
};
}
}

#endif // INCLUDED_rca_model_CRankingModelRegistry_h
