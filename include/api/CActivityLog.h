/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_api_CActivityLog_h
#define INCLUDED_rca_api_CActivityLog_h

#include <core/CoreTypes.h>

#include <api/ImportExport.h>

#include <boost/circular_buffer.hpp>
#include <boost/optional.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace rca {
namespace api {

//! \brief A bounded, monotonic log of notable analysis events.
//!
//! DESCRIPTION:\n
//! Every event is assigned the next sequence number so a consumer can
//! poll for everything since the last sequence it saw. Only the most
//! recent events up to the capacity are retained.
class API_EXPORT CActivityLog {
public:
    enum EType {
        E_AnomalyDetected,
        E_IncidentCreated,
        E_IncidentClosed,
        E_RcaStarted,
        E_SuspectsGenerated,
        E_SuspectScoreUpdated,
        E_RcaFailed,
        E_LabelRecorded,
        E_ModelActivated
    };

    using TStrStrMap = std::map<std::string, std::string>;
    using TOptionalType = boost::optional<EType>;

    struct API_EXPORT SEvent {
        std::uint64_t s_Sequence{0};
        core_t::TTime s_Time{0};
        EType s_Type{E_AnomalyDetected};
        std::string s_Service;
        std::string s_Message;
        TStrStrMap s_Metadata;
    };

    using TEventVec = std::vector<SEvent>;

    static const std::size_t DEFAULT_LIMIT;

public:
    explicit CActivityLog(std::size_t capacity);

    //! Append an event.
    //!
    //! \return Its sequence number.
    std::uint64_t record(core_t::TTime time,
                         EType type,
                         const std::string& service,
                         const std::string& message,
                         TStrStrMap metadata = TStrStrMap{});

    //! Get up to \p limit events with sequence greater than \p cursor,
    //! oldest first, optionally only those of type \p type.
    TEventVec eventsSince(std::uint64_t cursor,
                          std::size_t limit = DEFAULT_LIMIT,
                          TOptionalType type = TOptionalType{}) const;

    //! Get up to \p limit events at or after \p time, oldest first.
    TEventVec eventsAfter(core_t::TTime time, std::size_t limit = DEFAULT_LIMIT) const;

    //! Get the sequence number of the latest event, zero if none.
    std::uint64_t lastSequence() const;

    static const std::string& print(EType type);
    static bool parse(const std::string& name, EType& type);

private:
    using TEventBuffer = boost::circular_buffer<SEvent>;

private:
    mutable std::mutex m_Mutex;
    TEventBuffer m_Events;
    std::uint64_t m_LastSequence{0};
};
}
}

#endif // INCLUDED_rca_api_CActivityLog_h
