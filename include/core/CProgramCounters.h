/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CProgramCounters_h
#define INCLUDED_rca_core_CProgramCounters_h

#include <core/ImportExport.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace rca {
namespace counter_t {

//! The enum values must be explicitly assigned & names should have a meaningful prefix to effectively namespace counters
//! New counters may be added anywhere before E_LastEnumCounter and must be grouped by namespace prefix.
//! The E_LastEnumCounter value must be bumped for every new enum added.
//! Don't forget to also add a description of the new enum value to m_CounterDefinitions.
enum ECounterTypes {
    //! The number of metric samples accepted by the detector
    E_RcaNumberMetricSamples = 0,

    //! The number of metric samples dropped for arriving outside the lateness window
    E_RcaNumberLateSamplesDropped = 1,

    //! The number of input records rejected at the boundary
    E_RcaNumberRecordsRejected = 2,

    //! The number of anomaly episodes opened
    E_RcaNumberAnomalies = 3,

    //! The number of incidents opened
    E_RcaNumberIncidents = 4,

    //! The number of RCA runs started
    E_RcaNumberRunsStarted = 5,

    //! The number of RCA runs which completed
    E_RcaNumberRunsCompleted = 6,

    //! The number of RCA runs which failed or timed out
    E_RcaNumberRunsFailed = 7,

    //! The number of RCA triggers coalesced into a follow-up run
    E_RcaNumberRunsCoalesced = 8,

    //! The number of runs scored heuristically because the model was unusable
    E_RcaNumberModelFallbacks = 9,

    //! The number of labels recorded
    E_RcaNumberLabels = 10,

    //! The number of retraining attempts
    E_RcaNumberRetrains = 11,

    //! The number of model versions activated
    E_RcaNumberModelActivations = 12,

    //! The number of candidates excluded because evidence extraction failed
    E_RcaNumberExtractionFailures = 13,

    // Add any new values here

    //! This MUST be last, increment the value for every new enum added
    E_LastEnumCounter = 14
};

static constexpr std::size_t NUM_COUNTERS = static_cast<std::size_t>(E_LastEnumCounter);
}

namespace core {

struct SCounterDefinition {
    rca::counter_t::ECounterTypes s_Type;
    std::string s_Name;
    std::string s_Description;
};

//! \brief
//! A collection of runtime global counters
//!
//! DESCRIPTION:\n
//! A static collection of runtime global counters, atomically incremented
//!
//! To add a new counter, add it to the counter_t::ECounterTypes enum in
//! the penultimate position and add its details and description to the
//! m_CounterDefinitions array.
//!
//! Enums must not be 'reused'. If no longer needed add a comment to that effect.
//!
//! IMPLEMENTATION DECISIONS:\n
//! A singleton class: there should only be one collection of global counters
//!
class CORE_EXPORT CProgramCounters {
private:
    //! \brief
    //! An atomic counter object
    //!
    //! DESCRIPTION:\n
    //! A wrapper for an atomic uint64_t
    //!
    //! IMPLEMENTATION DECISIONS:\n
    //! Implicitly not copyable - because the atomic member is not copyable.
    //! Counter values are assumed to only ever increase, therefore incrementing
    //! and assigning are publicly accessible, decrementing is not.
    //!
    class CORE_EXPORT CCounter {
    public:
        CCounter() : m_Counter(0) {}

        CCounter& operator=(std::uint64_t counter) {
            m_Counter = counter;
            return *this;
        }

        CCounter& operator++() {
            ++m_Counter;
            return *this;
        }

        CCounter& operator+=(std::uint64_t counter) {
            m_Counter += counter;
            return *this;
        }

        operator std::uint64_t() const { return m_Counter; }

    private:
        std::atomic_uint_fast64_t m_Counter;
    };

private:
    using TCounter = CCounter;
    using TCounterArray = std::array<TCounter, counter_t::NUM_COUNTERS>;
    using TCounterDefinitionArray = std::array<SCounterDefinition, counter_t::NUM_COUNTERS>;

public:
    //! Singleton pattern
    static CProgramCounters& instance();

    //! Provide access to the relevant counter from the collection
    static TCounter& counter(counter_t::ECounterTypes counterType);
    static TCounter& counter(std::size_t index);

    //! Zero all counters - for use in tests which check counts.
    static void reset();

private:
    //! Constructor of a Singleton is private
    CProgramCounters() = default;
    CProgramCounters(CProgramCounters&) = delete;
    CProgramCounters& operator=(CProgramCounters&) = delete;

    //! The unique instance.
    static CProgramCounters ms_Instance;

    //! Collection of counters
    TCounterArray m_Counters;

    //! A dummy counter used if ever an attempt is made to access an unknown counter type
    TCounter m_DummyCounter;

    //! Descriptions of the counters. For use when printing the values.
    TCounterDefinitionArray m_CounterDefinitions{
        {{counter_t::E_RcaNumberMetricSamples, "E_RcaNumberMetricSamples",
          "Number of metric samples accepted by the anomaly detector"},
         {counter_t::E_RcaNumberLateSamplesDropped, "E_RcaNumberLateSamplesDropped",
          "Number of metric samples dropped for arriving outside the lateness window"},
         {counter_t::E_RcaNumberRecordsRejected, "E_RcaNumberRecordsRejected",
          "Number of malformed input records rejected"},
         {counter_t::E_RcaNumberAnomalies, "E_RcaNumberAnomalies", "Number of anomaly episodes opened"},
         {counter_t::E_RcaNumberIncidents, "E_RcaNumberIncidents", "Number of incidents opened"},
         {counter_t::E_RcaNumberRunsStarted, "E_RcaNumberRunsStarted", "Number of RCA runs started"},
         {counter_t::E_RcaNumberRunsCompleted, "E_RcaNumberRunsCompleted",
          "Number of RCA runs which completed"},
         {counter_t::E_RcaNumberRunsFailed, "E_RcaNumberRunsFailed",
          "Number of RCA runs which failed or timed out"},
         {counter_t::E_RcaNumberRunsCoalesced, "E_RcaNumberRunsCoalesced",
          "Number of RCA triggers coalesced into a follow-up run"},
         {counter_t::E_RcaNumberModelFallbacks, "E_RcaNumberModelFallbacks",
          "Number of RCA runs scored heuristically because the ranking model was unusable"},
         {counter_t::E_RcaNumberLabels, "E_RcaNumberLabels", "Number of suspect labels recorded"},
         {counter_t::E_RcaNumberRetrains, "E_RcaNumberRetrains", "Number of ranking model retraining attempts"},
         {counter_t::E_RcaNumberModelActivations, "E_RcaNumberModelActivations",
          "Number of ranking model versions activated"},
         {counter_t::E_RcaNumberExtractionFailures, "E_RcaNumberExtractionFailures",
          "Number of candidates excluded because evidence extraction failed"}}};

    //! Enabling printing out the current counters.
    friend CORE_EXPORT std::ostream& operator<<(std::ostream& o,
                                                const CProgramCounters& counters);
};
}
}

#endif // INCLUDED_rca_core_CProgramCounters_h
