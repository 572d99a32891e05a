/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CTimeUtils_h
#define INCLUDED_rca_core_CTimeUtils_h

#include <core/CNonInstantiatable.h>
#include <core/CoreTypes.h>
#include <core/ImportExport.h>

#include <cstdint>
#include <string>

namespace rca {
namespace core {

//! \brief
//! A holder of time utility methods.
//!
//! DESCRIPTION:\n
//! A holder of time utility methods.  All methods are static; an object of
//! this class should never be constructed.
//!
//! IMPLEMENTATION DECISIONS:\n
//! All conversions are in UTC.  Telemetry from many hosts is compared on
//! one time line so local time conventions never apply.
//!
class CORE_EXPORT CTimeUtils : private CNonInstantiatable {
public:
    //! Current time in seconds since the epoch
    static core_t::TTime now();

    //! Current time in milliseconds since the epoch
    static std::int64_t nowMs();

    //! Date and time to string according to http://www.w3.org/TR/NOTE-datetime
    //! in UTC, e.g. 1997-07-16T19:20:30Z
    static std::string toIso8601(core_t::TTime t);

    //! Parse a W3C date time.  Accepts a trailing "Z" or a numeric UTC
    //! offset and ignores fractional seconds.
    static bool fromIso8601(const std::string& dateTime, core_t::TTime& result);

    //! Converts an epoch seconds timestamp to epoch millis
    static std::int64_t toEpochMs(core_t::TTime t);

    //! strptime interface
    //! NOTE: the time returned here is a UTC value
    static bool strptime(const std::string& format,
                         const std::string& dateTime,
                         core_t::TTime& preTime);

    //! Formats the given duration as human-readable string, e.g. 1h5m3s.
    static std::string durationToString(core_t::TTime duration);
};
}
}

#endif // INCLUDED_rca_core_CTimeUtils_h
