/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CStopWatch_h
#define INCLUDED_rca_core_CStopWatch_h

#include <core/ImportExport.h>

#include <chrono>
#include <cstdint>

namespace rca {
namespace core {

//! \brief
//! Can be used for timing within a program
//!
//! DESCRIPTION:\n
//! Can be used for timing within a program when intervals must be
//! measured more accurately than to the nearest second.  The engine
//! uses it to enforce RCA run deadlines.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The interface mirrors the stop watch functionality you would expect
//! on a cheap digital watch.
//!
//! Readings come from std::chrono::steady_clock so they never go
//! backwards if the user sets the clock.
//!
class CORE_EXPORT CStopWatch {
public:
    //! Construct a stop watch, optionally starting it immediately
    explicit CStopWatch(bool startRunning = false);

    //! Start the stop watch
    void start();

    //! Stop the stop watch and retrieve the accumulated reading
    std::uint64_t stop();

    //! Retrieve the accumulated reading from the stop watch without
    //! stopping it.
    std::uint64_t lap() const;

    //! Is the stop watch running?
    bool isRunning() const;

    //! Reset the stop watch, optionally starting it immediately
    void reset(bool startRunning = false);

private:
    using TClock = std::chrono::steady_clock;

private:
    //! Milliseconds since the stop watch was last started
    std::uint64_t calcDuration() const;

private:
    //! Is the stop watch currently running?
    bool m_IsRunning;

    //! When the stop watch was last started
    TClock::time_point m_Start;

    //! Time (in milliseconds) accumulated over previous runs of the stop
    //! watch since the last reset
    std::uint64_t m_AccumulatedTime;
};
}
}

#endif // INCLUDED_rca_core_CStopWatch_h
