/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_t_CoreTypes_h
#define INCLUDED_rca_core_t_CoreTypes_h

#include <time.h>

namespace rca {
namespace core_t {

//! Telemetry timestamps are held in whole seconds since the epoch (UTC).
using TTime = time_t;

//! The standard line ending for the platform - DON'T make this std::string as
//! that would cause many strings to be constructed (since the variable is
//! const at the namespace level, so is internal to each file this header is
//! included in)
#ifdef Windows
const char* const LINE_ENDING = "\r\n";
#else
const char* const LINE_ENDING = "\n";
#endif
}

namespace constants {
//! The number of seconds in a minute.
const core_t::TTime MINUTE{60};
//! The number of seconds in an hour.
const core_t::TTime HOUR{3600};
}
}

#endif // INCLUDED_rca_core_t_CoreTypes_h
