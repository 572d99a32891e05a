/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CNonCopyable_h
#define INCLUDED_rca_core_CNonCopyable_h

#include <core/ImportExport.h>

namespace rca {
namespace core {

//! \brief
//! Equivalent to boost::noncopyable.
//!
//! DESCRIPTION:\n
//! Classes for which copying is not allowed should inherit privately
//! from this class.
//!
//! IMPLEMENTATION DECISIONS:\n
//! The class is exported from the DLL, which means that non-inlined
//! versions of its methods will be generated even though they're all
//! inlined.  This is what prevents Visual C++ warning C4275.
//!
class CORE_EXPORT CNonCopyable {
protected:
    CNonCopyable() = default;
    ~CNonCopyable() = default;

public:
    CNonCopyable(const CNonCopyable&) = delete;
    CNonCopyable& operator=(const CNonCopyable&) = delete;
};
}
}

#endif // INCLUDED_rca_core_CNonCopyable_h
