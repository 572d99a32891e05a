/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CNonInstantiatable_h
#define INCLUDED_rca_core_CNonInstantiatable_h

#include <core/ImportExport.h>

namespace rca {
namespace core {

//! \brief
//! Prevent instantiation of a class that only has static members.
//!
//! DESCRIPTION:\n
//! Classes that consist entirely of static methods should inherit
//! privately from this class.
//!
class CORE_EXPORT CNonInstantiatable {
private:
    CNonInstantiatable() = delete;
    CNonInstantiatable(const CNonInstantiatable&) = delete;
};
}
}

#endif // INCLUDED_rca_core_CNonInstantiatable_h
