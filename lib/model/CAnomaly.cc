/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CAnomaly.h>

#include <core/CStringUtils.h>

namespace rca {
namespace model {

std::string SAnomaly::makeId(const std::string& service,
                             const std::string& metric,
                             core_t::TTime start) {
    return "anom-" + service + '-' + metric + '-' + core::CStringUtils::typeToString(start);
}
}
}
