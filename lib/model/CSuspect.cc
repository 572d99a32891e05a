/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CSuspect.h>

namespace rca {
namespace model {

const std::string SSuspect::HEURISTIC{"heuristic"};

std::string SSuspect::makeId(const SCandidate& candidate) {
    return candidate.s_IncidentId + ':' + model_t::print(candidate.s_Type) + ':' + candidate.s_Key;
}
}
}
