/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <model/CTelemetryTypes.h>

namespace rca {
namespace model {
namespace {

class CTypeVisitor : public boost::static_visitor<model_t::ESuspectType> {
public:
    model_t::ESuspectType operator()(const SDeploymentPayload&) const {
        return model_t::E_Deployment;
    }
    model_t::ESuspectType operator()(const SConfigChangePayload&) const {
        return model_t::E_ConfigChange;
    }
    model_t::ESuspectType operator()(const SFlagChangePayload&) const {
        return model_t::E_FlagChange;
    }
};

class CPayloadTextVisitor : public boost::static_visitor<std::string> {
public:
    std::string operator()(const SDeploymentPayload& payload) const {
        return payload.s_DiffSummary;
    }
    std::string operator()(const SConfigChangePayload& payload) const {
        std::string result{payload.s_Key};
        append(result, payload.s_OldValue);
        append(result, payload.s_NewValue);
        append(result, payload.s_DiffSummary);
        return result;
    }
    std::string operator()(const SFlagChangePayload& payload) const {
        std::string result{payload.s_FlagName};
        append(result, payload.s_NewState);
        return result;
    }

private:
    static void append(std::string& result, const std::string& part) {
        if (part.empty() == false) {
            result += ' ';
            result += part;
        }
    }
};
}

model_t::ESuspectType SChangeEvent::type() const {
    return boost::apply_visitor(CTypeVisitor(), s_Payload);
}

std::string SChangeEvent::payloadText() const {
    return boost::apply_visitor(CPayloadTextVisitor(), s_Payload);
}

bool SChangeEvent::isGlobal() const {
    return s_Service.empty() && this->type() == model_t::E_FlagChange;
}
}
}
