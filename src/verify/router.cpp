#include "verify/router.hpp"
#include "common/exceptions.hpp"

namespace verifier {

agent_role coding_agent(runtime rt) {
    switch (rt) {
        case runtime::PYTHON: return agent_role::PYTHON_AGENT;
        case runtime::NODE: return agent_role::JAVASCRIPT_AGENT;
        case runtime::TYPESCRIPT: return agent_role::TYPESCRIPT_AGENT;
    }
    throw internal_error("unknown runtime");
}

agent_role route(failure_category category, severity sev, runtime rt) {
    switch (category) {
        case failure_category::SYNTAX:
            return agent_role::AUTO_LINTER_AGENT;
        case failure_category::SECURITY:
            return agent_role::SECOPS_AGENT;
        case failure_category::CONTRACT:
            return agent_role::CONTRACT_NEGOTIATOR;
        case failure_category::LOGIC:
        case failure_category::NONE:
            if (sev >= severity::HIGH) return agent_role::PLANNER_AGENT;
            return coding_agent(rt);
    }
    throw internal_error("unknown failure category");
}

agent_role route(failure_category category, severity sev) {
    return route(category, sev, runtime::PYTHON);
}

}  // namespace verifier
