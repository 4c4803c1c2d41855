#include "requirements.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "utilities.hpp"
#include <algorithm>
#include <utility>

Requirement::Requirement(Kind kind, std::string name, std::vector<Requirement> members)
    : kind(kind), name(std::move(name)), members(std::move(members)) {}

Requirement Requirement::parameter(const std::string& name) {
    return Requirement(Kind::PARAMETER, name, {});
}

Requirement Requirement::all(std::vector<Requirement> members) {
    return Requirement(Kind::ALL, "", std::move(members));
}

Requirement Requirement::any_of(std::vector<Requirement> members) {
    return Requirement(Kind::ANY_OF, "", std::move(members));
}

bool Requirement::is_satisfied(const std::set<std::string>& present) const {
    switch (kind) {
        case Kind::PARAMETER:
            return present.count(name) > 0;
        case Kind::ALL:
            return std::all_of(members.begin(), members.end(),
                               [&present](const Requirement& r) { return r.is_satisfied(present); });
        case Kind::ANY_OF:
            return std::any_of(members.begin(), members.end(),
                               [&present](const Requirement& r) { return r.is_satisfied(present); });
    }
    return false;
}

void Requirement::collect_missing(const std::set<std::string>& present, std::vector<std::string>& missing) const {
    switch (kind) {
        case Kind::PARAMETER:
            if (!present.count(name)) missing.push_back(name);
            break;
        case Kind::ALL:
            for (const auto& member : members) {
                member.collect_missing(present, missing);
            }
            break;
        case Kind::ANY_OF:
            if (!is_satisfied(present)) missing.push_back(describe());
            break;
    }
}

std::string Requirement::describe() const {
    if (kind == Kind::PARAMETER) return name;

    std::vector<std::string> parts;
    for (const auto& member : members) {
        // "(a, b) or c" keeps nested groups readable
        bool wrap = kind == Kind::ANY_OF && member.kind != Kind::PARAMETER;
        parts.push_back(wrap ? "(" + member.describe() + ")" : member.describe());
    }
    return join(parts, kind == Kind::ALL ? ", " : " or ");
}

RequirementValidator& RequirementValidator::add_exclusive(std::vector<std::string> group) {
    exclusive_groups.push_back(std::move(group));
    return *this;
}

RequirementValidator& RequirementValidator::add_rule(const std::string& parameter, Requirement dependency) {
    rules.push_back({parameter, std::move(dependency)});
    return *this;
}

std::vector<std::string> RequirementValidator::violations(const std::set<std::string>& present) const {
    std::vector<std::string> messages;
    for (const auto& rule : rules) {
        if (!present.count(rule.parameter)) continue;

        std::vector<std::string> missing;
        rule.dependency.collect_missing(present, missing);
        if (missing.empty()) continue;

        messages.push_back(rule.parameter + " requires " + rule.dependency.describe() + "; " +
                           join(missing, ", ") + (missing.size() == 1 ? " is" : " are") + " missing");
    }
    return messages;
}

void RequirementValidator::check(const std::set<std::string>& present) const {
    for (const auto& group : exclusive_groups) {
        std::vector<std::string> given;
        for (const auto& parameter : group) {
            if (present.count(parameter)) given.push_back(parameter);
        }
        if (given.size() > 1) {
            throw NetConfigError(ErrorKind::MUTUALLY_EXCLUSIVE_PARAMETERS,
                                 join(given, " and ") + " cannot be used together");
        }
    }

    std::vector<std::string> messages = violations(present);
    if (!messages.empty()) {
        logger->debug("{} dependent parameter rule(s) violated", messages.size());
        throw NetConfigError(ErrorKind::MISSING_DEPENDENT_PARAMETERS, messages.front());
    }
}
