#ifndef REQUIREMENTS_HPP
#define REQUIREMENTS_HPP

#include <set>
#include <string>
#include <vector>

// A tree of parameter names. ALL needs every member, ANY_OF needs at least one.
class Requirement
{
public:
    enum class Kind {
        PARAMETER,
        ALL,
        ANY_OF
    };

    static Requirement parameter(const std::string& name);
    static Requirement all(std::vector<Requirement> members);
    static Requirement any_of(std::vector<Requirement> members);

    bool is_satisfied(const std::set<std::string>& present) const;

    // An unsatisfied ANY_OF group is reported as one item ("a or b"),
    // unsatisfied ALL members are reported one by one.
    void collect_missing(const std::set<std::string>& present, std::vector<std::string>& missing) const;

    std::string describe() const;

private:
    Requirement(Kind kind, std::string name, std::vector<Requirement> members);

    Kind kind;
    std::string name;
    std::vector<Requirement> members;
};

struct RequirementRule {
    std::string parameter;
    Requirement dependency;
};

class RequirementValidator
{
private:
    std::vector<std::vector<std::string>> exclusive_groups;
    std::vector<RequirementRule> rules;

public:
    // Parameters of one group cannot be given together
    RequirementValidator& add_exclusive(std::vector<std::string> group);

    // If parameter is present, dependency must be satisfied
    RequirementValidator& add_rule(const std::string& parameter, Requirement dependency);

    // One message per failing rule, in rule order
    std::vector<std::string> violations(const std::set<std::string>& present) const;

    // Throws MUTUALLY_EXCLUSIVE_PARAMETERS or MISSING_DEPENDENT_PARAMETERS for the first failure
    void check(const std::set<std::string>& present) const;
};

#endif
