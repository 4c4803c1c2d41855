#include <gtest/gtest.h>
#include "requirements.hpp"
#include "test_support.hpp"

static Requirement p(const std::string& name) {
    return Requirement::parameter(name);
}

TEST(Requirements, AbsentParameterIsVacuouslySatisfied) {
    RequirementValidator v;
    v.add_rule("--p", Requirement::all({p("--a"), p("--b")}));
    EXPECT_TRUE(v.violations({}).empty());
    EXPECT_TRUE(v.violations({"--x"}).empty());
    v.check({"--a"});
}

TEST(Requirements, AllMembersReportedIndividually) {
    RequirementValidator v;
    v.add_rule("--p", Requirement::all({p("--a"), p("--b")}));

    std::vector<std::string> messages = v.violations({"--p"});
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("--p requires --a, --b; --a, --b are missing", messages[0]);

    messages = v.violations({"--p", "--b"});
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("--p requires --a, --b; --a is missing", messages[0]);
}

TEST(Requirements, AnyOfGroupReportedAsOneItem) {
    RequirementValidator v;
    v.add_rule("--p", Requirement::all({p("--a"), Requirement::any_of({p("--b"), p("--c")})}));

    std::vector<std::string> messages = v.violations({"--p", "--a"});
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("--p requires --a, --b or --c; --b or --c is missing", messages[0]);

    messages = v.violations({"--p"});
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ("--p requires --a, --b or --c; --a, --b or --c are missing", messages[0]);

    EXPECT_TRUE(v.violations({"--p", "--a", "--c"}).empty());
}

TEST(Requirements, TopLevelAnyOf) {
    RequirementValidator v;
    v.add_rule("--p", Requirement::any_of({p("--a"), p("--b")}));
    EXPECT_TRUE(v.violations({"--p", "--b"}).empty());
    ASSERT_EQ(1u, v.violations({"--p"}).size());
    EXPECT_EQ("--p requires --a or --b; --a or --b is missing", v.violations({"--p"})[0]);
}

TEST(Requirements, NestedGroupsDescribeWithParentheses) {
    Requirement r = Requirement::any_of({Requirement::all({p("a"), p("b")}), p("c")});
    EXPECT_EQ("(a, b) or c", r.describe());
    EXPECT_TRUE(r.is_satisfied({"a", "b"}));
    EXPECT_TRUE(r.is_satisfied({"c"}));
    EXPECT_FALSE(r.is_satisfied({"a"}));
}

TEST(Requirements, OneMessagePerFailingRule) {
    RequirementValidator v;
    v.add_rule("--p", Requirement::all({p("--a")}))
     .add_rule("--q", Requirement::all({p("--b")}));
    EXPECT_EQ(2u, v.violations({"--p", "--q"}).size());
}

TEST(Requirements, CheckThrowsMissingDependentParameters) {
    RequirementValidator v;
    v.add_rule("--p", Requirement::all({p("--a")}));
    EXPECT_NET_ERROR(v.check({"--p"}), ErrorKind::MISSING_DEPENDENT_PARAMETERS);
}

TEST(Requirements, ExclusiveGroup) {
    RequirementValidator v;
    v.add_exclusive({"--a", "--b"});
    v.check({"--a"});
    EXPECT_NET_ERROR(v.check({"--a", "--b"}), ErrorKind::MUTUALLY_EXCLUSIVE_PARAMETERS);
}
