#include"test-common.hpp"

#include<set>
#include<string>

namespace FnLambda {
namespace Testing {

namespace
{
    bool NeverTaken(Identifier)
    {
        return false;
    }
}

TEST_F(TermTest, FreshNamesAreDistinct)
{
    FreshNameGenerator names;
    auto hint = Identifier::Intern("x");
    std::set<std::string> seen;
    for (int i = 0; i != 100; ++i)
    {
        auto name = names.Generate(hint, NeverTaken);
        EXPECT_TRUE(seen.insert(name.Text()).second) << name.Text();
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST_F(TermTest, FreshNamesFollowHint)
{
    FreshNameGenerator names;
    EXPECT_EQ(names.Generate(Identifier::Intern("y"), NeverTaken).Text(), "y0");
    EXPECT_EQ(names.Generate(Identifier::Intern("z"), NeverTaken).Text(), "z0");
    EXPECT_EQ(names.Generate(Identifier::Intern("y"), NeverTaken).Text(), "y1");
}

TEST_F(TermTest, FreshNamesShareCounterPerBase)
{
    FreshNameGenerator names;
    EXPECT_EQ(names.Generate(Identifier::Intern("y17"), NeverTaken).Text(), "y0");
    EXPECT_EQ(names.Generate(Identifier::Intern("y0"), NeverTaken).Text(), "y1");
    EXPECT_EQ(names.Generate(Identifier::Intern("y"), NeverTaken).Text(), "y2");
}

TEST_F(TermTest, FreshNameSkipsTakenNames)
{
    Identifier::Intern("taken0");
    Identifier::Intern("taken1");
    FreshNameGenerator names;
    auto result = names.Generate(Identifier::Intern("taken"), [](Identifier name)
    {
        return name.Text() == "taken0" || name.Text() == "taken1";
    });
    EXPECT_EQ(result.Text(), "taken2");
}

TEST_F(TermTest, FreshNameAvoidsNameSets)
{
    auto body = Parse("fn v0 => v v1");
    auto replacement = Parse("v2 v3");
    FreshNameGenerator names;
    auto result = names.Generate(Identifier::Intern("v"),
        body->Names, replacement->Names, Identifier::Intern("v4"));
    EXPECT_EQ(result.Text(), "v5");
}

TEST_F(TermTest, BaseOfStripsTrailingDigits)
{
    FreshNameGenerator names;
    EXPECT_EQ(names.BaseOf(Identifier::Intern("y17")).Text(), "y");
    EXPECT_EQ(names.BaseOf(Identifier::Intern("f.1234")).Text(), "f.");
    EXPECT_EQ(names.BaseOf(Identifier::Intern("x1y")).Text(), "x1y");
    EXPECT_EQ(names.BaseOf(Identifier::Intern("42")).Text(), "42");
}

TEST_F(TermTest, GeneratorsAreIndependent)
{
    FreshNameGenerator first;
    FreshNameGenerator second;
    auto hint = Identifier::Intern("w");
    EXPECT_EQ(first.Generate(hint, NeverTaken).Text(), "w0");
    EXPECT_EQ(first.Generate(hint, NeverTaken).Text(), "w1");
    EXPECT_EQ(second.Generate(hint, NeverTaken).Text(), "w0");
}

}
}
