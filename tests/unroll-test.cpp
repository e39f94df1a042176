#include"test-common.hpp"

#include<algorithm>

namespace FnLambda {
namespace Testing {

TEST_F(TermTest, UnrollNoDefinitions)
{
    auto file = ParseProgram("main := f x");
    auto term = Unroller::Perform(file);
    EXPECT_TRUE(term == file.Main);
}

TEST_F(TermTest, UnrollWrapsInSourceOrder)
{
    auto file = ParseProgram("ident := fn x => x;\n"
        "zero := fn f => fn a => a;\n"
        "main := ident zero;\n");
    EXPECT_EQ(Print(Unroller::Perform(file)),
        "(fn ident => (fn zero => ident zero) (fn f => fn a => a)) (fn x => x)");
}

TEST_F(TermTest, UnrollReusesDefinitionValues)
{
    auto file = ParseProgram("id := fn x => x; main := id id");
    auto term = Unroller::Perform(file);
    ASSERT_TRUE(term->Kind == Term::ApplicationTerm);
    EXPECT_TRUE(term->AsApplication.Argument == file.Definitions[0].Value);
}

TEST_F(TermTest, LaterDefinitionShadows)
{
    auto result = Evaluate("a := x; a := y; main := a");
    EXPECT_EQ(Print(result), "y");
}

TEST_F(TermTest, DefinitionSeesEarlierDefinitions)
{
    auto result = Evaluate("id := fn x => x\n"
        "twice := fn f => fn v => f (f v)\n"
        "main := twice id z\n");
    EXPECT_EQ(Print(result), "z");
}

TEST_F(TermTest, DefinitionDoesNotSeeLaterDefinitions)
{
    /* b inside a is not in the scope of the later b. */
    auto result = Evaluate("a := b; b := fn x => x; main := a");
    EXPECT_EQ(Print(result), "b");
}

TEST_F(TermTest, UnboundReferencesListsFreeNames)
{
    auto file = ParseProgram("id := fn x => x; k := fn x => fn y => w; main := id (k u v)");
    auto unbound = UnboundReferences(file);
    ASSERT_EQ(unbound.size(), 3u);
    for (auto name : { "u", "v", "w" })
    {
        EXPECT_TRUE(std::find(unbound.begin(), unbound.end(), Identifier::Intern(name))
            != unbound.end()) << name;
    }
}

TEST_F(TermTest, UnboundReferencesEmptyForClosedProgram)
{
    auto file = ParseProgram("id := fn x => x; main := id id");
    EXPECT_TRUE(UnboundReferences(file).empty());
}

}
}
