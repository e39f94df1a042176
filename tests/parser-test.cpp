#include"test-common.hpp"

namespace FnLambda {
namespace Testing {

class ParserTest : public TermTest
{
protected:
    static SyntaxError ExpectFileError(std::string const &source)
    {
        File file;
        SyntaxError error = { nullptr, 0, 0, 0 };
        EXPECT_FALSE(Parser::ParseFile(source, file, error)) << source;
        return error;
    }

    static SyntaxError ExpectTermError(char const *source)
    {
        TermPtr term;
        SyntaxError error = { nullptr, 0, 0, 0 };
        EXPECT_FALSE(Parser::ParseTerm(source, term, error)) << source;
        return error;
    }
};

// =============================================================================
// Terms
// =============================================================================

TEST_F(ParserTest, Variable)
{
    auto term = Parse("s");
    ASSERT_TRUE(term->Kind == Term::VariableTerm);
    EXPECT_EQ(term->AsVariable.Name.Text(), "s");
}

TEST_F(ParserTest, Identity)
{
    auto term = Parse("fn x => x");
    ASSERT_TRUE(term->Kind == Term::AbstractionTerm);
    EXPECT_EQ(term->AsAbstraction.Parameter.Text(), "x");
    ASSERT_TRUE(term->AsAbstraction.Body->Kind == Term::VariableTerm);
    EXPECT_EQ(term->AsAbstraction.Body->AsVariable.Name.Text(), "x");
}

TEST_F(ParserTest, NestedAbstractions)
{
    auto expected = Lam("n", Lam("f", Lam("a",
        App(Var("f"), App(App(Var("n"), Var("f")), Var("a"))))));
    EXPECT_EQ(Print(Parse("fn n => fn f => fn a => f (n f a)")), Print(expected));
}

TEST_F(ParserTest, ApplicationIsLeftAssociative)
{
    EXPECT_EQ(Print(Parse("x y z")), Print(App(App(Var("x"), Var("y")), Var("z"))));
    EXPECT_EQ(Print(Parse("(x y) z")), Print(App(App(Var("x"), Var("y")), Var("z"))));
    EXPECT_EQ(Print(Parse("x (y z)")), Print(App(Var("x"), App(Var("y"), Var("z")))));
}

TEST_F(ParserTest, AbstractionBodyExtendsRight)
{
    auto term = Parse("fn x => x y");
    ASSERT_TRUE(term->Kind == Term::AbstractionTerm);
    EXPECT_TRUE(term->AsAbstraction.Body->Kind == Term::ApplicationTerm);

    auto applied = Parse("f fn x => x y");
    ASSERT_TRUE(applied->Kind == Term::ApplicationTerm);
    EXPECT_EQ(Print(applied->AsApplication.Function), "f");
    EXPECT_EQ(Print(applied->AsApplication.Argument), "fn x => x y");
}

TEST_F(ParserTest, FixedPointCombinator)
{
    auto half = Lam("x", App(Var("g"), App(Var("x"), Var("x"))));
    auto expected = Lam("g", App(half, half));
    EXPECT_EQ(Print(Parse("fn g => (fn x => g (x x)) (fn x => g (x x))")), Print(expected));
}

TEST_F(ParserTest, WhitespaceAndComments)
{
    auto term = Parse("  # leading comment\n"
        "fn f =>   # binder\n"
        "\tfn x =>\r\n"
        "  f (f x) # two\n");
    EXPECT_EQ(Print(term), "fn f => fn x => f (f x)");
}

TEST_F(ParserTest, OperatorsNeedNoSpaces)
{
    EXPECT_EQ(Print(Parse("fn x=>x")), "fn x => x");
    EXPECT_EQ(Print(Parse("(fn x=>x)(y)")), "(fn x => x) y");
}

TEST_F(ParserTest, IdentifierCharacters)
{
    EXPECT_EQ(Print(Parse("fn n' => + n' 1")), "fn n' => + n' 1");
    EXPECT_EQ(Print(Parse("fn f.1234 => f.1234")), "fn f.1234 => f.1234");
    EXPECT_EQ(Print(Parse("fn \xce\xbb => \xce\xbb")), "fn \xce\xbb => \xce\xbb");
    /* Only the exact word fn is reserved. */
    EXPECT_EQ(Print(Parse("fnord fn_x")), "fnord fn_x");
}

TEST_F(ParserTest, DeeplyNestedTerm)
{
    /* Well inside the nesting depth the recursive parser, printer
     * and node release support on a default stack. */
    size_t const depth = 4000;
    std::string source = "fn f => fn x => ";
    for (size_t i = 1; i != depth; ++i)
    {
        source += "f (";
    }
    source += "f x";
    source.append(depth - 1, ')');
    auto term = Parse(source.c_str());
    EXPECT_TRUE(term->Normal);
    EXPECT_EQ(Print(term), source);
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ParserTest, DefinitionsWithSemicolons)
{
    auto file = ParseProgram(
        "ident := fn x => x;\n"
        "zero := fn f => fn a => a;\n"
        "main := ident zero;\n");
    ASSERT_EQ(file.Definitions.size(), 2u);
    EXPECT_EQ(file.Definitions[0].Name.Text(), "ident");
    EXPECT_EQ(Print(file.Definitions[0].Value), "fn x => x");
    EXPECT_EQ(file.Definitions[1].Name.Text(), "zero");
    EXPECT_EQ(Print(file.Definitions[1].Value), "fn f => fn a => a");
    EXPECT_EQ(Print(file.Main), "ident zero");
}

TEST_F(ParserTest, DefinitionsWithoutSemicolons)
{
    auto file = ParseProgram(
        "succ := fn n => fn f => fn x => f (n f x)\n"
        "main := succ (fn f => fn x => x)\n");
    ASSERT_EQ(file.Definitions.size(), 1u);
    EXPECT_EQ(Print(file.Definitions[0].Value), "fn n => fn f => fn x => f (n f x)");
    EXPECT_EQ(Print(file.Main), "succ (fn f => fn x => x)");
}

TEST_F(ParserTest, BareMainTerm)
{
    auto file = ParseProgram("id := fn x => x;\n# then the program\nid id");
    ASSERT_EQ(file.Definitions.size(), 1u);
    EXPECT_EQ(Print(file.Main), "id id");
}

TEST_F(ParserTest, SingleLineMain)
{
    auto file = ParseProgram("main := (fn x => x) (fn y => y)");
    EXPECT_TRUE(file.Definitions.empty());
    EXPECT_EQ(Print(file.Main), "(fn x => x) (fn y => y)");
}

TEST_F(ParserTest, RedefinitionIsKept)
{
    auto file = ParseProgram("a := x; a := y; main := a;");
    ASSERT_EQ(file.Definitions.size(), 2u);
    EXPECT_EQ(Print(file.Definitions[0].Value), "x");
    EXPECT_EQ(Print(file.Definitions[1].Value), "y");
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(ParserTest, EmptyInput)
{
    auto error = ExpectFileError("   # nothing here\n");
    EXPECT_STREQ(error.Message, "Missing main term.");
    EXPECT_EQ(error.Line, 2u);
    EXPECT_EQ(error.Column, 1u);
}

TEST_F(ParserTest, DefinitionsWithoutMain)
{
    auto error = ExpectFileError("id := fn x => x;\n");
    EXPECT_STREQ(error.Message, "Missing main term.");
}

TEST_F(ParserTest, TrailingInputAfterMain)
{
    auto error = ExpectFileError("main := x;\nid := fn x => x;\n");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting end of input.");
    EXPECT_EQ(error.Line, 2u);
    EXPECT_EQ(error.Column, 1u);
    EXPECT_EQ(error.Offset, 11u);
}

TEST_F(ParserTest, UnclosedParenthesis)
{
    auto error = ExpectFileError("id := fn x => x\nmain := (id\n");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting closing parenthesis.");
    EXPECT_EQ(error.Line, 3u);
    EXPECT_EQ(error.Column, 1u);
}

TEST_F(ParserTest, MissingParameter)
{
    auto error = ExpectTermError("fn => x");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting a parameter name after 'fn'.");
    EXPECT_EQ(error.Column, 4u);
}

TEST_F(ParserTest, MissingArrow)
{
    auto error = ExpectTermError("fn x x");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting '=>'.");
    EXPECT_EQ(error.Column, 6u);
}

TEST_F(ParserTest, EmptyBody)
{
    auto error = ExpectTermError("(fn x => )");
    EXPECT_STREQ(error.Message, "(Sub)expression is empty.");
    EXPECT_EQ(error.Column, 10u);
}

TEST_F(ParserTest, EmptyParentheses)
{
    auto error = ExpectTermError("f ()");
    EXPECT_STREQ(error.Message, "(Sub)expression is empty.");
    EXPECT_EQ(error.Column, 4u);
}

TEST_F(ParserTest, StrayClosingParenthesis)
{
    auto error = ExpectTermError("x y)");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting end of input.");
    EXPECT_EQ(error.Column, 4u);
}

TEST_F(ParserTest, StrayOperators)
{
    EXPECT_STREQ(ExpectTermError("x => y").Message, "Unexpected '=>'. Expecting a term.");
    EXPECT_STREQ(ExpectFileError("main := := x").Message, "Unexpected ':='. Expecting a term.");
}

TEST_F(ParserTest, ControlCharacter)
{
    auto error = ExpectTermError("fn x =>\n  x \x01");
    EXPECT_STREQ(error.Message, "Unrecognised character.");
    EXPECT_EQ(error.Line, 2u);
    EXPECT_EQ(error.Column, 5u);
}

TEST_F(ParserTest, ColumnCountsCharacters)
{
    auto error = ExpectTermError("fn \xce\xbb => \xce\xbb)");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting end of input.");
    EXPECT_EQ(error.Offset, 11u);
    EXPECT_EQ(error.Line, 1u);
    EXPECT_EQ(error.Column, 10u);

    error = ExpectTermError("x\n\xce\xbb\xce\xbb => y");
    EXPECT_STREQ(error.Message, "Unexpected '=>'. Expecting a term.");
    EXPECT_EQ(error.Offset, 7u);
    EXPECT_EQ(error.Line, 2u);
    EXPECT_EQ(error.Column, 4u);
}

TEST_F(ParserTest, DefinitionInsideParentheses)
{
    auto error = ExpectFileError("main := (f x := y)");
    EXPECT_STREQ(error.Message, "Unexpected token. Expecting closing parenthesis.");
    EXPECT_EQ(error.Column, 12u);
}

}
}
