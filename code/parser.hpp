#pragma once

#ifndef FNLAMBDA_PARSER_HPP_
#define FNLAMBDA_PARSER_HPP_ 1

#include"terms.hpp"
#include"program.hpp"
#include<cstring>
#include<string>

namespace FnLambda
{

    namespace Lexer
    {
        typedef unsigned TokenKind;

        struct Token
        {
            static constexpr TokenKind InvalidToken = 0;
            static constexpr TokenKind EndOfInputToken = 1;
            static constexpr TokenKind LParenthesisToken = 2;
            static constexpr TokenKind RParenthesisToken = 3;
            static constexpr TokenKind FnToken = 4;
            static constexpr TokenKind ArrowToken = 5;
            static constexpr TokenKind DefineToken = 6;
            static constexpr TokenKind SemicolonToken = 7;
            static constexpr TokenKind IdentifierToken = 8;

            TokenKind Kind;
            char const *Literal;
            size_t Length;
            char const *ReasonIfInvalid;
        };

        /* Produces tokens on demand and keeps two of them in view,
         * which is all the lookahead the grammar needs: an identifier
         * followed by ":=" starts a definition.
         */
        struct TokenSource
        {
            TokenSource(TokenSource &&) = default;
            TokenSource(TokenSource const &) = default;
            TokenSource &operator = (TokenSource &&) = default;
            TokenSource &operator = (TokenSource const &) = default;
            ~TokenSource() = default;
            TokenSource(char const *begin, char const *end)
                : input(begin), end(end)
            {
                current = Scan();
                next = Scan();
            }
            void DiscardCurrent()
            {
                current = next;
                next = Scan();
            }
            Token const PeekCurrent() const
            {
                return current;
            }
            Token const PeekNext() const
            {
                return next;
            }
        private:
            char const *input;
            char const *end;
            Token current;
            Token next;

            Token Scan()
            {
                while (true)
                {
                    for (; input != end && IsWhitespace(*input); ++input)
                        ;
                    if (input == end || *input != '#')
                    {
                        break;
                    }
                    /* Comment runs to the end of the line. */
                    for (; input != end && *input != '\n'; ++input)
                        ;
                }
                if (input == end)
                {
                    return { Token::EndOfInputToken, input, 0, nullptr };
                }
                auto const begin = input;
                switch (*input)
                {
                    case '(':
                        ++input;
                        return { Token::LParenthesisToken, begin, 1, nullptr };
                    case ')':
                        ++input;
                        return { Token::RParenthesisToken, begin, 1, nullptr };
                    case ';':
                        ++input;
                        return { Token::SemicolonToken, begin, 1, nullptr };
                }
                if (StartsWith(":="))
                {
                    input += 2;
                    return { Token::DefineToken, begin, 2, nullptr };
                }
                if (StartsWith("=>"))
                {
                    input += 2;
                    return { Token::ArrowToken, begin, 2, nullptr };
                }
                if (IsControl(*input))
                {
                    ++input;
                    return { Token::InvalidToken, begin, 1, "Unrecognised character." };
                }
                for (; input != end && IsIdentifierChar(*input)
                    && !StartsWith(":=") && !StartsWith("=>"); ++input)
                    ;
                auto const length = (size_t)(input - begin);
                if (length == 2 && begin[0] == 'f' && begin[1] == 'n')
                {
                    return { Token::FnToken, begin, 2, nullptr };
                }
                return { Token::IdentifierToken, begin, length, nullptr };
            }
            bool StartsWith(char const *pattern) const
            {
                auto str = input;
                for (; *pattern && str != end && *pattern == *str; ++pattern, ++str)
                    ;
                return !*pattern;
            }
            static bool IsWhitespace(char ch)
            {
                return ch == ' ' || ch == '\t' || ch == '\n'
                    || ch == '\v' || ch == '\f' || ch == '\r';
            }
            static bool IsControl(char ch)
            {
                auto const byte = (unsigned char)ch;
                return byte < 0x20 || byte == 0x7f;
            }
            /* Bytes above 0x7f are accepted, so UTF-8 names work. */
            static bool IsIdentifierChar(char ch)
            {
                return !IsWhitespace(ch) && !IsControl(ch)
                    && ch != '(' && ch != ')' && ch != ';' && ch != '#';
            }
        };
    }

    /* Location of the first syntax problem in a document.
     * Offset is in bytes. Line and Column are 1-based, and Column
     * counts UTF-8 characters; both are 0 when the parser could not
     * attribute the problem to a position. */
    struct SyntaxError
    {
        char const *Message;
        size_t Offset;
        size_t Line;
        size_t Column;
    };

    namespace Parser
    {
        /*            File -> (Definition ;?)* Main
         *      Definition -> ident := Term
         *            Main -> (main :=)? Term ;?
         *            Term -> Atom* fn ident => Term
         *            Term -> Atom+
         *            Atom -> ident | (Term)
         */
        struct ParserImpl
        {
            ParserImpl() = delete;
            ParserImpl(ParserImpl &&) = delete;
            ParserImpl(ParserImpl const &) = delete;
            ParserImpl &operator = (ParserImpl &&) = delete;
            ParserImpl &operator = (ParserImpl const &) = delete;
            ParserImpl(char const *begin, char const *end)
                : src(begin, end), err(nullptr), errpos(nullptr),
                mainName(Identifier::Intern("main"))
            { }

            Lexer::TokenSource src;
            char const *err;
            char const *errpos;
            Identifier mainName;

            bool ParseFile(File &result)
            {
                while (true)
                {
                    auto token = src.PeekCurrent();
                    if (token.Kind == Lexer::Token::EndOfInputToken)
                    {
                        err = "Missing main term.";
                        errpos = token.Literal;
                        return false;
                    }
                    if (token.Kind == Lexer::Token::IdentifierToken
                        && src.PeekNext().Kind == Lexer::Token::DefineToken)
                    {
                        auto name = Identifier::Intern(token.Literal, token.Length);
                        src.DiscardCurrent();
                        src.DiscardCurrent();
                        auto value = ParseTerm();
                        if (!(bool)value)
                        {
                            return false;
                        }
                        DiscardSemicolon();
                        if (name == mainName)
                        {
                            result.Main = std::move(value);
                            return ParseEndOfInput();
                        }
                        result.Definitions.push_back({ name, std::move(value) });
                        continue;
                    }
                    auto main = ParseTerm();
                    if (!(bool)main)
                    {
                        return false;
                    }
                    DiscardSemicolon();
                    result.Main = std::move(main);
                    return ParseEndOfInput();
                }
            }

            TermPtr ParseStandaloneTerm()
            {
                auto result = ParseTerm();
                if (!(bool)result || !ParseEndOfInput())
                {
                    return nullptr;
                }
                return result;
            }

            void DiscardSemicolon()
            {
                if (src.PeekCurrent().Kind == Lexer::Token::SemicolonToken)
                {
                    src.DiscardCurrent();
                }
            }

            bool ParseEndOfInput()
            {
                auto token = src.PeekCurrent();
                switch (token.Kind)
                {
                    case Lexer::Token::EndOfInputToken:
                        return true;
                    case Lexer::Token::InvalidToken:
                        err = token.ReasonIfInvalid;
                        errpos = token.Literal;
                        return false;
                    default:
                        err = "Unexpected token. Expecting end of input.";
                        errpos = token.Literal;
                        return false;
                }
            }

            TermPtr ParseTerm()
            {
                TermPtr application;
                while (true)
                {
                    auto token = src.PeekCurrent();
                    switch (token.Kind)
                    {
                        case Lexer::Token::InvalidToken:
                        {
                            err = token.ReasonIfInvalid;
                            errpos = token.Literal;
                            return nullptr;
                        }
                        /* Empty expression or Term -> Atom+ */
                        case Lexer::Token::EndOfInputToken:
                        case Lexer::Token::RParenthesisToken:
                        case Lexer::Token::SemicolonToken:
                        {
                            if (!(bool)application)
                            {
                                err = "(Sub)expression is empty.";
                                errpos = token.Literal;
                            }
                            return application;
                        }
                        /* Term -> Atom* fn ident => Term */
                        case Lexer::Token::FnToken:
                        {
                            if (!(bool)application)
                            {
                                return ParseAbstraction();
                            }
                            auto abstraction = ParseAbstraction();
                            if (!(bool)abstraction)
                            {
                                return nullptr;
                            }
                            return Term::NewApplication(
                                std::move(application), std::move(abstraction)
                            );
                        }
                        case Lexer::Token::IdentifierToken:
                        case Lexer::Token::LParenthesisToken:
                        {
                            /* The next definition starts here. */
                            if (token.Kind == Lexer::Token::IdentifierToken
                                && src.PeekNext().Kind == Lexer::Token::DefineToken)
                            {
                                if (!(bool)application)
                                {
                                    err = "(Sub)expression is empty.";
                                    errpos = token.Literal;
                                }
                                return application;
                            }
                            auto atom = ParseAtom();
                            if (!(bool)atom)
                            {
                                return nullptr;
                            }
                            application = (bool)application
                                ? Term::NewApplication(std::move(application), std::move(atom))
                                : std::move(atom);
                            break;
                        }
                        case Lexer::Token::ArrowToken:
                        {
                            err = "Unexpected '=>'. Expecting a term.";
                            errpos = token.Literal;
                            return nullptr;
                        }
                        case Lexer::Token::DefineToken:
                        {
                            err = "Unexpected ':='. Expecting a term.";
                            errpos = token.Literal;
                            return nullptr;
                        }
                        default:
                        {
                            err = "Internal parser error: lexer returns inconsistent data.";
                            errpos = nullptr;
                            return nullptr;
                        }
                    }
                }
            }

            TermPtr ParseAtom()
            {
                auto token = src.PeekCurrent();
                switch (token.Kind)
                {
                    /* Atom -> (Term) */
                    case Lexer::Token::LParenthesisToken:
                    {
                        src.DiscardCurrent();
                        auto result = ParseTerm();
                        if (!(bool)result)
                        {
                            return nullptr;
                        }
                        token = src.PeekCurrent();
                        if (token.Kind != Lexer::Token::RParenthesisToken)
                        {
                            err = "Unexpected token. Expecting closing parenthesis.";
                            errpos = token.Literal;
                            return nullptr;
                        }
                        src.DiscardCurrent();
                        return result;
                    }
                    /* Atom -> ident */
                    case Lexer::Token::IdentifierToken:
                    {
                        auto result = Term::NewVariable(
                            Identifier::Intern(token.Literal, token.Length)
                        );
                        src.DiscardCurrent();
                        return result;
                    }
                    default:
                    {
                        err = "Internal parser error: unexpected call to ParseAtom at this token.";
                        errpos = token.Literal;
                        return nullptr;
                    }
                }
            }

            TermPtr ParseAbstraction()
            {
                auto token = src.PeekCurrent();
                if (token.Kind != Lexer::Token::FnToken)
                {
                    err = "Internal parser error: unexpected call to ParseAbstraction at this token.";
                    errpos = token.Literal;
                    return nullptr;
                }
                src.DiscardCurrent();
                token = src.PeekCurrent();
                if (token.Kind != Lexer::Token::IdentifierToken)
                {
                    err = "Unexpected token. Expecting a parameter name after 'fn'.";
                    errpos = token.Literal;
                    return nullptr;
                }
                auto parameter = Identifier::Intern(token.Literal, token.Length);
                src.DiscardCurrent();
                token = src.PeekCurrent();
                if (token.Kind != Lexer::Token::ArrowToken)
                {
                    err = "Unexpected token. Expecting '=>'.";
                    errpos = token.Literal;
                    return nullptr;
                }
                src.DiscardCurrent();
                auto body = ParseTerm();
                if (!(bool)body)
                {
                    return nullptr;
                }
                return Term::NewAbstraction(parameter, std::move(body));
            }

            void Report(char const *begin, SyntaxError &error) const
            {
                error.Message = err;
                error.Offset = 0;
                error.Line = 0;
                error.Column = 0;
                if (!(bool)errpos)
                {
                    return;
                }
                error.Offset = (size_t)(errpos - begin);
                error.Line = 1;
                error.Column = 1;
                /* Columns count characters: UTF-8 continuation bytes
                 * (10xxxxxx) do not advance the column. */
                for (auto i = begin; i != errpos; ++i)
                {
                    if (*i == '\n')
                    {
                        ++error.Line;
                        error.Column = 1;
                    }
                    else if (((unsigned char)*i & 0xC0) != 0x80)
                    {
                        ++error.Column;
                    }
                }
            }
        };

        /* Parses a whole document. On failure, result is unspecified
         * and error describes the first problem. */
        inline bool ParseFile(char const *begin, char const *end,
            File &result, SyntaxError &error)
        {
            ParserImpl helper(begin, end);
            result.Definitions.clear();
            result.Main = nullptr;
            if (helper.ParseFile(result))
            {
                return true;
            }
            helper.Report(begin, error);
            return false;
        }

        inline bool ParseFile(std::string const &input,
            File &result, SyntaxError &error)
        {
            return ParseFile(input.data(), input.data() + input.size(), result, error);
        }

        /* Parses a single term with no definitions. */
        inline bool ParseTerm(char const *begin, char const *end,
            TermPtr &result, SyntaxError &error)
        {
            ParserImpl helper(begin, end);
            result = helper.ParseStandaloneTerm();
            if ((bool)result)
            {
                return true;
            }
            helper.Report(begin, error);
            return false;
        }

        inline bool ParseTerm(std::string const &input,
            TermPtr &result, SyntaxError &error)
        {
            return ParseTerm(input.data(), input.data() + input.size(), result, error);
        }

        inline bool ParseTerm(char const *input,
            TermPtr &result, SyntaxError &error)
        {
            return ParseTerm(input, input + std::strlen(input), result, error);
        }
    }

}

#endif // FNLAMBDA_PARSER_HPP_
