#pragma once

#ifndef FNLAMBDA_TOY_HPP_
#define FNLAMBDA_TOY_HPP_ 1

#include"../terms.hpp"
#include"../parser.hpp"
#include"../printer.hpp"
#include<cstdio>
#include<string>

/* Prints the message, then the offending line with a caret under
 * the position of the problem. */
inline void PutSyntaxError(char const *source, std::string const &input,
    FnLambda::SyntaxError const &error)
{
    if (error.Line == 0)
    {
        fprintf(stderr, "%s: Error: %s\n", source, error.Message);
        return;
    }
    fprintf(stderr, "%s:%zu:%zu: Error: %s\n",
        source, error.Line, error.Column, error.Message);
    auto lineBegin = error.Offset == 0 ? std::string::npos
        : input.rfind('\n', error.Offset - 1);
    lineBegin = (lineBegin == std::string::npos ? 0 : lineBegin + 1);
    auto lineEnd = input.find('\n', lineBegin);
    if (lineEnd == std::string::npos)
    {
        lineEnd = input.size();
    }
    fwrite(input.data() + lineBegin, 1, lineEnd - lineBegin, stderr);
    fputc('\n', stderr);
    /* Tabs are echoed so the caret lines up with the source; one
     * space per character, not per byte. */
    for (auto i = lineBegin; i != error.Offset; ++i)
    {
        auto const byte = (unsigned char)input[i];
        if ((byte & 0xC0) != 0x80)
        {
            fputc(byte == '\t' ? '\t' : ' ', stderr);
        }
    }
    fputc('^', stderr);
    fputc('\n', stderr);
}

inline void HintAndPrintTerm(char const *hint, FnLambda::TermPtr const &term)
{
    fputs(hint, stdout);
    FnLambda::TermPrinter::Print(term);
    fputc('\n', stdout);
}

/* Returns false at end of input. The newline is not stored. */
inline bool ReadLine(FILE *fp, std::string &line)
{
    line.clear();
    int ch;
    bool any = false;
    while ((ch = getc(fp)) != EOF)
    {
        any = true;
        if (ch == '\n')
        {
            break;
        }
        line.push_back((char)ch);
    }
    return any;
}

inline bool ReadAll(FILE *fp, std::string &text)
{
    char buffer[8192];
    size_t count;
    while ((count = fread(buffer, 1, sizeof(buffer), fp)) != 0)
    {
        text.append(buffer, count);
    }
    return !ferror(fp);
}

#endif // FNLAMBDA_TOY_HPP_
