#include"toy.hpp"
#include<cstdio>
#include<string>

using namespace FnLambda;

/* Reads one term per line and prints it back in canonical form. */
int main()
{
    std::string line;
    while (ReadLine(stdin, line))
    {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
        {
            continue;
        }
        TermPtr result;
        SyntaxError error;
        if (!Parser::ParseTerm(line, result, error))
        {
            PutSyntaxError("<stdin>", line, error);
            continue;
        }
        TermPrinter::Print(result);
        putchar('\n');
    }
    return 0;
}
