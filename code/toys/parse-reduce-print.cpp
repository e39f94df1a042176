#include"toy.hpp"
#include"../reducer.hpp"
#include<cstdio>
#include<string>

using namespace FnLambda;
using namespace FnLambda::Reduction;

/* Reads one term per line and shows every beta step of its
 * normal-order reduction. */
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
        ReductionSequence trace(result);
        trace.MoveNext();
        HintAndPrintTerm("     Formatted: ", trace.Current());
        while (trace.Steps() != 65536 && trace.MoveNext())
        {
            HintAndPrintTerm("Beta-reduction: ", trace.Current());
        }
        if (trace.AtNormalForm())
        {
            HintAndPrintTerm("   Normal form: ", trace.Current());
        }
        else
        {
            fprintf(stderr, "Error: no normal form after %zu steps.\n", trace.Steps());
        }
    }
    return 0;
}
