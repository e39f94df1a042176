#include"terms.hpp"
#include"parser.hpp"
#include"printer.hpp"
#include"reducer.hpp"
#include"values.hpp"
#include"toys/toy.hpp"
#include<cstdio>
#include<cstdlib>
#include<cstring>
#include<string>
#include<utility>
#include<vector>

using namespace FnLambda;
using namespace FnLambda::Reduction;
using namespace FnLambda::Values;

struct Options
{
    char const *Path;
    bool Verbose;
    bool Guess;
    bool Bounded;
    size_t MaxSteps;
};

static void PutUsage(FILE *fp)
{
    fputs("Usage: fnlc [-v|--verbose] [-n|--max-steps N] [-q|--no-guess] FILE|-\n"
        "  -v, --verbose      print the term after every beta step\n"
        "  -n, --max-steps N  give up after N beta steps\n"
        "  -q, --no-guess     do not report familiar encodings\n", fp);
}

static bool ParseOptions(int argc, char **argv, Options &options)
{
    options = { nullptr, false, true, false, 0 };
    for (int i = 1; i < argc; ++i)
    {
        auto arg = argv[i];
        if (!std::strcmp(arg, "-v") || !std::strcmp(arg, "--verbose"))
        {
            options.Verbose = true;
            continue;
        }
        if (!std::strcmp(arg, "-q") || !std::strcmp(arg, "--no-guess"))
        {
            options.Guess = false;
            continue;
        }
        if (!std::strcmp(arg, "-n") || !std::strcmp(arg, "--max-steps"))
        {
            if (++i == argc)
            {
                fprintf(stderr, "Error: %s expects a number.\n", arg);
                return false;
            }
            char *end;
            auto value = std::strtoull(argv[i], &end, 10);
            if (*argv[i] == '\0' || *argv[i] == '-' || *end != '\0')
            {
                fprintf(stderr, "Error: invalid step limit %s.\n", argv[i]);
                return false;
            }
            options.Bounded = true;
            options.MaxSteps = (size_t)value;
            continue;
        }
        if (!std::strcmp(arg, "-h") || !std::strcmp(arg, "--help"))
        {
            return false;
        }
        if (arg[0] == '-' && arg[1] != '\0')
        {
            fprintf(stderr, "Error: unrecognised option %s.\n", arg);
            return false;
        }
        if ((bool)options.Path)
        {
            fprintf(stderr, "Error: more than one input file.\n");
            return false;
        }
        options.Path = arg;
    }
    if (!(bool)options.Path)
    {
        fprintf(stderr, "Error: no input file.\n");
        return false;
    }
    return true;
}

static bool LoadSource(char const *path, std::string &text)
{
    if (!std::strcmp(path, "-"))
    {
        return ReadAll(stdin, text);
    }
    auto fp = fopen(path, "rb");
    if (!(bool)fp)
    {
        fprintf(stderr, "Error: cannot open %s.\n", path);
        return false;
    }
    bool const ok = ReadAll(fp, text);
    fclose(fp);
    if (!ok)
    {
        fprintf(stderr, "Error: cannot read %s.\n", path);
    }
    return ok;
}

static void PutGuesses(TermPtr const &term)
{
    auto guesses = ValueGuesser::Classify(term);
    if (guesses.empty())
    {
        return;
    }
    fputs("\nAlpha-equivalent to: ", stdout);
    if (guesses.size() == 1)
    {
        puts(guesses[0].Describe().c_str());
        return;
    }
    for (auto const &guess : guesses)
    {
        fputs("\n - ", stdout);
        fputs(guess.Describe().c_str(), stdout);
    }
    putchar('\n');
}

int main(int argc, char **argv)
{
    Options options;
    if (!ParseOptions(argc, argv, options))
    {
        PutUsage(stderr);
        return 1;
    }
    std::string source;
    if (!LoadSource(options.Path, source))
    {
        return 1;
    }
    File file;
    SyntaxError error;
    if (!Parser::ParseFile(source, file, error))
    {
        PutSyntaxError(options.Path, source, error);
        return 1;
    }
    auto term = Unroller::Perform(file);
    for (auto name : term->FreeNames)
    {
        fprintf(stderr, "Warning: %s is never bound.\n", name.Text().c_str());
    }
    if (!options.Verbose && !options.Bounded)
    {
        term = Normalisation::Perform(std::move(term));
        HintAndPrintTerm("", term);
        if (options.Guess)
        {
            PutGuesses(term);
        }
        return 0;
    }
    ReductionSequence trace(term);
    trace.MoveNext();
    if (options.Verbose)
    {
        printf("[0] %s\n", TermPrinter::ToString(trace.Current()).c_str());
    }
    while ((!options.Bounded || trace.Steps() != options.MaxSteps)
        && trace.MoveNext())
    {
        if (options.Verbose)
        {
            printf("[%zu] %s\n", trace.Steps(),
                TermPrinter::ToString(trace.Current()).c_str());
        }
    }
    if (!trace.AtNormalForm())
    {
        fprintf(stderr, "Error: no normal form after %zu steps.\n", trace.Steps());
        return 2;
    }
    if (options.Verbose)
    {
        putchar('\n');
    }
    HintAndPrintTerm("", trace.Current());
    if (options.Guess)
    {
        PutGuesses(trace.Current());
    }
    return 0;
}
