#include"toy.hpp"
#include"../reducer.hpp"
#include"../values.hpp"
#include<chrono>
#include<cstdio>
#include<cstdlib>
#include<string>

using namespace FnLambda;
using namespace FnLambda::Reduction;

/* Fibonacci over Church pairs: fst (step^n (pair 0 1)). */
static char const FibbitSource[] =
    "true := fn t => fn e => t\n"
    "false := fn t => fn e => e\n"
    "pair := fn a => fn b => fn s => s a b\n"
    "fst := fn p => p true\n"
    "snd := fn p => p false\n"
    "succ := fn n => fn f => fn x => f (n f x)\n"
    "add := fn m => fn n => m succ n\n"
    "zero := fn f => fn x => x\n"
    "ten := fn f => fn x => f (f (f (f (f (f (f (f (f (f x)))))))))\n"
    "step := fn p => pair (snd p) (add (fst p) (snd p))\n"
    "fibbit := fn n => fst (n step (pair zero (succ zero)))\n"
    "main := fibbit ten\n";

int main(int argc, char **argv)
{
    int rounds = argc > 1 ? std::atoi(argv[1]) : 20;
    if (rounds <= 0)
    {
        fprintf(stderr, "Usage: fibbit-bench [ROUNDS]\n");
        return 1;
    }
    File file;
    SyntaxError error;
    if (!Parser::ParseFile(FibbitSource, file, error))
    {
        PutSyntaxError("fibbit", FibbitSource, error);
        return 1;
    }
    auto const initial = Unroller::Perform(file);
    TermPtr result;
    size_t steps = 0;
    auto const begin = std::chrono::steady_clock::now();
    for (int i = 0; i != rounds; ++i)
    {
        ReductionContext context;
        result = initial;
        Normalisation::Perform(result, context);
        steps = context.Steps;
    }
    auto const elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - begin);
    printf("fibbit 10: %d rounds, %zu steps each, %.3f ms per round\n",
        rounds, steps, elapsed.count() / 1000.0 / rounds);
    auto guesses = Values::ValueGuesser::Classify(result);
    for (auto const &guess : guesses)
    {
        printf("result: %s\n", guess.Describe().c_str());
    }
    return 0;
}
