#pragma once

#ifndef FNLAMBDA_PRINTER_HPP_
#define FNLAMBDA_PRINTER_HPP_ 1

#include"terms.hpp"
#include"program.hpp"
#include<cstdio>
#include<string>

namespace FnLambda
{

    /* Renders terms in the surface syntax accepted by the parser.
     *
     * Parentheses are inserted only where the grammar needs them:
     * around an abstraction in function position (its body would
     * otherwise swallow the argument) and around an application or
     * abstraction in argument position (application associates to
     * the left). Identifiers are printed exactly as stored.
     */
    struct TermPrinter : Term::Visitor<TermPrinter, void (Term const *, std::string &)>
    {
        friend struct Term::Visitor<TermPrinter, void (Term const *, std::string &)>;

        static void Append(TermPtr const &term, std::string &out)
        {
            TermPrinter instance;
            instance.VisitTerm(term.RawPtr(), out);
        }
        static std::string ToString(TermPtr const &term)
        {
            std::string result;
            Append(term, result);
            return result;
        }
        /* name := value */
        static std::string ToString(Definition const &definition)
        {
            std::string result = definition.Name.Text();
            result += " := ";
            Append(definition.Value, result);
            return result;
        }
        /* One "name := value;" line per definition, then main. */
        static std::string ToString(File const &file)
        {
            std::string result;
            for (auto const &definition : file.Definitions)
            {
                result += ToString(definition);
                result += ";\n";
            }
            result += "main := ";
            Append(file.Main, result);
            result += ';';
            return result;
        }
        static void Print(TermPtr const &term, FILE *fp = stdout)
        {
            fputs(ToString(term).c_str(), fp);
        }
    private:
        TermPrinter() = default;
        void VisitInvalidTerm(Term const *, std::string &out)
        {
            out += "[invalid]";
        }
        void VisitVariableTerm(Term const *target, std::string &out)
        {
            out += target->AsVariable.Name.Text();
        }
        void VisitAbstractionTerm(Term const *target, std::string &out)
        {
            out += "fn ";
            out += target->AsAbstraction.Parameter.Text();
            out += " => ";
            VisitTerm(target->AsAbstraction.Body.RawPtr(), out);
        }
        void VisitApplicationTerm(Term const *target, std::string &out)
        {
            auto const func = target->AsApplication.Function.RawPtr();
            auto const arg = target->AsApplication.Argument.RawPtr();
            bool const parenFunc = (func->Kind == Term::AbstractionTerm);
            bool const parenArg = (arg->Kind == Term::ApplicationTerm
                || arg->Kind == Term::AbstractionTerm);
            if (parenFunc)
            {
                out += '(';
            }
            VisitTerm(func, out);
            if (parenFunc)
            {
                out += ')';
            }
            out += ' ';
            if (parenArg)
            {
                out += '(';
            }
            VisitTerm(arg, out);
            if (parenArg)
            {
                out += ')';
            }
        }
    };

}

#endif // FNLAMBDA_PRINTER_HPP_
