#pragma once

#ifndef FNLAMBDA_VALUES_HPP_
#define FNLAMBDA_VALUES_HPP_ 1

#include"terms.hpp"
#include"equivalence.hpp"
#include"reducer.hpp"
#include<string>
#include<vector>

namespace FnLambda
{
    namespace Values
    {
        /* Canonical encodings. They are rebuilt on every call rather
         * than cached in statics, because a static term would outlive
         * the node pool it was allocated from. */
        struct Encodings
        {
            /* fn t => fn e => t */
            static TermPtr True()
            {
                return Choice(true);
            }
            /* fn t => fn e => e */
            static TermPtr False()
            {
                return Choice(false);
            }
            static TermPtr Boolean(bool value)
            {
                return Choice(value);
            }
            /* fn a => fn b => a b false */
            static TermPtr And()
            {
                auto a = Identifier::Intern("a");
                auto b = Identifier::Intern("b");
                return Term::NewAbstraction(a, Term::NewAbstraction(b,
                    Term::NewApplication(
                        Term::NewApplication(Term::NewVariable(a), Term::NewVariable(b)),
                        False())));
            }
            /* fn f => fn a => f (f (... a)), with n applications of f */
            static TermPtr ChurchNumeral(size_t n)
            {
                auto f = Identifier::Intern("f");
                auto a = Identifier::Intern("a");
                auto body = Term::NewVariable(a);
                for (size_t i = 0; i != n; ++i)
                {
                    body = Term::NewApplication(Term::NewVariable(f), std::move(body));
                }
                return Term::NewAbstraction(f, Term::NewAbstraction(a, std::move(body)));
            }
            /* fn n => fn f => fn a => f (n f a) */
            static TermPtr Successor()
            {
                auto n = Identifier::Intern("n");
                auto f = Identifier::Intern("f");
                auto a = Identifier::Intern("a");
                auto inner = Term::NewApplication(
                    Term::NewApplication(Term::NewVariable(n), Term::NewVariable(f)),
                    Term::NewVariable(a));
                return Term::NewAbstraction(n, Term::NewAbstraction(f, Term::NewAbstraction(a,
                    Term::NewApplication(Term::NewVariable(f), std::move(inner)))));
            }
        private:
            static TermPtr Choice(bool first)
            {
                auto t = Identifier::Intern("t");
                auto e = Identifier::Intern("e");
                return Term::NewAbstraction(t, Term::NewAbstraction(e,
                    Term::NewVariable(first ? t : e)));
            }
        };

        /* Normal form of succ n. */
        inline TermPtr Successor(TermPtr n)
        {
            return Reduction::Normalisation::Perform(
                Term::NewApplication(Encodings::Successor(), std::move(n)));
        }

        /* Normal form of and a b. */
        inline TermPtr And(TermPtr a, TermPtr b)
        {
            return Reduction::Normalisation::Perform(
                Term::NewApplication(
                    Term::NewApplication(Encodings::And(), std::move(a)),
                    std::move(b)));
        }

        typedef unsigned ValueKind;

        struct ValueTag
        {
            static constexpr ValueKind BooleanValue = 1;
            static constexpr ValueKind NumeralValue = 2;

            ValueKind Kind;
            /* 0 or 1 for booleans, n for numerals. */
            size_t Value;

            std::string Describe() const
            {
                if (Kind == BooleanValue)
                {
                    return Value ? "boolean true" : "boolean false";
                }
                return "Church numeral " + std::to_string(Value);
            }
            friend bool operator == (ValueTag const &a, ValueTag const &b)
            {
                return a.Kind == b.Kind && a.Value == b.Value;
            }
        };

        /* Lists every familiar encoding the term is alpha-equivalent
         * to. A term may match several (false is also numeral 0). */
        struct ValueGuesser
        {
            static std::vector<ValueTag> Classify(TermPtr const &term)
            {
                std::vector<ValueTag> result;
                size_t n;
                if (NumeralCandidate(term, n)
                    && AlphaEquivalence::Perform(term, Encodings::ChurchNumeral(n)))
                {
                    result.push_back({ ValueTag::NumeralValue, n });
                }
                if (AlphaEquivalence::Perform(term, Encodings::True()))
                {
                    result.push_back({ ValueTag::BooleanValue, 1 });
                }
                else if (AlphaEquivalence::Perform(term, Encodings::False()))
                {
                    result.push_back({ ValueTag::BooleanValue, 0 });
                }
                return result;
            }
        private:
            /* Only picks which numeral to compare against: n is the
             * length of the application spine under two binders. */
            static bool NumeralCandidate(TermPtr const &term, size_t &n)
            {
                if (term->Kind != Term::AbstractionTerm)
                {
                    return false;
                }
                auto const &inner = term->AsAbstraction.Body;
                if (inner->Kind != Term::AbstractionTerm)
                {
                    return false;
                }
                n = 0;
                auto current = inner->AsAbstraction.Body.RawPtr();
                for (; current->Kind == Term::ApplicationTerm;
                    current = current->AsApplication.Argument.RawPtr())
                {
                    ++n;
                }
                return true;
            }
        };
    }
}

#endif // FNLAMBDA_VALUES_HPP_
