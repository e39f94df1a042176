#pragma once

#ifndef FNLAMBDA_EQUIVALENCE_HPP_
#define FNLAMBDA_EQUIVALENCE_HPP_ 1

#include"terms.hpp"
#include<utility>
#include<vector>

namespace FnLambda
{

    /* Decides whether two terms are equal up to consistent renaming
     * of bound variables. Never reduces.
     *
     * The binders met on the way down are kept as a stack of pairs,
     * one name from each side. Two variables match iff the innermost
     * pair binding either of them binds both of them, or neither of
     * them is bound and the names are equal. A list of free-name
     * correspondences may be supplied; it acts as an outermost layer
     * of binders.
     */
    struct AlphaEquivalence : Term::Visitor<AlphaEquivalence, bool (Term const *, Term const *)>
    {
        friend struct Term::Visitor<AlphaEquivalence, bool (Term const *, Term const *)>;
        typedef std::pair<Identifier, Identifier> Correspondence;

        static bool Perform(TermPtr const &left, TermPtr const &right)
        {
            if (left == right)
            {
                return true;
            }
            AlphaEquivalence instance;
            return instance.VisitTerm(left.RawPtr(), right.RawPtr());
        }
        static bool Perform(TermPtr const &left, TermPtr const &right,
            std::vector<Correspondence> const &freeNames)
        {
            AlphaEquivalence instance;
            instance.binders = freeNames;
            return instance.VisitTerm(left.RawPtr(), right.RawPtr());
        }
    private:
        AlphaEquivalence() = default;
        std::vector<Correspondence> binders;

        bool VisitInvalidTerm(Term const *, Term const *)
        {
            return false;
        }
        bool VisitVariableTerm(Term const *left, Term const *right)
        {
            if (right->Kind != Term::VariableTerm)
            {
                return false;
            }
            auto const x = left->AsVariable.Name;
            auto const y = right->AsVariable.Name;
            for (auto i = binders.rbegin(); i != binders.rend(); ++i)
            {
                if (i->first == x || i->second == y)
                {
                    return i->first == x && i->second == y;
                }
            }
            return x == y;
        }
        bool VisitAbstractionTerm(Term const *left, Term const *right)
        {
            if (right->Kind != Term::AbstractionTerm)
            {
                return false;
            }
            binders.emplace_back(left->AsAbstraction.Parameter, right->AsAbstraction.Parameter);
            bool const result = VisitTerm(left->AsAbstraction.Body.RawPtr(),
                right->AsAbstraction.Body.RawPtr());
            binders.pop_back();
            return result;
        }
        bool VisitApplicationTerm(Term const *left, Term const *right)
        {
            if (right->Kind != Term::ApplicationTerm)
            {
                return false;
            }
            return VisitTerm(left->AsApplication.Function.RawPtr(),
                    right->AsApplication.Function.RawPtr())
                && VisitTerm(left->AsApplication.Argument.RawPtr(),
                    right->AsApplication.Argument.RawPtr());
        }
    };

}

#endif // FNLAMBDA_EQUIVALENCE_HPP_
