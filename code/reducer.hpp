#pragma once

#ifndef FNLAMBDA_REDUCER_HPP_
#define FNLAMBDA_REDUCER_HPP_ 1

#include"terms.hpp"
#include"fresh.hpp"
#include<cstddef>
#include<unordered_map>

namespace FnLambda
{
    namespace Reduction
    {
        /* State owned by one reduction run. */
        struct ReductionContext
        {
            ReductionContext() : Steps(0) { }
            ReductionContext(ReductionContext const &) = delete;
            ReductionContext &operator = (ReductionContext const &) = delete;

            FreshNameGenerator Names;
            size_t Steps;
        };

        /* Capture-avoiding substitution of a term for the free
         * occurrences of a parameter.
         *
         *   [s/x] x           = s
         *   [s/x] y           = y
         *   [s/x] (t1 t2)     = ([s/x] t1) ([s/x] t2)
         *   [s/x] (fn x => t) = fn x => t
         *   [s/x] (fn y => t) = fn y => [s/x] t                if y is not free in s
         *   [s/x] (fn y => t) = fn z => [s/x] ([z/y] t)        otherwise, z fresh
         *
         * Subtrees in which x is not free are returned as they are, so
         * the result shares every untouched node with the input. A
         * shared node met twice in one run is only rewritten once.
         */
        struct Substitution : Term::Visitor<Substitution, TermPtr (TermPtr const &)>
        {
            friend struct Term::Visitor<Substitution, TermPtr (TermPtr const &)>;
            static TermPtr Perform(TermPtr const &target,
                Identifier parameter, TermPtr const &replacement,
                FreshNameGenerator &names)
            {
                if (!target->FreeNames.Contains(parameter))
                {
                    return target;
                }
                Substitution instance(parameter, replacement, names);
                return instance.VisitTerm(target);
            }
        private:
            /* Keeps the original alive, so its address cannot be
             * recycled for another node while the run lasts. */
            struct Memoisation
            {
                TermPtr Original;
                TermPtr Substituted;
            };
            Substitution(Identifier parameter, TermPtr const &replacement,
                FreshNameGenerator &names)
                : parameter(parameter), replacement(replacement), names(names)
            { }
            Identifier const parameter;
            TermPtr const &replacement;
            FreshNameGenerator &names;
            std::unordered_map<Term const *, Memoisation> memoised;

            TermPtr VisitInvalidTerm(TermPtr const &target)
            {
                return target;
            }
            TermPtr VisitVariableTerm(TermPtr const &target)
            {
                return target->AsVariable.Name == parameter
                    ? replacement
                    : target;
            }
            TermPtr VisitAbstractionTerm(TermPtr const &target)
            {
                /* Also covers fn x => t, where x is not free. */
                if (!target->FreeNames.Contains(parameter))
                {
                    return target;
                }
                TermPtr found;
                if (Recall(target, found))
                {
                    return found;
                }
                auto bound = target->AsAbstraction.Parameter;
                auto body = target->AsAbstraction.Body;
                if (replacement->FreeNames.Contains(bound))
                {
                    /* The fresh name occurs nowhere in body, so the
                     * renaming itself never needs to rename again. */
                    auto const fresh = names.Generate(bound,
                        body->Names, replacement->Names, parameter);
                    body = Perform(body, bound, Term::NewVariable(fresh), names);
                    bound = fresh;
                }
                auto result = Term::NewAbstraction(bound, VisitTerm(body));
                Remember(target, result);
                return result;
            }
            TermPtr VisitApplicationTerm(TermPtr const &target)
            {
                if (!target->FreeNames.Contains(parameter))
                {
                    return target;
                }
                TermPtr found;
                if (Recall(target, found))
                {
                    return found;
                }
                auto func = VisitTerm(target->AsApplication.Function);
                auto arg = VisitTerm(target->AsApplication.Argument);
                auto result = Term::NewApplication(std::move(func), std::move(arg));
                Remember(target, result);
                return result;
            }
            /* A node referenced once cannot be reached twice unless an
             * ancestor is, and that ancestor is memoised instead. */
            bool Recall(TermPtr const &target, TermPtr &result) const
            {
                if (target.UseCount() < 2)
                {
                    return false;
                }
                auto found = memoised.find(target.RawPtr());
                if (found == memoised.end())
                {
                    return false;
                }
                result = found->second.Substituted;
                return true;
            }
            void Remember(TermPtr const &target, TermPtr const &result)
            {
                if (target.UseCount() < 2)
                {
                    return;
                }
                memoised[target.RawPtr()] = Memoisation{ target, result };
            }
        };

        /* Perform one step of beta reduction in normal order:
         * the leftmost-outermost redex is contracted. Subterms already
         * in normal form are skipped without being traversed. */
        struct BetaReduction : Term::Visitor<BetaReduction, TermPtr (TermPtr const &)>
        {
            friend struct Term::Visitor<BetaReduction, TermPtr (TermPtr const &)>;
            static bool Perform(TermPtr &target, ReductionContext &context)
            {
                if (target->Normal)
                {
                    return false;
                }
                BetaReduction worker(context);
                target = worker.VisitTerm(target);
                ++context.Steps;
                return true;
            }
        private:
            explicit BetaReduction(ReductionContext &context)
                : context(context)
            { }
            ReductionContext &context;
            TermPtr VisitInvalidTerm(TermPtr const &target)
            {
                return target;
            }
            TermPtr VisitVariableTerm(TermPtr const &target)
            {
                return target;
            }
            TermPtr VisitAbstractionTerm(TermPtr const &target)
            {
                return Term::NewAbstraction(
                    target->AsAbstraction.Parameter,
                    VisitTerm(target->AsAbstraction.Body)
                );
            }
            TermPtr VisitApplicationTerm(TermPtr const &target)
            {
                auto const &func = target->AsApplication.Function;
                auto const &arg = target->AsApplication.Argument;
                if (func->Kind == Term::AbstractionTerm)
                {
                    return Substitution::Perform(
                        func->AsAbstraction.Body,
                        func->AsAbstraction.Parameter,
                        arg, context.Names);
                }
                if (!func->Normal)
                {
                    return Term::NewApplication(VisitTerm(func), arg);
                }
                return Term::NewApplication(func, VisitTerm(arg));
            }
        };

        /* Full normal-order normalisation in one descent.
         *
         * The head of a term is reduced first, until it is no longer
         * an abstraction applied to an argument. What remains is an
         * abstraction, whose body is normalised, or a stuck
         * application, whose function and then argument are
         * normalised. This contracts the same redexes in the same
         * order as repeated BetaReduction, without walking down from
         * the root after every step.
         */
        struct Normalisation : Term::Visitor<Normalisation, TermPtr (TermPtr const &)>
        {
            friend struct Term::Visitor<Normalisation, TermPtr (TermPtr const &)>;
            /* Does not return if the term has no normal form. */
            static TermPtr Perform(TermPtr target)
            {
                ReductionContext context;
                Perform(target, context);
                return target;
            }
            static void Perform(TermPtr &target, ReductionContext &context)
            {
                Normalisation worker(context);
                target = worker.VisitTerm(target);
            }
            /* Stops after maxSteps beta steps. Returns whether target
             * is in normal form afterwards. */
            static bool Perform(TermPtr &target, ReductionContext &context, size_t maxSteps)
            {
                for (size_t i = 0;
                    i != maxSteps && BetaReduction::Perform(target, context);
                    ++i)
                    ;
                return target->Normal;
            }
        private:
            explicit Normalisation(ReductionContext &context)
                : context(context)
            { }
            ReductionContext &context;

            TermPtr VisitInvalidTerm(TermPtr const &target)
            {
                return target;
            }
            TermPtr VisitVariableTerm(TermPtr const &target)
            {
                return target;
            }
            TermPtr VisitAbstractionTerm(TermPtr const &target)
            {
                if (target->Normal)
                {
                    return target;
                }
                return Term::NewAbstraction(
                    target->AsAbstraction.Parameter,
                    VisitTerm(target->AsAbstraction.Body)
                );
            }
            TermPtr VisitApplicationTerm(TermPtr const &target)
            {
                if (target->Normal)
                {
                    return target;
                }
                auto head = WeakHead(target);
                if (head->Kind != Term::ApplicationTerm)
                {
                    return VisitTerm(head);
                }
                auto func = VisitTerm(head->AsApplication.Function);
                auto arg = VisitTerm(head->AsApplication.Argument);
                if (func == head->AsApplication.Function
                    && arg == head->AsApplication.Argument)
                {
                    return head;
                }
                return Term::NewApplication(std::move(func), std::move(arg));
            }
            /* Contracts head redexes only. The result is not an
             * abstraction applied to an argument. */
            TermPtr WeakHead(TermPtr target)
            {
                while (!target->Normal && target->Kind == Term::ApplicationTerm)
                {
                    auto func = WeakHead(target->AsApplication.Function);
                    if (func->Kind != Term::AbstractionTerm)
                    {
                        if (func == target->AsApplication.Function)
                        {
                            return target;
                        }
                        return Term::NewApplication(std::move(func), target->AsApplication.Argument);
                    }
                    target = Substitution::Perform(
                        func->AsAbstraction.Body,
                        func->AsAbstraction.Parameter,
                        target->AsApplication.Argument,
                        context.Names);
                    ++context.Steps;
                }
                return target;
            }
        };

        /* The intermediate terms of a normal-order reduction, produced
         * on demand. The first element is the initial term; each later
         * element is the result of one more beta step; the last one is
         * the normal form. If there is no normal form the sequence never
         * ends, and the consumer simply stops calling MoveNext.
         * The sequence cannot be restarted.
         *
         *     ReductionSequence trace(term);
         *     while (trace.MoveNext())
         *         use(trace.Current());
         */
        struct ReductionSequence
        {
            explicit ReductionSequence(TermPtr initial)
                : current(std::move(initial)), started(false)
            { }
            ReductionSequence(ReductionSequence const &) = delete;
            ReductionSequence &operator = (ReductionSequence const &) = delete;

            bool MoveNext()
            {
                if (!started)
                {
                    started = true;
                    return (bool)current;
                }
                return BetaReduction::Perform(current, context);
            }
            TermPtr const &Current() const
            {
                return current;
            }
            /* Number of beta steps taken so far. */
            size_t Steps() const
            {
                return context.Steps;
            }
            bool AtNormalForm() const
            {
                return current->Normal;
            }
        private:
            TermPtr current;
            ReductionContext context;
            bool started;
        };
    }
}

#endif // FNLAMBDA_REDUCER_HPP_
