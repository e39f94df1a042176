#pragma once

#ifndef FNLAMBDA_TERMS_HPP_
#define FNLAMBDA_TERMS_HPP_ 1

#include"utils.hpp"
#include"names.hpp"
#include<utility>

namespace FnLambda
{

    typedef unsigned TermKind;

    /* A node of a named lambda term. Nodes are immutable once one of
     * the XConstructor functions has run, which is what allows a
     * subtree to be reused by several parents without copying.
     */
    struct Term
    {
        typedef Utilities::RefCountPtr<Term> Pointer;

        static constexpr TermKind InvalidTerm = 0;
        static constexpr TermKind VariableTerm = 1;
        static constexpr TermKind AbstractionTerm = 2;
        static constexpr TermKind ApplicationTerm = 3;

        Term() = delete;
        Term(Term &&) = delete;
        Term(Term const &) = delete;
        Term &operator = (Term &&) = delete;
        Term &operator = (Term const &) = delete;
        ~Term() = delete;

        void DefaultConstructor()
        {
            Kind = InvalidTerm;
            Normal = true;
            FreeNames.DefaultConstructor();
            Names.DefaultConstructor();
        }

        void VariableConstructor(Identifier name)
        {
            Kind = VariableTerm;
            AsVariable.Name = name;
            FreeNames.AssignSingleton(name);
            Names.AssignSingleton(name);
            Normal = true;
        }

        void AbstractionConstructor(Identifier parameter, Pointer body)
        {
            Kind = AbstractionTerm;
            AsAbstraction.Parameter = parameter;
            AsAbstraction.Body.MoveConstructor(std::move(body));
            auto const &inner = *AsAbstraction.Body;
            FreeNames.AssignWithout(inner.FreeNames, parameter);
            Names.AssignWith(inner.Names, parameter);
            Normal = inner.Normal;
        }

        void ApplicationConstructor(Pointer func, Pointer arg)
        {
            Kind = ApplicationTerm;
            AsApplication.Function.MoveConstructor(std::move(func));
            AsApplication.Argument.MoveConstructor(std::move(arg));
            auto const &left = *AsApplication.Function;
            auto const &right = *AsApplication.Argument;
            FreeNames.AssignUnion(left.FreeNames, right.FreeNames);
            Names.AssignUnion(left.Names, right.Names);
            Normal = left.Kind != AbstractionTerm
                && left.Normal
                && right.Normal;
        }

        void Finalise()
        {
            switch (Kind)
            {
                case AbstractionTerm:
                    AsAbstraction.Body.Finalise();
                    break;
                case ApplicationTerm:
                    AsApplication.Function.Finalise();
                    AsApplication.Argument.Finalise();
                    break;
            }
            FreeNames.Finalise();
            Names.Finalise();
        }

        static Pointer NewVariable(Identifier name)
        {
            Pointer result;
            result.NewInstance()->VariableConstructor(name);
            return result;
        }

        static Pointer NewAbstraction(Identifier parameter, Pointer body)
        {
            Pointer result;
            result.NewInstance()->AbstractionConstructor(parameter, std::move(body));
            return result;
        }

        static Pointer NewApplication(Pointer func, Pointer arg)
        {
            Pointer result;
            result.NewInstance()->ApplicationConstructor(std::move(func), std::move(arg));
            return result;
        }

        TermKind Kind;
        /* Convention:
         * - If Kind == InvalidTerm, none of the union members are valid.
         * - If Kind == XTerm, where X is not "Invalid", AsX is valid.
         */
        union
        {
            struct
            {
                Identifier Name;
            } AsVariable;
            struct
            {
                Identifier Parameter;
                Pointer Body;
            } AsAbstraction;
            struct
            {
                Pointer Function;
                Pointer Argument;
            } AsApplication;
        };
        /* Identifiers occurring free in this node. */
        NameSet FreeNames;
        /* Every identifier occurring in this node, free or bound. */
        NameSet Names;
        /* True iff this node contains no redex. */
        bool Normal;

    private:
        /* The argument U is used to avoid full
         * template specialisation inside a struct,
         * which is a defect in C++11.
         */
        template <typename T, typename U = void>
        struct VisitorPointerCheck
        {
            typedef VisitorPointerCheck<T, U> THelper;
            static_assert(sizeof(THelper) != sizeof(THelper),
                "The first argument must be of type "
                "Term const * (const), "
                "Term::Pointer "
                "or Term::Pointer const &.");
        };
        template <typename U>
        struct VisitorPointerCheck<Term const *, U>
        {
            typedef Term const *AdjustedPointer;
        };
        template <typename U>
        struct VisitorPointerCheck<Term const * const, U>
        {
            typedef Term const *AdjustedPointer;
        };
        template <typename U>
        struct VisitorPointerCheck<Pointer, U>
        {
            typedef Pointer const &AdjustedPointer;
        };
        template <typename U>
        struct VisitorPointerCheck<Pointer const &, U>
        {
            typedef Pointer const &AdjustedPointer;
        };

    public:
        template <typename TVisitor, typename TFunc>
        struct Visitor;

        template <typename TVisitor, typename TResult, typename TPointer, typename...TArgs>
        struct Visitor<TVisitor, TResult (TPointer, TArgs...)>
        {
            friend TVisitor;
        private:
            TResult VisitTerm(typename VisitorPointerCheck<TPointer>::AdjustedPointer target, TArgs...args)
            {
                auto that = static_cast<TVisitor *>(this);
                switch (target->Kind)
                {
                    case VariableTerm:
                        return that->VisitVariableTerm(target, std::forward<TArgs>(args)...);
                    case AbstractionTerm:
                        return that->VisitAbstractionTerm(target, std::forward<TArgs>(args)...);
                    case ApplicationTerm:
                        return that->VisitApplicationTerm(target, std::forward<TArgs>(args)...);
                    default:
                        return that->VisitInvalidTerm(target, std::forward<TArgs>(args)...);
                }
            }
        };
    };

    typedef Term::Pointer TermPtr;

}

#endif // FNLAMBDA_TERMS_HPP_
