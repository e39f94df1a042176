#pragma once

#ifndef FNLAMBDA_PROGRAM_HPP_
#define FNLAMBDA_PROGRAM_HPP_ 1

#include"terms.hpp"
#include<vector>

namespace FnLambda
{

    /* name := value */
    struct Definition
    {
        Identifier Name;
        TermPtr Value;
    };

    /* A parsed source file: definitions in source order, then main. */
    struct File
    {
        std::vector<Definition> Definitions;
        TermPtr Main;
    };

    /* Desugars a file into a single term. Given
     *
     *     foo := term1
     *     bar := term2
     *     main := term3
     *
     * the result is (fn foo => (fn bar => term3) term2) term1.
     * Definitions are wrapped from the last one outwards, so a later
     * definition of a name is the innermost binder seen by main and
     * shadows the earlier ones. Definition values are reused, not
     * copied.
     */
    struct Unroller
    {
        static TermPtr Perform(File const &file)
        {
            TermPtr accumulator = file.Main;
            for (auto i = file.Definitions.rbegin(); i != file.Definitions.rend(); ++i)
            {
                accumulator = Term::NewApplication(
                    Term::NewAbstraction(i->Name, std::move(accumulator)),
                    i->Value
                );
            }
            return accumulator;
        }
    };

    /* Names that no definition or abstraction binds. They are kept as
     * free variables; reduction leaves them untouched. */
    inline std::vector<Identifier> UnboundReferences(File const &file)
    {
        auto unrolled = Unroller::Perform(file);
        return unrolled->FreeNames.Items();
    }

}

#endif // FNLAMBDA_PROGRAM_HPP_
