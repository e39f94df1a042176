#pragma once

#ifndef FNLAMBDA_FRESH_HPP_
#define FNLAMBDA_FRESH_HPP_ 1

#include"names.hpp"
#include<string>
#include<unordered_map>

namespace FnLambda
{

    /* Generates identifiers of the form <base><counter>.
     *
     * The counter of each base only moves forward, so a name is never
     * handed out twice by the same generator. A candidate whose text
     * has never been interned cannot occur in any term and is accepted
     * without consulting the caller; otherwise the caller's predicate
     * decides whether it is taken.
     *
     * One generator belongs to one reduction run; it holds no global
     * state besides the shared name table.
     */
    struct FreshNameGenerator
    {
        FreshNameGenerator() : table(NameTable::Default()) { }
        FreshNameGenerator(FreshNameGenerator const &) = delete;
        FreshNameGenerator(FreshNameGenerator &&) = default;
        FreshNameGenerator &operator = (FreshNameGenerator const &) = delete;
        ~FreshNameGenerator() = default;

        template <typename TPredicate>
        Identifier Generate(Identifier hint, TPredicate &&isTaken)
        {
            auto const base = BaseOf(hint);
            auto &counter = counters[base.Index];
            /* Copied: interning below may grow the table. */
            std::string const prefix = table.Text(base);
            while (true)
            {
                auto candidate = prefix + std::to_string(counter++);
                Identifier existing;
                if (!table.Lookup(candidate, existing))
                {
                    return table.Intern(candidate);
                }
                if (!isTaken(existing))
                {
                    return existing;
                }
            }
        }

        /* Fresh with respect to two name sets and one extra name. */
        Identifier Generate(Identifier hint,
            NameSet const &first, NameSet const &second,
            Identifier excluded)
        {
            return Generate(hint, [&](Identifier name)
            {
                return name == excluded
                    || first.Contains(name)
                    || second.Contains(name);
            });
        }

        /* "y17" has base "y"; a name made only of digits is its own base. */
        Identifier BaseOf(Identifier name)
        {
            auto found = bases.find(name.Index);
            if (found != bases.end())
            {
                return Identifier{ found->second };
            }
            auto const &text = table.Text(name);
            auto length = text.size();
            for (; length != 0 && text[length - 1] >= '0' && text[length - 1] <= '9'; --length)
                ;
            auto base = (length == 0 || length == text.size())
                ? name
                : table.Intern(text.substr(0, length));
            bases.emplace(name.Index, base.Index);
            return base;
        }

    private:
        NameTable &table;
        std::unordered_map<Identifier::IndexType, size_t> counters;
        std::unordered_map<Identifier::IndexType, Identifier::IndexType> bases;
    };

}

#endif // FNLAMBDA_FRESH_HPP_
