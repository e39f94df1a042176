#pragma once

#ifndef FNLAMBDA_NAMES_HPP_
#define FNLAMBDA_NAMES_HPP_ 1

#include<algorithm>
#include<cstddef>
#include<deque>
#include<iterator>
#include<new>
#include<string>
#include<unordered_map>
#include<vector>

namespace FnLambda
{

    /* An interned identifier. Two identifiers are equal iff their
     * texts are equal, so comparisons never touch the strings.
     * Identifier must stay trivial: terms keep it inside a union.
     */
    struct Identifier
    {
        typedef unsigned IndexType;
        IndexType Index;

        static Identifier Intern(char const *text, size_t length);
        static Identifier Intern(std::string const &text);
        std::string const &Text() const;

        friend bool operator == (Identifier a, Identifier b)
        {
            return a.Index == b.Index;
        }
        friend bool operator != (Identifier a, Identifier b)
        {
            return a.Index != b.Index;
        }
        friend bool operator < (Identifier a, Identifier b)
        {
            return a.Index < b.Index;
        }
    };

    struct NameTable
    {
        NameTable() = default;
        NameTable(NameTable const &) = delete;
        NameTable(NameTable &&) = delete;
        NameTable &operator = (NameTable const &) = delete;
        NameTable &operator = (NameTable &&) = delete;
        ~NameTable() = default;

        Identifier Intern(std::string const &text)
        {
            auto found = indices.find(text);
            if (found != indices.end())
            {
                return Identifier{ found->second };
            }
            Identifier result{ (Identifier::IndexType)texts.size() };
            texts.push_back(text);
            indices.emplace(text, result.Index);
            return result;
        }
        /* Does not intern; returns false if the text was never seen. */
        bool Lookup(std::string const &text, Identifier &result) const
        {
            auto found = indices.find(text);
            if (found == indices.end())
            {
                return false;
            }
            result.Index = found->second;
            return true;
        }
        /* Deque elements never move, so the reference stays valid
         * for the lifetime of the table. */
        std::string const &Text(Identifier name) const
        {
            return texts[name.Index];
        }
        size_t Size() const
        {
            return texts.size();
        }

        static NameTable &Default()
        {
            static NameTable instance;
            return instance;
        }
    private:
        std::unordered_map<std::string, Identifier::IndexType> indices;
        std::deque<std::string> texts;
    };

    inline Identifier Identifier::Intern(char const *text, size_t length)
    {
        return NameTable::Default().Intern(std::string(text, length));
    }

    inline Identifier Identifier::Intern(std::string const &text)
    {
        return NameTable::Default().Intern(text);
    }

    inline std::string const &Identifier::Text() const
    {
        return NameTable::Default().Text(*this);
    }

    /* A sorted set of identifiers, stored as a smart value type so
     * that it can live inside a pool-allocated term. */
    struct NameSet
    {
        typedef std::vector<Identifier> Storage;
        typedef Storage::const_iterator Iterator;

        NameSet() = delete;
        NameSet(NameSet const &) = delete;
        NameSet(NameSet &&) = delete;
        NameSet &operator = (NameSet const &) = delete;
        NameSet &operator = (NameSet &&) = delete;
        ~NameSet() = delete;

        void DefaultConstructor()
        {
            new (&items) Storage();
        }
        void Finalise()
        {
            items.~Storage();
        }

        bool Contains(Identifier name) const
        {
            return std::binary_search(items.begin(), items.end(), name);
        }
        bool Empty() const { return items.empty(); }
        size_t Size() const { return items.size(); }
        Iterator begin() const { return items.begin(); }
        Iterator end() const { return items.end(); }
        Storage const &Items() const { return items; }

        void AssignSingleton(Identifier name)
        {
            items.assign(1, name);
        }
        void AssignUnion(NameSet const &a, NameSet const &b)
        {
            items.clear();
            items.reserve(a.items.size() + b.items.size());
            std::set_union(a.items.begin(), a.items.end(),
                b.items.begin(), b.items.end(),
                std::back_inserter(items));
        }
        void AssignWith(NameSet const &source, Identifier extra)
        {
            auto position = std::lower_bound(source.items.begin(), source.items.end(), extra);
            items.clear();
            items.reserve(source.items.size() + 1);
            items.insert(items.end(), source.items.begin(), position);
            if (position == source.items.end() || *position != extra)
            {
                items.push_back(extra);
            }
            items.insert(items.end(), position, source.items.end());
        }
        void AssignWithout(NameSet const &source, Identifier removed)
        {
            items.clear();
            items.reserve(source.items.size());
            for (auto name : source.items)
            {
                if (name != removed)
                {
                    items.push_back(name);
                }
            }
        }
    private:
        Storage items;
    };

}

#endif // FNLAMBDA_NAMES_HPP_
