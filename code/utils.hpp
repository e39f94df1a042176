#pragma once

#ifndef FNLAMBDA_UTILS_HPP_
#define FNLAMBDA_UTILS_HPP_ 1

#include<cstdlib>
#include<cstddef>
#include<new>
#include<utility>

namespace FnLambda
{
namespace Utilities
{

    /* A smart value type is a structure, where:
     * - It has DefaultConstructor() member function that
     *   initialises the structure from garbage data.
     * - It has Finalise() member function that clears up the
     *   resources for reuse (does not need to reset the memory).
     * Pool entries never run real constructors or destructors,
     * so members with non-trivial lifetimes are built with
     * placement new in DefaultConstructor and destroyed
     * explicitly in Finalise.
     */

    template <typename TSmartValueType>
    struct RefCountMemPool
    {
        struct Entry
        {
            union
            {
                Entry *NextEntry;
                size_t ReferenceCount;
            };
            TSmartValueType Data;
            Entry() = delete;
            Entry(Entry &&) = delete;
            Entry(Entry const &) = delete;
            Entry &operator = (Entry &&) = delete;
            Entry &operator = (Entry const &) = delete;
            ~Entry() = delete;
        };
        explicit RefCountMemPool(size_t suggested = 64)
            : blocks(nullptr), entries(nullptr),
            nextAlloc(suggested < 64 ? 64 : suggested > 4096 ? 4096 : suggested),
            available(0), live(0)
        {
        }
        RefCountMemPool(RefCountMemPool const &) = delete;
        RefCountMemPool(RefCountMemPool &&) = delete;
        RefCountMemPool &operator = (RefCountMemPool const &) = delete;
        RefCountMemPool &operator = (RefCountMemPool &&) = delete;
        ~RefCountMemPool()
        {
            for (auto i = blocks; i; )
            {
                auto ni = i->NextBlock;
                std::free(i);
                i = ni;
            }
        }
        /* Number of entries that can be handed out without a new block. */
        size_t Available() const { return available; }
        /* Number of entries currently handed out. */
        size_t Live() const { return live; }
        /* Throws std::bad_alloc if a new block cannot be obtained. */
        void Reserve(size_t expect)
        {
            if (expect <= available)
            {
                return;
            }
            /* Blocks grow geometrically up to a fixed ceiling. */
            size_t toAlloc = expect - available;
            toAlloc = (toAlloc < nextAlloc ? nextAlloc : toAlloc);
            nextAlloc = (toAlloc < 32768 ? toAlloc * 2 : 65536);
            auto newBlock = (Block *)std::malloc(sizeof(Block) + sizeof(Entry) * toAlloc);
            if (!(bool)newBlock)
            {
                throw std::bad_alloc();
            }
            newBlock->NextBlock = blocks;
            blocks = newBlock;
            auto newEntries = (Entry *)(void *)(newBlock + 1);
            for (size_t i = 0; i + 1 != toAlloc; ++i)
            {
                newEntries[i].NextEntry = newEntries + (i + 1);
            }
            newEntries[toAlloc - 1].NextEntry = entries;
            entries = newEntries;
            available += toAlloc;
        }
        Entry *Allocate()
        {
            Reserve(1);
            auto entry = entries;
            entries = entry->NextEntry;
            entry->ReferenceCount = 0;
            entry->Data.DefaultConstructor();
            --available;
            ++live;
            return entry;
        }
        void Deallocate(Entry *entry)
        {
            entry->Data.Finalise();
            entry->NextEntry = entries;
            entries = entry;
            ++available;
            --live;
        }
        static RefCountMemPool<TSmartValueType> Default;
    private:
        /* Block headers are padded so entries keep their alignment. */
        union Block
        {
            Block *NextBlock;
            std::max_align_t Alignment;
        } *blocks;
        Entry *entries;
        size_t nextAlloc;
        size_t available;
        size_t live;
    };

    template <typename TSmartValueType>
    RefCountMemPool<TSmartValueType>
        RefCountMemPool<TSmartValueType>::Default;

    /* RefCountPtr itself is a smart value type. */
    template <typename TSmartValueType>
    struct RefCountPtr
    {
    private:
        typedef RefCountMemPool<TSmartValueType> MemPool;
        typename MemPool::Entry *entry;
    public:
        RefCountPtr(std::nullptr_t = nullptr)
        {
            DefaultConstructor();
        }
        RefCountPtr(RefCountPtr const &other)
        {
            CopyConstructor(other);
        }
        RefCountPtr(RefCountPtr &&other)
        {
            MoveConstructor(std::move(other));
        }
        RefCountPtr &operator = (std::nullptr_t)
        {
            Finalise();
            DefaultConstructor();
            return *this;
        }
        /* Copy-and-swap keeps self-assignment and assignment
         * from a descendant (which the old value owns) safe. */
        RefCountPtr &operator = (RefCountPtr other)
        {
            auto tmp = entry;
            entry = other.entry;
            other.entry = tmp;
            return *this;
        }
        void DefaultConstructor()
        {
            entry = nullptr;
        }
        void CopyConstructor(RefCountPtr const &other)
        {
            entry = other.entry;
            if ((bool)entry)
            {
                ++entry->ReferenceCount;
            }
        }
        void MoveConstructor(RefCountPtr &&other)
        {
            entry = other.entry;
            other.entry = nullptr;
        }
        void Finalise()
        {
            if ((bool)entry && --entry->ReferenceCount == 0)
            {
                MemPool::Default.Deallocate(entry);
            }
        }
        ~RefCountPtr()
        {
            Finalise();
        }
        /* Drops the current object and points to a fresh pool entry
         * whose Data has only been through DefaultConstructor. */
        TSmartValueType *NewInstance()
        {
            Finalise();
            entry = nullptr;
            entry = MemPool::Default.Allocate();
            ++entry->ReferenceCount;
            return &entry->Data;
        }
        TSmartValueType *operator -> () const
        {
            return RawPtr();
        }
        TSmartValueType &operator * () const
        {
            return *RawPtr();
        }
        TSmartValueType *RawPtr() const
        {
            return (bool)entry ? &entry->Data : nullptr;
        }
        size_t UseCount() const
        {
            return (bool)entry ? entry->ReferenceCount : 0;
        }
        explicit operator bool () const
        {
            return (bool)entry;
        }
        friend bool operator == (RefCountPtr const &a, RefCountPtr const &b)
        {
            return a.entry == b.entry;
        }
        friend bool operator == (RefCountPtr const &ptr, std::nullptr_t)
        {
            return !(bool)ptr.entry;
        }
        friend bool operator == (std::nullptr_t, RefCountPtr const &ptr)
        {
            return !(bool)ptr.entry;
        }
        friend bool operator != (RefCountPtr const &a, RefCountPtr const &b)
        {
            return a.entry != b.entry;
        }
        friend bool operator != (RefCountPtr const &ptr, std::nullptr_t)
        {
            return (bool)ptr.entry;
        }
        friend bool operator != (std::nullptr_t, RefCountPtr const &ptr)
        {
            return (bool)ptr.entry;
        }
    };

}
}

#endif // FNLAMBDA_UTILS_HPP_
