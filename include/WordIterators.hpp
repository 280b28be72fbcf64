#ifndef VMEM_WORD_ITERATORS_H
#define VMEM_WORD_ITERATORS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace vmem {

// ────────────────────────────────────────────────
// 1. Shared types
// ────────────────────────────────────────────────

using Address = std::size_t;

template <std::size_t W>
using Word = std::array<std::uint8_t, W>;

// Ordered address -> word map. Ascending key order is relied upon by
// diff, patch and the adjacency chunking below.
template <std::size_t W>
using WordStore = std::map<Address, Word<W>>;

// The implicit value of every address that was never written.
template <std::size_t W>
const Word<W>& zero_word() {
    static const Word<W> zero{};
    return zero;
}

// Minimal begin/end pair so an iterator couple can drive a range-for.
template <typename It>
class IteratorRange {
public:
    IteratorRange(It first, It last) : first_(first), last_(last) {}
    It begin() const { return first_; }
    It end() const { return last_; }

private:
    It first_;
    It last_;
};

// ────────────────────────────────────────────────
// 2. Dense borrowing iterator
//    Visits every address 0..length-1. Absent words are reported as
//    zero_word<W>(); the store is never touched.
// ────────────────────────────────────────────────
template <std::size_t W>
class ConstWordIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = Word<W>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const Word<W>*;
    using reference         = const Word<W>&;

    ConstWordIterator() = default;
    ConstWordIterator(const WordStore<W>* store, Address index)
        : store_(store), index_(index), next_(store->lower_bound(index)) {}

    reference operator*() const {
        if (next_ != store_->end() && next_->first == index_) return next_->second;
        return zero_word<W>();
    }
    pointer operator->() const { return &**this; }

    ConstWordIterator& operator++() {
        ++index_;
        if (next_ != store_->end() && next_->first < index_) ++next_;
        return *this;
    }
    ConstWordIterator operator++(int) {
        ConstWordIterator tmp = *this;
        ++*this;
        return tmp;
    }

    // Address of the word the iterator currently points at.
    Address address() const { return index_; }

    bool operator==(const ConstWordIterator& other) const {
        return store_ == other.store_ && index_ == other.index_;
    }
    bool operator!=(const ConstWordIterator& other) const { return !(*this == other); }

private:
    const WordStore<W>* store_ = nullptr;
    Address index_ = 0;
    typename WordStore<W>::const_iterator next_{}; // first stored entry with key >= index_
};

// ────────────────────────────────────────────────
// 3. Dense mutable iterator
//    Dereferencing an address that holds no word inserts a zero word so a
//    writable reference can be returned. A full traversal therefore turns a
//    sparse store into a dense one. The reference stays valid until the
//    iterator is advanced; use ConstWordIterator for read-only walks.
// ────────────────────────────────────────────────
template <std::size_t W>
class WordIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = Word<W>;
    using difference_type   = std::ptrdiff_t;
    using pointer           = Word<W>*;
    using reference         = Word<W>&;

    WordIterator() = default;
    WordIterator(WordStore<W>* store, Address index)
        : store_(store), index_(index), next_(store->lower_bound(index)) {}

    reference operator*() const {
        if (next_ == store_->end() || next_->first != index_) {
            next_ = store_->emplace_hint(next_, index_, Word<W>{});
        }
        return next_->second;
    }
    pointer operator->() const { return &**this; }

    WordIterator& operator++() {
        ++index_;
        if (next_ != store_->end() && next_->first < index_) ++next_;
        return *this;
    }
    WordIterator operator++(int) {
        WordIterator tmp = *this;
        ++*this;
        return tmp;
    }

    Address address() const { return index_; }

    bool operator==(const WordIterator& other) const {
        return store_ == other.store_ && index_ == other.index_;
    }
    bool operator!=(const WordIterator& other) const { return !(*this == other); }

private:
    WordStore<W>* store_ = nullptr;
    Address index_ = 0;
    mutable typename WordStore<W>::iterator next_{};
};

// ────────────────────────────────────────────────
// 4. Owning cursor
//    Holds the store taken from a consumed VirtualMemory and hands out word
//    copies for 0..length-1, then std::nullopt.
// ────────────────────────────────────────────────
template <std::size_t W>
class OwningWordCursor {
public:
    OwningWordCursor(WordStore<W> store, std::size_t length)
        : store_(std::move(store)), length_(length) {}

    std::optional<Word<W>> next() {
        if (index_ >= length_) return std::nullopt;
        auto it = store_.find(index_++);
        if (it == store_.end()) return Word<W>{};
        return it->second;
    }

    std::size_t remaining() const { return length_ - index_; }

private:
    WordStore<W> store_;
    std::size_t length_;
    Address index_ = 0;
};

// ────────────────────────────────────────────────
// 5. Adjacent-content chunks
//    Walks only the stored entries and groups runs of consecutive addresses,
//    at most chunkSize entries per chunk. A chunk always holds its anchor
//    entry, so a chunk size of 0 behaves like 1.
// ────────────────────────────────────────────────
template <std::size_t W>
using AdjacentChunk = std::vector<std::pair<Address, const Word<W>*>>;

template <std::size_t W>
class AdjacentChunkCursor {
public:
    AdjacentChunkCursor(const WordStore<W>& store, std::size_t chunkSize)
        : it_(store.begin()), end_(store.end()), chunkSize_(chunkSize) {}

    std::optional<AdjacentChunk<W>> next() {
        if (it_ == end_) return std::nullopt;

        AdjacentChunk<W> chunk;
        chunk.reserve(chunkSize_ > 0 ? chunkSize_ : 1);
        chunk.emplace_back(it_->first, &it_->second);
        Address prev = it_->first;
        ++it_;

        while (chunk.size() < chunkSize_ && it_ != end_ && it_->first == prev + 1) {
            chunk.emplace_back(it_->first, &it_->second);
            prev = it_->first;
            ++it_;
        }
        return chunk;
    }

private:
    typename WordStore<W>::const_iterator it_;
    typename WordStore<W>::const_iterator end_;
    std::size_t chunkSize_;
};

} // namespace vmem

#endif // VMEM_WORD_ITERATORS_H
