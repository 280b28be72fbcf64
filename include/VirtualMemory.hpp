#ifndef VMEM_VIRTUAL_MEMORY_H
#define VMEM_VIRTUAL_MEMORY_H

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "MemoryError.hpp"
#include "WordIterators.hpp"

namespace vmem {

// Words that differ between two stores, keyed by address in ascending order.
template <std::size_t W>
using Changeset = std::map<Address, Word<W>>;

/**
 * Sparse, word-addressed memory of a fixed number of words.
 *
 * Storage is allocated only for words that have been written; every other
 * address reads as the all-zero word. The address space length never changes
 * after construction and entries are never removed.
 *
 * Usage:
 *   VirtualMemory<4> mem(0x100);                 // 0x100 words of 4 bytes
 *   mem.write_word({0x01, 0x02, 0x04, 0x08}, 0x03);
 *   auto w = mem.read_word(0x03);                // optional<Word<4>>
 *
 * Not thread-safe. Iterators and chunk cursors borrow the memory and must not
 * outlive it.
 */
template <std::size_t W>
class VirtualMemory {
    static_assert(W > 0, "word width must be at least one byte");

public:
    using word_type      = Word<W>;
    using const_iterator = ConstWordIterator<W>;
    using iterator       = WordIterator<W>;

    explicit VirtualMemory(std::size_t length) : length_(length) {}

    // Build a memory holding `bytes`, one word per W-byte chunk. The length is
    // rounded up so a short trailing chunk gets its own zero-padded word.
    // All-zero chunks are not stored.
    static VirtualMemory from_bytes(const std::uint8_t* bytes, std::size_t size);
    static VirtualMemory from_bytes(const std::vector<std::uint8_t>& bytes) {
        return from_bytes(bytes.data(), bytes.size());
    }

    std::size_t len() const { return length_; }
    std::size_t width() const { return W; }

    // Number of words that currently occupy storage.
    std::size_t stored_words() const { return store_.size(); }

    // Stored entries only, ascending by address.
    const WordStore<W>& content() const { return store_; }

    // std::nullopt when addr >= len(), otherwise the word or zero if unwritten.
    std::optional<Word<W>> read_word(Address addr) const;

    // Throws AddressOutOfBounds when addr >= len().
    void write_word(const Word<W>& word, Address addr);

    /**
     * Fill `buf` with the words starting at `addr`, one W-byte chunk per word.
     * Chunks whose address falls outside the memory are left untouched. A
     * trailing chunk shorter than W receives the leading bytes of its word.
     *
     * The returned count is the final chunk address times W plus the length of
     * the trailing partial chunk, saturated at SIZE_MAX. It is advisory only
     * and is not the number of bytes copied into `buf`.
     */
    std::size_t read_at(std::uint8_t* buf, std::size_t size, Address addr) const;
    std::size_t read_at(std::vector<std::uint8_t>& buf, Address addr) const {
        return read_at(buf.data(), buf.size(), addr);
    }

    // Store `buf` starting at `addr`. Full chunks replace their word; a
    // trailing partial chunk only overwrites the leading bytes of its word.
    // Out-of-range chunks are dropped.
    void write_at(const std::uint8_t* buf, std::size_t size, Address addr);
    void write_at(const std::vector<std::uint8_t>& buf, Address addr) {
        write_at(buf.data(), buf.size(), addr);
    }

    // Words of `newMem` at every address where the two memories differ,
    // compared over the shorter of both lengths.
    static Changeset<W> diff(const VirtualMemory& oldMem, const VirtualMemory& newMem);

    // Write every changeset entry in ascending address order. Stops at the
    // first AddressOutOfBounds; entries before it stay written.
    void patch(const Changeset<W>& changeset);

    // Dense read-only traversal of 0..len()-1.
    const_iterator begin() const { return const_iterator(&store_, 0); }
    const_iterator end() const { return const_iterator(&store_, length_); }
    const_iterator cbegin() const { return begin(); }
    const_iterator cend() const { return end(); }
    IteratorRange<const_iterator> words() const { return {begin(), end()}; }

    // Dense writable traversal. Materializes every visited word.
    IteratorRange<iterator> words_mut() {
        return {iterator(&store_, 0), iterator(&store_, length_)};
    }

    // Consume the memory into a cursor over word copies.
    OwningWordCursor<W> into_words() && {
        return OwningWordCursor<W>(std::move(store_), length_);
    }

    AdjacentChunkCursor<W> chunks_adjacent_content(std::size_t chunkSize) const {
        return AdjacentChunkCursor<W>(store_, chunkSize);
    }

    // Same length and same logical word at every address.
    bool logically_equals(const VirtualMemory& other) const {
        return length_ == other.length_ && diff(*this, other).empty();
    }

    // Structural comparison: a stored zero word differs from an absent one.
    bool operator==(const VirtualMemory& other) const {
        return length_ == other.length_ && store_ == other.store_;
    }
    bool operator!=(const VirtualMemory& other) const { return !(*this == other); }

private:
    static std::size_t advisory_count(Address addr, std::size_t skipped, std::size_t rest);

    const Word<W>& word_at(Address addr) const {
        auto it = store_.find(addr);
        return it != store_.end() ? it->second : zero_word<W>();
    }

    WordStore<W> store_;
    std::size_t length_;
};

// ─────────────── implementation ───────────────────────────────────────

template <std::size_t W>
VirtualMemory<W> VirtualMemory<W>::from_bytes(const std::uint8_t* bytes, std::size_t size) {
    std::size_t length = size / W + (size % W != 0 ? 1 : 0);
    VirtualMemory mem(length);
    for (Address addr = 0; addr < length; ++addr) {
        std::size_t offset = addr * W;
        std::size_t n = std::min(W, size - offset);
        Word<W> word{};
        std::copy(bytes + offset, bytes + offset + n, word.begin());
        if (word != zero_word<W>()) mem.write_word(word, addr);
    }
    return mem;
}

template <std::size_t W>
std::optional<Word<W>> VirtualMemory<W>::read_word(Address addr) const {
    if (addr >= length_) return std::nullopt;
    return word_at(addr);
}

template <std::size_t W>
void VirtualMemory<W>::write_word(const Word<W>& word, Address addr) {
    if (addr >= length_) throw AddressOutOfBounds(addr, length_);
    store_[addr] = word;
}

template <std::size_t W>
std::size_t VirtualMemory<W>::read_at(std::uint8_t* buf, std::size_t size, Address addr) const {
    std::size_t full = size / W;
    std::size_t rest = size % W;
    // once addr reaches length_ every later chunk is out of range too
    std::size_t i = 0;
    for (; i < full && addr < length_; ++i, ++addr) {
        const Word<W>& word = word_at(addr);
        std::copy(word.begin(), word.end(), buf + i * W);
    }
    if (rest != 0 && i == full && addr < length_) {
        const Word<W>& word = word_at(addr);
        std::copy(word.begin(), word.begin() + rest, buf + full * W);
    }
    return advisory_count(addr, full - i, rest);
}

template <std::size_t W>
void VirtualMemory<W>::write_at(const std::uint8_t* buf, std::size_t size, Address addr) {
    std::size_t full = size / W;
    std::size_t rest = size % W;
    std::size_t i = 0;
    for (; i < full && addr < length_; ++i, ++addr) {
        Word<W>& word = store_[addr];
        std::copy(buf + i * W, buf + (i + 1) * W, word.begin());
    }
    if (rest != 0 && i == full && addr < length_) {
        // operator[] value-initializes an absent word to zero before the merge
        Word<W>& word = store_[addr];
        std::copy(buf + full * W, buf + size, word.begin());
    }
}

// (addr + skipped) * W + rest, saturated at SIZE_MAX instead of wrapping.
template <std::size_t W>
std::size_t VirtualMemory<W>::advisory_count(Address addr, std::size_t skipped, std::size_t rest) {
    const std::size_t max = std::numeric_limits<std::size_t>::max();
    if (skipped > max - addr) return max;
    Address last = addr + skipped;
    if (last > (max - rest) / W) return max;
    return last * W + rest;
}

template <std::size_t W>
Changeset<W> VirtualMemory<W>::diff(const VirtualMemory& oldMem, const VirtualMemory& newMem) {
    Changeset<W> changes;
    auto o = oldMem.begin(), oEnd = oldMem.end();
    auto n = newMem.begin(), nEnd = newMem.end();
    for (; o != oEnd && n != nEnd; ++o, ++n) {
        if (*o != *n) changes.emplace(n.address(), *n);
    }
    return changes;
}

template <std::size_t W>
void VirtualMemory<W>::patch(const Changeset<W>& changeset) {
    for (const auto& [addr, word] : changeset) {
        write_word(word, addr);
    }
}

} // namespace vmem

#endif // VMEM_VIRTUAL_MEMORY_H
