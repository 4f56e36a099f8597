/*
 * This file is part of the gntpool Grant Reference Pool
 *
 * Copyright (c) 2024, The gntpool Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */
#pragma once

#include <limits.h>
#include <stdint.h>
#include <stdlib.h>
#include <gntpool/utils.h>


namespace gntpool {

  // Just a bitmap class using 64 bit values. Construct
  // with the length you need. Cannot grow!
  class Bitmap final {
   public:
    typedef uint64_t word_t;
    static constexpr uint64_t bits_per_word = sizeof(word_t) * CHAR_BIT;

    Bitmap(uint64_t length)
        : m_length(length) {
      m_bits = (word_t *)calloc(word_count() ? word_count() : 1, sizeof(word_t));
      GNTPOOL_ASSERT(m_bits != NULL, "failed to allocate a bitmap of %lu bits", (unsigned long)length);
    }

    ~Bitmap(void) { free(m_bits); }

    Bitmap(const Bitmap &) = delete;
    Bitmap &operator=(const Bitmap &) = delete;

    uint64_t size(void) const { return m_length; }

    inline void clear_all(void) {
      for (uint64_t i = 0; i < word_count(); i++) {
        m_bits[i] = 0;
      }
    }

    bool get(uint64_t n) const {
      return (m_bits[n / bits_per_word] & bit(n)) != 0;
    }

    void set(uint64_t n) { m_bits[n / bits_per_word] |= bit(n); }

    void clear(uint64_t n) { m_bits[n / bits_per_word] &= ~bit(n); }

    // Count the set bits.
    uint64_t popcount(void) const {
      uint64_t count = 0;
      for (uint64_t i = 0; i < word_count(); i++) {
        count += __builtin_popcountll(m_bits[i]);
      }
      return count;
    }

   private:
    uint64_t word_count(void) const { return (m_length + bits_per_word - 1) / bits_per_word; }
    static word_t bit(uint64_t n) { return (word_t)1 << (n % bits_per_word); }

    uint64_t m_length;  // Might as well make this 64 bits (alignment)
    word_t *m_bits = NULL;
  };
}  // namespace gntpool
