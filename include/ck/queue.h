#pragma once

#include <stdlib.h>
#include <stdint.h>
#include <stddef.h>
#include <new>
#include <utility>


namespace ck {

  // A FIFO ring buffer that doubles its backing store when full. The
  // capacity is always a power of two so that offsets can be masked.
  template <typename T>
  class queue {
   private:
    size_t front = 0, back = 0;
    size_t capacity;
    T *backing;

    size_t off(size_t o) const { return o & (capacity - 1); }

    static size_t round_pow2(size_t n) {
      size_t p = 1;
      while (p < n)
        p <<= 1;
      return p;
    }

    void grow(void) {
      auto new_cap = capacity * 2;
      T *new_backing = new T[new_cap];

      size_t count = 0;
      while (back != front)
        new_backing[count++] = std::move(backing[off(back++)]);

      delete[] backing;

      backing = new_backing;
      capacity = new_cap;
      front = count;
      back = 0;
    }

   public:
    queue(size_t initial_cap = 4) {
      capacity = round_pow2(initial_cap < 1 ? 1 : initial_cap);
      backing = new T[capacity];
    }

    ~queue() { delete[] backing; }

    queue(const queue &) = delete;
    queue &operator=(const queue &) = delete;


    bool is_full(void) const { return (front - back) == capacity; }
    bool is_empty(void) const { return front == back; }
    size_t size(void) const { return front - back; }

    void push(const T &value) {
      if (is_full()) grow();
      backing[off(front++)] = value;
    }

    // Pop the oldest element into `out`. Returns false if the queue is empty.
    bool pop(T &out) {
      if (is_empty()) return false;
      out = std::move(backing[off(back++)]);
      return true;
    }

    // Peek at the i-th oldest element. `i` must be less than size().
    const T &at(size_t i) const { return backing[off(back + i)]; }
  };
}  // namespace ck
