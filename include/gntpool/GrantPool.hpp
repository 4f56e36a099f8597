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

#include <stdint.h>
#include <stdio.h>
#include <gntpool/gntpool.hpp>
#include <gntpool/Bitmap.hpp>
#include <gntpool/Configuration.hpp>
#include <gntpool/GrantDriver.hpp>
#include <ck/lock.h>
#include <ck/queue.h>


namespace gntpool {

  /**
   * @brief A bounded, blocking pool of grant references.
   *
   * The pool hands out every reference in [nr_reserved, nr_entries) to
   * concurrent callers, one at a time. References below nr_reserved belong to
   * the system and are never handed out. When no reference is free, acquire()
   * blocks until another thread calls release().
   *
   * Free references live in a FIFO queue: released references go to the back
   * and acquisitions take from the front. Waiters are woken one per release,
   * and every woken waiter re-checks the queue before taking from it, since a
   * thread that never slept may have taken the reference first. There is no
   * fairness between waiters beyond what the condition variable gives us.
   *
   * Invariant: num_free() + num_held() == nr_entries - nr_reserved.
   */
  class GrantPool final {
   public:
    // Build a pool over [nr_reserved, nr_entries). This does not talk to any
    // driver, which makes it the constructor to use with made-up geometry.
    // nr_reserved must not exceed nr_entries.
    GrantPool(grant_ref_t nr_entries, grant_ref_t nr_reserved, gntpool::Configuration config = {});
    ~GrantPool(void);

    GrantPool(const GrantPool &) = delete;
    GrantPool &operator=(const GrantPool &) = delete;

    // Query `driver` for the table geometry, fill a pool with it, then
    // initialize the driver. On failure, returns nullptr and stores a negative
    // errno in `*error` (if it is not null). The caller owns the returned pool
    // and remains responsible for calling driver.fini().
    static GrantPool *create(
        GrantDriver &driver, int *error = nullptr, gntpool::Configuration config = {});

    // Take a free reference, blocking for as long as it takes.
    grant_ref_t acquire(void);
    // Take a free reference if there is one. Never blocks.
    bool try_acquire(grant_ref_t *out);
    // Take a free reference, waiting at most `timeout_ms` milliseconds.
    // Returns 0, or -ETIMEDOUT if nothing was released in time.
    int acquire_timed(uint64_t timeout_ms, grant_ref_t *out);

    // Return a reference obtained from this pool. Releasing a reference which
    // is not held is a programming error.
    void release(grant_ref_t ref);

    grant_ref_t capacity(void) const { return m_nr_entries; }
    grant_ref_t reserved(void) const { return m_nr_reserved; }
    size_t num_free(void);
    size_t num_held(void);
    size_t num_waiters(void);
    // Only meaningful when the pool tracks held references.
    bool is_held(grant_ref_t ref);

    void dump(FILE *stream);

   private:
    // All of these require m_lock to be held.
    grant_ref_t take_locked(void);
    size_t held_locked(void) const {
      return (size_t)(m_nr_entries - m_nr_reserved) - m_free.size();
    }
    void check_invariants_locked(void);

    gntpool::Configuration m_config;
    const grant_ref_t m_nr_entries;
    const grant_ref_t m_nr_reserved;

    ck::mutex m_lock;
    // Signalled once per release.
    ck::condvar m_available;
    ck::queue<grant_ref_t> m_free;
    // Bit i is set while reference i is held by a caller.
    gntpool::Bitmap m_held;
    size_t m_waiters = 0;
  };
}  // namespace gntpool
