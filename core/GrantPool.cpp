/*
 * This file is part of the gntpool Grant Reference Pool
 *
 * Copyright (c) 2024, The gntpool Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <gntpool/GrantPool.hpp>
#include <gntpool/Logger.hpp>
#include <gntpool/utils.h>
#include <errno.h>
#include <stdio.h>


namespace gntpool {


  GrantPool::GrantPool(grant_ref_t nr_entries, grant_ref_t nr_reserved, Configuration config)
      : m_config(config)
      , m_nr_entries(nr_entries)
      , m_nr_reserved(nr_reserved)
      , m_free(nr_entries - (nr_reserved <= nr_entries ? nr_reserved : nr_entries))
      , m_held(config.track_held ? nr_entries : 0) {
    GNTPOOL_ASSERT(nr_reserved <= nr_entries,
        "cannot reserve %u grant references in a table of %u entries", nr_reserved, nr_entries);

    // Everything past the reserved prefix starts out free, in ascending order.
    for (grant_ref_t ref = nr_reserved; ref < nr_entries; ref++) {
      m_free.push(ref);
    }

    log_debug("grant pool %p: %u entries, %u reserved, %zu free", this, nr_entries, nr_reserved,
        m_free.size());
  }


  GrantPool::~GrantPool(void) {
    if (m_waiters != 0) {
      log_error("grant pool %p destroyed with %zu waiters", this, m_waiters);
    }
    log_debug("destroying grant pool %p", this);
  }



  GrantPool *GrantPool::create(GrantDriver &driver, int *error, Configuration config) {
    int err = 0;
    GrantPool *pool = nullptr;

    long entries = driver.nr_entries();
    long reserved = driver.nr_reserved();

    if (entries < 0) {
      log_error("failed to query the grant table size: %ld", entries);
      err = (int)entries;
    } else if (reserved < 0) {
      log_error("failed to query the reserved grant count: %ld", reserved);
      err = (int)reserved;
    } else if (reserved > entries || entries > (long)UINT32_MAX) {
      log_error("bad grant table geometry: %ld entries, %ld reserved", entries, reserved);
      err = -EINVAL;
    }

    if (err == 0) {
      pool = new GrantPool((grant_ref_t)entries, (grant_ref_t)reserved, config);

      // The pool is only handed out once the driver is ready, so nobody can
      // acquire from a half-initialized table.
      err = driver.init();
      if (err != 0) {
        log_error("failed to initialize the grant driver: %d", err);
        delete pool;
        pool = nullptr;
      }
    }

    if (error != nullptr) *error = err;
    return pool;
  }



  grant_ref_t GrantPool::take_locked(void) {
    grant_ref_t ref = 0;
    bool ok = m_free.pop(ref);
    GNTPOOL_ASSERT(ok, "took from an empty grant pool");

    if (m_config.track_held) {
      GNTPOOL_ASSERT(!m_held.get(ref), "grant reference %u was free and held at once", ref);
      m_held.set(ref);
    }

    check_invariants_locked();
    return ref;
  }


  grant_ref_t GrantPool::acquire(void) {
    ck::scoped_lock lk(m_lock);

    // Signal-and-recheck: a wakeup only means a reference *was* released.
    // Another thread may have taken it before we got the lock back.
    while (m_free.is_empty()) {
      m_waiters++;
      log_trace("grant pool %p: empty, waiting (%zu waiters)", this, m_waiters);
      m_available.wait(m_lock);
      m_waiters--;
    }

    grant_ref_t ref = take_locked();
    log_trace("acquired grant reference %u", ref);
    return ref;
  }


  bool GrantPool::try_acquire(grant_ref_t *out) {
    ck::scoped_lock lk(m_lock);
    if (m_free.is_empty()) return false;

    *out = take_locked();
    log_trace("acquired grant reference %u", *out);
    return true;
  }


  int GrantPool::acquire_timed(uint64_t timeout_ms, grant_ref_t *out) {
    struct timespec deadline = ck::deadline_after_ms(timeout_ms);
    ck::scoped_lock lk(m_lock);

    while (m_free.is_empty()) {
      m_waiters++;
      int r = m_available.wait_until(m_lock, deadline);
      m_waiters--;

      // If we timed out but something was released in the meantime, take it
      // anyway. We may have consumed the signal meant for that release, and
      // giving up here would leave the reference sitting in the queue while
      // another waiter sleeps.
      if (r == ETIMEDOUT && m_free.is_empty()) {
        log_debug("grant pool %p: timed out after %lums", this, (unsigned long)timeout_ms);
        return -ETIMEDOUT;
      }
    }

    *out = take_locked();
    log_trace("acquired grant reference %u", *out);
    return 0;
  }



  void GrantPool::release(grant_ref_t ref) {
    ck::scoped_lock lk(m_lock);

    if (m_config.track_held) {
      GNTPOOL_ASSERT(ref >= m_nr_reserved && ref < m_nr_entries,
          "grant reference %u does not belong to this pool [%u, %u)", ref, m_nr_reserved,
          m_nr_entries);
      GNTPOOL_ASSERT(m_held.get(ref), "grant reference %u released while not held", ref);
      m_held.clear(ref);
    }

    m_free.push(ref);
    check_invariants_locked();

    log_trace("released grant reference %u (%zu waiters)", ref, m_waiters);
    m_available.signal();
  }



  size_t GrantPool::num_free(void) {
    ck::scoped_lock lk(m_lock);
    return m_free.size();
  }

  size_t GrantPool::num_held(void) {
    ck::scoped_lock lk(m_lock);
    return held_locked();
  }

  size_t GrantPool::num_waiters(void) {
    ck::scoped_lock lk(m_lock);
    return m_waiters;
  }

  bool GrantPool::is_held(grant_ref_t ref) {
    if (!m_config.track_held || ref >= m_nr_entries) return false;
    ck::scoped_lock lk(m_lock);
    return m_held.get(ref);
  }


  void GrantPool::check_invariants_locked(void) {
    GNTPOOL_SANITY(m_free.size() <= (size_t)(m_nr_entries - m_nr_reserved),
        "grant pool holds %zu free references but only has room for %u", m_free.size(),
        m_nr_entries - m_nr_reserved);
    if (m_config.track_held) {
      GNTPOOL_SANITY(m_held.popcount() == held_locked(),
          "grant pool accounting is off: %lu marked held, %zu expected",
          (unsigned long)m_held.popcount(), held_locked());
    }
  }


  void GrantPool::dump(FILE *stream) {
    ck::scoped_lock lk(m_lock);

    fprintf(stream, "Grant Pool:\n");
    fprintf(stream, " - Entries:  %u\n", m_nr_entries);
    fprintf(stream, " - Reserved: [0, %u)\n", m_nr_reserved);
    fprintf(stream, " - Free:     %zu\n", m_free.size());
    fprintf(stream, " - Held:     %zu\n", held_locked());
    fprintf(stream, " - Waiters:  %zu\n", m_waiters);

    fprintf(stream, " - Queue:   ");
    for (size_t i = 0; i < m_free.size(); i++) {
      if (i == 16) {
        fprintf(stream, " ... (%zu more)", m_free.size() - i);
        break;
      }
      fprintf(stream, " %u", m_free.at(i));
    }
    fprintf(stream, "\n");
  }
}  // namespace gntpool
