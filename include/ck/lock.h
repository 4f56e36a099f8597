#pragma once

#include <pthread.h>
#include <errno.h>
#include <stdint.h>
#include <time.h>

namespace ck {

  class condvar;

  class mutex {
   private:
    pthread_mutex_t m_mutex;
    friend condvar;

   public:
    mutex(void) {
      pthread_mutex_init(&m_mutex, NULL);
    }
    ~mutex(void) {
      pthread_mutex_destroy(&m_mutex);
    }

    mutex(const mutex &) = delete;
    mutex &operator=(const mutex &) = delete;

    void lock(void) {
      pthread_mutex_lock(&m_mutex);
    }
    void unlock(void) {
      pthread_mutex_unlock(&m_mutex);
    }
  };


  class scoped_lock {
    ck::mutex &lck;
    bool locked = false;

   public:
    inline scoped_lock(ck::mutex &lck)
        : lck(lck) {
      locked = true;
      lck.lock();
    }

    inline ~scoped_lock(void) {
      unlock();
    }

    inline void unlock(void) {
      if (locked) lck.unlock();
      locked = false;
    }
  };


  // A condition variable which waits against the monotonic clock, so
  // timed waits are not disturbed by changes to the wall clock.
  class condvar {
   private:
    pthread_cond_t m_cond;

   public:
    condvar(void) {
      pthread_condattr_t attr;
      pthread_condattr_init(&attr);
      pthread_condattr_setclock(&attr, CLOCK_MONOTONIC);
      pthread_cond_init(&m_cond, &attr);
      pthread_condattr_destroy(&attr);
    }
    ~condvar(void) {
      pthread_cond_destroy(&m_cond);
    }

    condvar(const condvar &) = delete;
    condvar &operator=(const condvar &) = delete;

    // The caller must hold `m`. Wakeups may be spurious, so callers
    // always re-check their predicate.
    void wait(ck::mutex &m) {
      pthread_cond_wait(&m_cond, &m.m_mutex);
    }

    // Wait until the absolute monotonic `deadline`. Returns 0 when woken, or
    // ETIMEDOUT once the deadline has passed.
    int wait_until(ck::mutex &m, const struct timespec &deadline) {
      return pthread_cond_timedwait(&m_cond, &m.m_mutex, &deadline);
    }

    void signal(void) {
      pthread_cond_signal(&m_cond);
    }
  };


  // Compute an absolute CLOCK_MONOTONIC deadline `ms` milliseconds from now.
  inline struct timespec deadline_after_ms(uint64_t ms) {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    ts.tv_sec += ms / 1000;
    ts.tv_nsec += (long)(ms % 1000) * 1000000L;
    if (ts.tv_nsec >= 1000000000L) {
      ts.tv_sec += 1;
      ts.tv_nsec -= 1000000000L;
    }
    return ts;
  }
}  // namespace ck
