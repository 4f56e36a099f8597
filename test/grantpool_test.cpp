#include <gtest/gtest.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <vector>
#include <set>

#include <gntpool/GrantPool.hpp>
#include <gntpool/Logger.hpp>


class GrantPoolTest : public ::testing::Test {
 public:
  void SetUp() override {
    // Make it so we only get warnings
    gntpool::set_log_level(LOG_WARN);
  }
  void TearDown() override {}


  // Drain everything the pool will give us without blocking.
  std::vector<gntpool::grant_ref_t> drain(gntpool::GrantPool &pool) {
    std::vector<gntpool::grant_ref_t> refs;
    gntpool::grant_ref_t ref;
    while (pool.try_acquire(&ref))
      refs.push_back(ref);
    return refs;
  }
};



TEST_F(GrantPoolTest, Sanity) {
  gntpool::GrantPool pool(10, 3);
  ASSERT_EQ(pool.capacity(), 10);
  ASSERT_EQ(pool.reserved(), 3);
  ASSERT_EQ(pool.num_free(), 7);
  ASSERT_EQ(pool.num_held(), 0);
  ASSERT_EQ(pool.num_waiters(), 0);
}


TEST_F(GrantPoolTest, InitialQueueIsAscendingPastReserved) {
  gntpool::GrantPool pool(10, 3);

  auto refs = drain(pool);
  std::vector<gntpool::grant_ref_t> expected = {3, 4, 5, 6, 7, 8, 9};
  ASSERT_EQ(refs, expected);
  ASSERT_EQ(pool.num_free(), 0);
  ASSERT_EQ(pool.num_held(), 7);
}


TEST_F(GrantPoolTest, AcquireDoesNotBlockWhileFree) {
  gntpool::GrantPool pool(10, 3);
  std::set<gntpool::grant_ref_t> seen;

  for (int i = 0; i < 7; i++) {
    auto ref = pool.acquire();
    ASSERT_GE(ref, 3);
    ASSERT_LT(ref, 10);
    // Every reference handed out must be distinct
    ASSERT_TRUE(seen.insert(ref).second);
  }

  // The eighth would block, so only try it.
  gntpool::grant_ref_t ref;
  ASSERT_FALSE(pool.try_acquire(&ref));
}


TEST_F(GrantPoolTest, NoReservedReferenceIsEverReturned) {
  for (gntpool::grant_ref_t reserved = 0; reserved <= 16; reserved++) {
    gntpool::GrantPool pool(16, reserved);
    auto refs = drain(pool);
    ASSERT_EQ(refs.size(), 16 - reserved);
    for (auto ref : refs) {
      ASSERT_GE(ref, reserved);
    }
  }
}


TEST_F(GrantPoolTest, ReleasedReferencesGoToTheBack) {
  gntpool::GrantPool pool(10, 3);

  auto first = pool.acquire();
  ASSERT_EQ(first, 3);
  pool.release(first);

  // 3 was appended behind 4..9, so it comes out last.
  auto refs = drain(pool);
  std::vector<gntpool::grant_ref_t> expected = {4, 5, 6, 7, 8, 9, 3};
  ASSERT_EQ(refs, expected);
}


TEST_F(GrantPoolTest, ReleaseThenReacquire) {
  gntpool::GrantPool pool(10, 3);
  auto refs = drain(pool);

  pool.release(5);
  ASSERT_EQ(pool.num_free(), 1);
  ASSERT_EQ(pool.num_held(), 6);

  ASSERT_EQ(pool.acquire(), 5);
  ASSERT_EQ(pool.num_free(), 0);

  // Nothing else can see 5 until it is released again.
  gntpool::grant_ref_t ref;
  ASSERT_FALSE(pool.try_acquire(&ref));
}


TEST_F(GrantPoolTest, AccountingHoldsAfterEveryOperation) {
  gntpool::GrantPool pool(32, 4);
  const size_t usable = 28;
  std::vector<gntpool::grant_ref_t> held;

  for (int round = 0; round < 4; round++) {
    for (int i = 0; i < 10; i++) {
      held.push_back(pool.acquire());
      ASSERT_EQ(pool.num_free() + pool.num_held(), usable);
      ASSERT_EQ(pool.num_held(), held.size());
    }
    for (int i = 0; i < 7; i++) {
      pool.release(held.back());
      held.pop_back();
      ASSERT_EQ(pool.num_free() + pool.num_held(), usable);
      ASSERT_EQ(pool.num_held(), held.size());
    }
  }

  for (auto ref : held)
    pool.release(ref);
  ASSERT_EQ(pool.num_free(), usable);
}


TEST_F(GrantPoolTest, IsHeldTracksOwnership) {
  gntpool::GrantPool pool(10, 3);

  ASSERT_FALSE(pool.is_held(3));
  auto ref = pool.acquire();
  ASSERT_TRUE(pool.is_held(ref));
  pool.release(ref);
  ASSERT_FALSE(pool.is_held(ref));

  // Reserved and out-of-range references are never held
  ASSERT_FALSE(pool.is_held(0));
  ASSERT_FALSE(pool.is_held(100));
}


TEST_F(GrantPoolTest, FullyReservedPoolIsEmpty) {
  gntpool::GrantPool pool(5, 5);
  ASSERT_EQ(pool.num_free(), 0);
  ASSERT_EQ(pool.num_held(), 0);

  gntpool::grant_ref_t ref;
  ASSERT_FALSE(pool.try_acquire(&ref));
  // A blocking acquire would wait forever; a bounded one must time out cleanly.
  ASSERT_EQ(pool.acquire_timed(20, &ref), -ETIMEDOUT);
  ASSERT_EQ(pool.num_waiters(), 0);
  ASSERT_EQ(pool.num_free(), 0);
}


TEST_F(GrantPoolTest, EmptyTable) {
  gntpool::GrantPool pool(0, 0);
  gntpool::grant_ref_t ref;
  ASSERT_FALSE(pool.try_acquire(&ref));
  ASSERT_EQ(pool.num_free(), 0);
}


TEST_F(GrantPoolTest, AcquireTimedTakesFreeReferenceImmediately) {
  gntpool::GrantPool pool(10, 3);
  gntpool::grant_ref_t ref = 0;
  ASSERT_EQ(pool.acquire_timed(0, &ref), 0);
  ASSERT_EQ(ref, 3);
  ASSERT_TRUE(pool.is_held(3));
}


TEST_F(GrantPoolTest, AcquireTimedOutLeavesPoolConsistent) {
  gntpool::GrantPool pool(4, 1);
  auto refs = drain(pool);
  ASSERT_EQ(refs.size(), 3);

  gntpool::grant_ref_t ref = 1234;
  ASSERT_EQ(pool.acquire_timed(10, &ref), -ETIMEDOUT);
  // The out parameter is untouched on timeout
  ASSERT_EQ(ref, 1234);
  ASSERT_EQ(pool.num_waiters(), 0);
  ASSERT_EQ(pool.num_held(), 3);

  // And the pool still works afterwards
  pool.release(refs[1]);
  ASSERT_EQ(pool.acquire_timed(10, &ref), 0);
  ASSERT_EQ(ref, refs[1]);
}


TEST_F(GrantPoolTest, ToStringIsDecimal) {
  ASSERT_EQ(gntpool::to_string(0), "0");
  ASSERT_EQ(gntpool::to_string(7), "7");
  ASSERT_EQ(gntpool::to_string(4294967295U), "4294967295");
}


TEST_F(GrantPoolTest, ToStringIsIdempotentAndPure) {
  gntpool::GrantPool pool(10, 3);
  auto ref = pool.acquire();

  auto a = gntpool::to_string(ref);
  auto b = gntpool::to_string(ref);
  ASSERT_EQ(a, b);
  ASSERT_EQ(a, "3");

  ASSERT_EQ(pool.num_free(), 6);
  ASSERT_EQ(pool.num_held(), 1);
  ASSERT_TRUE(pool.is_held(ref));
}


TEST_F(GrantPoolTest, UntrackedPoolStillCounts) {
  gntpool::Configuration config;
  config.track_held = false;
  gntpool::GrantPool pool(8, 2, config);

  auto ref = pool.acquire();
  ASSERT_EQ(ref, 2);
  // Without tracking, nothing is reported as held
  ASSERT_FALSE(pool.is_held(ref));
  ASSERT_EQ(pool.num_held(), 1);

  pool.release(ref);
  ASSERT_EQ(pool.num_free(), 6);
}


TEST_F(GrantPoolTest, Dump) {
  gntpool::GrantPool pool(10, 3);
  pool.acquire();

  char *buf = NULL;
  size_t len = 0;
  FILE *stream = open_memstream(&buf, &len);
  ASSERT_NE(stream, nullptr);
  pool.dump(stream);
  fclose(stream);

  ASSERT_NE(strstr(buf, "Entries:  10"), nullptr);
  ASSERT_NE(strstr(buf, "Reserved: [0, 3)"), nullptr);
  ASSERT_NE(strstr(buf, "Free:     6"), nullptr);
  ASSERT_NE(strstr(buf, "Held:     1"), nullptr);
  ASSERT_NE(strstr(buf, " 4 5 6 7 8 9"), nullptr);
  free(buf);
}



TEST_F(GrantPoolTest, DoubleReleaseAborts) {
  gntpool::GrantPool pool(10, 3);
  auto ref = pool.acquire();
  pool.release(ref);

  ASSERT_DEATH({ pool.release(ref); }, "released while not held");
}


TEST_F(GrantPoolTest, ReleaseOfNeverAcquiredReferenceAborts) {
  gntpool::GrantPool pool(10, 3);
  ASSERT_DEATH({ pool.release(5); }, "released while not held");
}


TEST_F(GrantPoolTest, ReleaseOfReservedReferenceAborts) {
  gntpool::GrantPool pool(10, 3);
  ASSERT_DEATH({ pool.release(1); }, "does not belong to this pool");
  ASSERT_DEATH({ pool.release(10); }, "does not belong to this pool");
}


TEST_F(GrantPoolTest, ReservedLargerThanTableAborts) {
  ASSERT_DEATH({ gntpool::GrantPool pool(3, 5); }, "cannot reserve");
}


#ifdef GNTPOOL_SANITY_CHECK
TEST_F(GrantPoolTest, SanityCheckCatchesOverfullQueue) {
  gntpool::Configuration config;
  config.track_held = false;
  gntpool::GrantPool pool(4, 1, config);

  // Untracked release accepts a reference that is already free, so only the
  // accounting check notices the queue outgrowing the table.
  ASSERT_EXIT({ pool.release(2); }, ::testing::ExitedWithCode(EXIT_FAILURE), "Sanity Check Failed");
}
#endif
