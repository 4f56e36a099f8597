/*
 * This file is part of the gntpool Grant Reference Pool
 *
 * Copyright (c) 2024, The gntpool Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <string>
#include <vector>

#include <gntpool/GrantPool.hpp>
#include <gntpool/GrantDriver.hpp>
#include <gntpool/Logger.hpp>


static void usage(void) {
  gntpool::printf("usage: gntpool-info [--fixed TOTAL RESERVED | --xen] [--acquire N]\n");
  gntpool::printf("  --fixed TOTAL RESERVED: use a table of TOTAL entries with RESERVED reserved\n");
  gntpool::printf("  --xen:                  use the xen-gntalloc device (default)\n");
  gntpool::printf("  --acquire N:            acquire N references before dumping the pool\n");
}


static bool parse_long(const char *s, long *out) {
  char *end = NULL;
  long v = strtol(s, &end, 10);
  if (end == s || *end != '\0' || v < 0) return false;
  *out = v;
  return true;
}


int main(int argc, char **argv) {
  bool use_xen = true;
  long total = 0, reserved = 0, nacquire = 0;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--xen") {
      use_xen = true;
    } else if (arg == "--fixed" && i + 2 < argc) {
      use_xen = false;
      if (!parse_long(argv[i + 1], &total) || !parse_long(argv[i + 2], &reserved)) {
        usage();
        return EXIT_FAILURE;
      }
      i += 2;
    } else if (arg == "--acquire" && i + 1 < argc) {
      if (!parse_long(argv[++i], &nacquire)) {
        usage();
        return EXIT_FAILURE;
      }
    } else {
      usage();
      return EXIT_FAILURE;
    }
  }

  gntpool::FixedGrantDriver fixed(total, reserved);
  gntpool::XenGrantDriver xen;
  gntpool::GrantDriver &driver = use_xen ? (gntpool::GrantDriver &)xen : fixed;

  int err = 0;
  gntpool::GrantPool *pool = gntpool::GrantPool::create(driver, &err);
  if (pool == nullptr) {
    fprintf(stderr, "gntpool-info: failed to create the grant pool: %s\n", strerror(-err));
    return EXIT_FAILURE;
  }

  // Never block: a tool that hangs on an exhausted table is useless.
  std::vector<gntpool::grant_ref_t> held;
  for (long i = 0; i < nacquire; i++) {
    gntpool::grant_ref_t ref;
    if (!pool->try_acquire(&ref)) {
      gntpool::printf("pool exhausted after %zu references\n", held.size());
      break;
    }
    gntpool::printf("acquired %s\n", gntpool::to_string(ref).c_str());
    held.push_back(ref);
  }

  pool->dump(stdout);

  for (auto ref : held)
    pool->release(ref);

  delete pool;
  driver.fini();
  return EXIT_SUCCESS;
}
