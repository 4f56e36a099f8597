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

#include <stdio.h>
#include <stdlib.h>

#ifdef GNTPOOL_SANITY_CHECK
#define GNTPOOL_SANITY(c, msg, ...)                                                              \
  do {                                                                                           \
    if (!(c)) { /* if the check is not true... */                                                \
      fprintf(stderr, "\x1b[31m-----------[ gntpool Sanity Check Failed ]-----------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                       \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                              \
      fprintf(stderr, msg "\n", ##__VA_ARGS__);                                                  \
      gntpool_dump_backtrace();                                                                  \
      fprintf(stderr, "\x1b[31m                      Bailing!\x1b[0m\n");                        \
      exit(EXIT_FAILURE);                                                                        \
    }                                                                                            \
  } while (0)
#else
#define GNTPOOL_SANITY(c, msg, ...) /* do nothing if it's disabled */
#endif

#define GNTPOOL_ASSERT(c, msg, ...)                                                        \
  do {                                                                                     \
    if (!(c)) { /* if the check is not true... */                                          \
      fprintf(stderr, "\x1b[31m-----------[ gntpool Assert Failed ]-----------\x1b[0m\n"); \
      fprintf(stderr, "%s line %d\n", __FILE__, __LINE__);                                 \
      fprintf(stderr, "Check, `%s`, failed\n", #c);                                        \
      fprintf(stderr, "Reason: \x1b[33m" msg "\x1b[0m\n", ##__VA_ARGS__);                  \
      gntpool_dump_backtrace();                                                            \
      fprintf(stderr, "\x1b[31mExiting.\x1b[0m\n");                                        \
      abort();                                                                             \
    }                                                                                      \
  } while (0)


// Print the current call stack and memory map to stderr.
extern void gntpool_dump_backtrace(void);
