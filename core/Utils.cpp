/*
 * This file is part of the gntpool Grant Reference Pool
 *
 * Copyright (c) 2024, The gntpool Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <gntpool/utils.h>
#include <execinfo.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

void gntpool_dump_backtrace(void) {
  void *frames[64];
  int depth = backtrace(frames, 64);
  fprintf(stderr, "Backtrace:\n");
  backtrace_symbols_fd(frames, depth, STDERR_FILENO);

  FILE *stream = fopen("/proc/self/maps", "r");
  if (stream == NULL) return;

  fprintf(stderr, "Memory Map:\n");
  char line[1024];
  while (fgets(line, sizeof(line), stream) != NULL) {
    fwrite(line, strlen(line), 1, stderr);
  }

  fclose(stream);
}
