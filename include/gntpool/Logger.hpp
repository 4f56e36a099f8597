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

enum { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARN, LOG_ERROR, LOG_FATAL };


namespace gntpool {
  void log(int level, const char *file, int line, const char *fmt, ...)
      __attribute__((format(printf, 4, 5)));

  // Has no effect if the level was locked by GNTPOOL_LOG_LEVEL.
  void set_log_level(int level);
  int get_log_level(void);

  int printf(const char *format, ...) __attribute__((format(printf, 1, 2)));
};  // namespace gntpool


#ifdef __FILE_NAME__
#define GNTPOOL_LOG_FILE __FILE_NAME__
#else
#define GNTPOOL_LOG_FILE __FILE__
#endif

#ifdef GNTPOOL_ENABLE_LOGGING
#define log_trace(...) gntpool::log(LOG_TRACE, GNTPOOL_LOG_FILE, __LINE__, __VA_ARGS__)
#define log_debug(...) gntpool::log(LOG_DEBUG, GNTPOOL_LOG_FILE, __LINE__, __VA_ARGS__)
#define log_info(...) gntpool::log(LOG_INFO, GNTPOOL_LOG_FILE, __LINE__, __VA_ARGS__)
#define log_warn(...) gntpool::log(LOG_WARN, GNTPOOL_LOG_FILE, __LINE__, __VA_ARGS__)
#define log_error(...) gntpool::log(LOG_ERROR, GNTPOOL_LOG_FILE, __LINE__, __VA_ARGS__)
#define log_fatal(...) gntpool::log(LOG_FATAL, GNTPOOL_LOG_FILE, __LINE__, __VA_ARGS__)
#else
#define log_trace(...)
#define log_debug(...)
#define log_info(...)
#define log_warn(...)
#define log_error(...)
#define log_fatal(...)
#endif
