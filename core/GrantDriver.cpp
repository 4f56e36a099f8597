/*
 * This file is part of the gntpool Grant Reference Pool
 *
 * Copyright (c) 2024, The gntpool Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <gntpool/GrantDriver.hpp>
#include <gntpool/Logger.hpp>
#include <gntpool/utils.h>
#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>


namespace gntpool {

  //////////////////////
  // Fixed Grant Driver
  //////////////////////
  FixedGrantDriver::FixedGrantDriver(long entries, long reserved)
      : m_entries(entries)
      , m_reserved(reserved) {}


  int FixedGrantDriver::init(void) {
    GNTPOOL_ASSERT(!m_initialized, "grant driver initialized twice");
    if (m_init_error != 0) {
      log_warn("fixed driver: init failing with %d", m_init_error);
      return m_init_error;
    }

    m_initialized = true;
    m_init_count++;
    log_debug("fixed driver: %ld entries, %ld reserved", m_entries, m_reserved);
    return 0;
  }


  void FixedGrantDriver::fini(void) {
    if (!m_initialized) return;
    m_initialized = false;
    m_fini_count++;
  }


  long FixedGrantDriver::nr_entries(void) {
    if (m_query_error != 0) return m_query_error;
    return m_entries;
  }


  long FixedGrantDriver::nr_reserved(void) {
    if (m_query_error != 0) return m_query_error;
    return m_reserved;
  }



  //////////////////////
  // Xen Grant Driver
  //////////////////////
  XenGrantDriver::XenGrantDriver(const gntpool::Configuration &config)
      : m_config(config) {}

  XenGrantDriver::~XenGrantDriver(void) { fini(); }


  int XenGrantDriver::init(void) {
    GNTPOOL_ASSERT(m_fd < 0, "grant driver initialized twice");

    m_fd = open(m_config.gntalloc_device, O_RDWR | O_CLOEXEC);
    if (m_fd < 0) {
      int err = errno;
      log_error("failed to open %s: %s", m_config.gntalloc_device, strerror(err));
      return -err;
    }

    log_debug("opened %s (fd %d)", m_config.gntalloc_device, m_fd);
    return 0;
  }


  void XenGrantDriver::fini(void) {
    if (m_fd < 0) return;
    if (close(m_fd) < 0) {
      log_warn("failed to close %s: %s", m_config.gntalloc_device, strerror(errno));
    }
    m_fd = -1;
  }


  long XenGrantDriver::nr_entries(void) {
    FILE *stream = fopen(m_config.gntalloc_limit_path, "r");
    if (stream == NULL) {
      int err = errno;
      log_error("cannot read the grant limit from %s: %s", m_config.gntalloc_limit_path,
          strerror(err));
      return -err;
    }

    char buf[32];
    char *line = fgets(buf, sizeof(buf), stream);
    fclose(stream);
    if (line == NULL) {
      log_error("%s is empty", m_config.gntalloc_limit_path);
      return -EINVAL;
    }

    char *end = NULL;
    errno = 0;
    long limit = strtol(buf, &end, 10);
    if (errno != 0 || end == buf || (*end != '\0' && *end != '\n') || limit < 0) {
      log_error("malformed grant limit in %s: '%s'", m_config.gntalloc_limit_path, buf);
      return -EINVAL;
    }

    return limit;
  }


  long XenGrantDriver::nr_reserved(void) { return nr_reserved_entries; }
}  // namespace gntpool
