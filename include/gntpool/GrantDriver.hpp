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

#include <gntpool/gntpool.hpp>
#include <gntpool/Configuration.hpp>

namespace gntpool {

  /**
   * @brief The low-level owner of a grant table.
   *
   * A GrantDriver knows how big the backing table is, how many entries at the
   * start of it are reserved for the system, and how to set it up and tear it
   * down. It knows nothing about which references are in use; that is the job
   * of the GrantPool built on top of it.
   *
   * Errors are reported as negative errno values.
   */
  class GrantDriver {
   public:
    virtual ~GrantDriver(void) = default;

    // One-time setup of the backing table. Returns 0 or -errno.
    virtual int init(void) = 0;
    // Release the backing table. Safe to call more than once.
    virtual void fini(void) = 0;

    // Total number of entries in the table, or -errno.
    virtual long nr_entries(void) = 0;
    // Number of entries, counted from zero, that may never be allocated, or -errno.
    virtual long nr_reserved(void) = 0;
  };



  // A driver which reports a fixed geometry and owns no real table. This is
  // what tests and tools use when there is no hypervisor around.
  class FixedGrantDriver final : public GrantDriver {
   public:
    FixedGrantDriver(long entries, long reserved);
    ~FixedGrantDriver(void) override = default;

    int init(void) override;
    void fini(void) override;
    long nr_entries(void) override;
    long nr_reserved(void) override;

    // Make nr_entries() and nr_reserved() fail with `err` (a negative errno).
    // Passing 0 restores normal behavior.
    void fail_queries_with(int err) { m_query_error = err; }
    // Make init() fail with `err` (a negative errno).
    void fail_init_with(int err) { m_init_error = err; }

    bool initialized(void) const { return m_initialized; }
    int init_count(void) const { return m_init_count; }
    int fini_count(void) const { return m_fini_count; }

   private:
    long m_entries;
    long m_reserved;
    int m_query_error = 0;
    int m_init_error = 0;

    bool m_initialized = false;
    int m_init_count = 0;
    int m_fini_count = 0;
  };



  // A driver backed by the Linux xen-gntalloc device. The size of the table is
  // the module's `limit` parameter, and the reserved prefix is the one the Xen
  // grant table ABI sets aside for the toolstack and xenstore.
  class XenGrantDriver final : public GrantDriver {
   public:
    // GNTTAB_NR_RESERVED_ENTRIES in xen/include/public/grant_table.h
    static constexpr long nr_reserved_entries = 8;

    XenGrantDriver(const gntpool::Configuration &config = {});
    ~XenGrantDriver(void) override;

    int init(void) override;
    void fini(void) override;
    long nr_entries(void) override;
    long nr_reserved(void) override;

    int fd(void) const { return m_fd; }

   private:
    gntpool::Configuration m_config;
    int m_fd = -1;
  };
}  // namespace gntpool
