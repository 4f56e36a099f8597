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

namespace gntpool {
  // This structure is threaded through the creation of pools and drivers to
  // allow configuration of various features.
  struct Configuration {
    // Record which references are held so that a double release or the
    // release of a foreign reference is caught instead of corrupting the pool.
    bool track_held = true;

    // Where XenGrantDriver finds the gntalloc device and its size limit.
    const char *gntalloc_device = "/dev/xen/gntalloc";
    const char *gntalloc_limit_path = "/sys/module/xen_gntalloc/parameters/limit";
  };
}  // namespace gntpool
