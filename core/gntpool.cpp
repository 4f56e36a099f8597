/*
 * This file is part of the gntpool Grant Reference Pool
 *
 * Copyright (c) 2024, The gntpool Authors
 * All rights reserved.
 *
 * This is free software.  You are permitted to use, redistribute,
 * and modify it as specified in the file "LICENSE".
 */


#include <gntpool/gntpool.hpp>
#include <stdio.h>


namespace gntpool {

  std::string to_string(grant_ref_t ref) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%u", (unsigned)ref);
    return buf;
  }
}  // namespace gntpool
