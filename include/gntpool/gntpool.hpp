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

#include <stdint.h>
#include <string>
#include <gntpool/utils.h>

namespace gntpool {

  // A grant reference: the index of one entry in the hypervisor's grant table.
  typedef uint32_t grant_ref_t;

  // Render a grant reference in decimal.
  std::string to_string(grant_ref_t ref);
}  // namespace gntpool
