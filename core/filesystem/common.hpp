/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

namespace slotwatch::filesystem {
  using namespace std::filesystem;  // NOLINT(google-build-using-namespace)
}  // namespace slotwatch::filesystem
