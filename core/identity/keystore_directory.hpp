/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "filesystem/common.hpp"
#include "outcome/outcome.hpp"

namespace slotwatch::identity {

  /**
   * Node keystore on the local file system. Each key lives in its own file
   * named by hex of key type and public key.
   */
  class KeystoreDirectory {
   public:
    /**
     * @return names of regular files in the directory. Symbolic links are
     * not followed and never listed, even when they point to a key file.
     */
    static outcome::result<std::vector<std::string>> list(
        const filesystem::path &path);
  };

}  // namespace slotwatch::identity
