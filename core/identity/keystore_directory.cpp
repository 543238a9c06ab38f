/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/keystore_directory.hpp"

#include "identity/identity_error.hpp"
#include "log/logger.hpp"

namespace slotwatch::identity {

  outcome::result<std::vector<std::string>> KeystoreDirectory::list(
      const filesystem::path &path) {
    auto log = log::createLogger("Keystore", "identity");
    std::vector<std::string> names;

    std::error_code ec;
    filesystem::directory_iterator it{path, ec};
    if (ec) {
      SL_ERROR(log,
               "Failed to read keystore directory {}: {}",
               path.native(),
               ec.message());
      return IdentityError::KEYSTORE_UNREADABLE;
    }
    for (const filesystem::directory_iterator end; it != end;
         it.increment(ec)) {
      const auto &entry = *it;
      auto status = entry.symlink_status(ec);
      if (ec) {
        SL_WARN(log,
                "Can't stat {}: {}",
                entry.path().native(),
                ec.message());
        ec.clear();
        continue;
      }
      if (not filesystem::is_regular_file(status)) {
        continue;
      }
      names.emplace_back(entry.path().filename().string());
    }
    if (ec) {
      SL_ERROR(log,
               "Failed to list keystore directory {}: {}",
               path.native(),
               ec.message());
      return IdentityError::KEYSTORE_UNREADABLE;
    }
    SL_DEBUG(log, "Found {} files in {}", names.size(), path.native());
    return names;
  }

}  // namespace slotwatch::identity
