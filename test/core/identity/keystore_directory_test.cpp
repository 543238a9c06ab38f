/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identity/keystore_directory.hpp"

#include <algorithm>
#include <fstream>

#include <gtest/gtest.h>

#include "identity/identity_error.hpp"
#include "identity/identity_resolver.hpp"
#include "testutil/outcome.hpp"
#include "testutil/storage/base_fs_test.hpp"

using slotwatch::identity::IdentityError;
using slotwatch::identity::IdentityResolver;
using slotwatch::identity::KeystoreDirectory;

class KeystoreDirectoryTest : public test::BaseFS_Test {
 public:
  KeystoreDirectoryTest()
      : BaseFS_Test(fs::temp_directory_path() / "slotwatch_keystore_test") {}

  void touch(const std::string &name) {
    std::ofstream file{base_path / name};
    file << "\"//Alice\"";
  }
};

/**
 * @given keystore directory with key files and a subdirectory
 * @when it is listed
 * @then names of regular files only are returned
 */
TEST_F(KeystoreDirectoryTest, ListsFiles) {
  touch("61757261d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d");
  touch("6772616e88dc3417d5058ec4b4503e0c12ea1a0a89be200fe98922423d4334014fa6b0ee");
  fs::create_directory(base_path / "61757261subdir");

  EXPECT_OUTCOME_TRUE(names, KeystoreDirectory::list(base_path));
  std::sort(names.begin(), names.end());
  ASSERT_EQ(names.size(), 2);
  EXPECT_EQ(names[0].substr(0, 8), "61757261");
  EXPECT_EQ(names[1].substr(0, 8), "6772616e");

  EXPECT_OUTCOME_TRUE(key, IdentityResolver::resolve(names));
  EXPECT_EQ(key.toHex(),
            "d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d");
}

/**
 * @given path that does not exist
 * @when it is listed
 * @then KEYSTORE_UNREADABLE is returned
 */
TEST_F(KeystoreDirectoryTest, MissingDirectory) {
  EXPECT_EC(KeystoreDirectory::list(base_path / "absent"),
            IdentityError::KEYSTORE_UNREADABLE);
}

/**
 * @given keystore with one key file and a symbolic link to another key file
 * @when it is listed
 * @then the link is skipped
 */
TEST_F(KeystoreDirectoryTest, SymlinksAreSkipped) {
  const std::string key_file =
      "61757261d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d";
  touch(key_file);
  fs::create_directory(base_path / "elsewhere");
  {
    std::ofstream target{base_path / "elsewhere" / "target"};
    target << "\"//Bob\"";
  }
  fs::create_symlink(
      base_path / "elsewhere" / "target",
      base_path
          / "617572618eaf04151687736326c9fea17e25fc5287613693c912909cb226aa4794f26a48");

  EXPECT_OUTCOME_TRUE(names, KeystoreDirectory::list(base_path));
  EXPECT_EQ(names, std::vector<std::string>{key_file});
}
