/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(slotwatch::common, BlobError, e) {
  using slotwatch::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input string has incorrect length, not matching the blob size";
  }
  return "Unknown BlobError";
}

namespace slotwatch::common {

  template class Blob<4ul>;
  template class Blob<32ul>;

}  // namespace slotwatch::common
