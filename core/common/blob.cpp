/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(tribune::common, BlobError, e) {
  using tribune::common::BlobError;
  switch (e) {
    case BlobError::INCORRECT_LENGTH:
      return "Input length does not match the blob size";
  }
  return "Unknown error";
}
