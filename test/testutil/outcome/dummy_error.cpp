/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "testutil/outcome/dummy_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(testutil, DummyError, e) {
  switch (e) {
    case testutil::DummyError::ERROR:
      return "collaborator failed";
    case testutil::DummyError::ERROR_2:
      return "collaborator failed differently";
  }
  return "unknown error (testutil::DummyError)";
}
