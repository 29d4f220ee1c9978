/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

namespace conductor::common {

  // explicit instantiations for the most frequently used blobs
  template class Blob<10ul>;
  template class Blob<20ul>;
  template class Blob<32ul>;

}  // namespace conductor::common
