/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace conductor::application {

  /**
   * @class ConductorApplication conductor node interface
   */
  class ConductorApplication {
   public:
    virtual ~ConductorApplication() = default;

    /**
     * Runs the node until a shutdown signal or a halt.
     * @return process exit code
     */
    virtual int run() = 0;
  };

}  // namespace conductor::application
