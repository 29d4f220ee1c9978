/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/conductor_application.hpp"

#include <atomic>
#include <cstdlib>
#include <memory>
#include <thread>

#include "application/app_configuration.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace conductor {
  class Cancellation;
}

namespace conductor::devnet {
  class Devnet;
}

namespace conductor::reconciliation {
  class ReconciliationEngine;
}

namespace conductor::storage {
  class SpacedStorage;
}

namespace conductor::application {
  class AppStateManagerImpl;

  /**
   * Builds the node from its configuration: storage, the in-process
   * sequencer, DA and execution networks, both candidate sources and the
   * reconciliation engine. The engine runs on its own thread while the
   * calling thread waits for shutdown.
   */
  class ConductorApplicationImpl final : public ConductorApplication {
    template <class T>
    using sptr = std::shared_ptr<T>;

   public:
    explicit ConductorApplicationImpl(sptr<AppConfiguration> app_config);

    ~ConductorApplicationImpl() override;

    int run() override;

    /// Builds every component; false if the node cannot start
    bool inject();

    bool start();

    void stop();

   private:
    outcome::result<sptr<storage::SpacedStorage>> makeStorage() const;

    void engineLoop();

    void statusLoop();

    void logStatus() const;

    sptr<AppConfiguration> app_config_;
    log::Logger logger_;

    sptr<AppStateManagerImpl> app_state_manager_;
    sptr<Cancellation> cancellation_;
    sptr<devnet::Devnet> devnet_;
    sptr<reconciliation::ReconciliationEngine> engine_;

    std::thread engine_thread_;
    std::thread status_thread_;
    std::atomic_int exit_code_ = EXIT_SUCCESS;
    std::atomic_bool stopped_ = false;
  };

}  // namespace conductor::application
