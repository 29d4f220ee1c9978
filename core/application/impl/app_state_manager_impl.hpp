/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_state_manager.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>

#include "log/logger.hpp"

namespace conductor::application {

  /**
   * Runs registered callbacks stage by stage and parks the calling thread
   * until shutdown is requested by a signal or by shutdown().
   */
  class AppStateManagerImpl
      : public AppStateManager,
        public std::enable_shared_from_this<AppStateManagerImpl> {
   public:
    AppStateManagerImpl();
    AppStateManagerImpl(const AppStateManagerImpl &) = delete;
    AppStateManagerImpl(AppStateManagerImpl &&) = delete;

    ~AppStateManagerImpl() override;

    AppStateManagerImpl &operator=(const AppStateManagerImpl &) = delete;
    AppStateManagerImpl &operator=(AppStateManagerImpl &&) = delete;

    void atInject(OnInject &&cb) override;
    void atPrepare(OnPrepare &&cb) override;
    void atLaunch(OnLaunch &&cb) override;
    void atShutdown(OnShutdown &&cb) override;

    void run() override;
    void shutdown() override;

    State state() const override {
      return state_;
    }

   protected:
    void doInject() override;
    void doPrepare() override;
    void doLaunch() override;
    void doShutdown() override;

   private:
    static std::weak_ptr<AppStateManagerImpl> wp_to_myself;

    static std::atomic_bool signals_enabled;
    static void signalsEnable();
    static void signalsDisable();
    static void shuttingDownSignalsHandler(int);

    /// Runs `stage` callbacks while the state stays `running`
    template <typename Queue>
    void runStage(Queue &queue,
                  State expected,
                  State running,
                  State done,
                  const char *name);

    void shutdownRequestWaiting();

    log::Logger logger_;

    std::atomic<State> state_ = State::Init;

    std::recursive_mutex mutex_;

    std::mutex cv_mutex_;
    std::condition_variable cv_;

    std::queue<OnInject> inject_;
    std::queue<OnPrepare> prepare_;
    std::queue<OnLaunch> launch_;
    std::queue<OnShutdown> shutdown_;
  };

}  // namespace conductor::application
