/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_state_manager_impl.hpp"

#include <csignal>
#include <cstring>

#include <fmt/format.h>

namespace conductor::application {

  std::atomic_bool AppStateManagerImpl::signals_enabled{false};

  std::weak_ptr<AppStateManagerImpl> AppStateManagerImpl::wp_to_myself;

  void AppStateManagerImpl::signalsEnable() {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = shuttingDownSignalsHandler;
    sigemptyset(&act.sa_mask);
    sigaddset(&act.sa_mask, SIGINT);
    sigaddset(&act.sa_mask, SIGTERM);
    sigaddset(&act.sa_mask, SIGQUIT);
    sigprocmask(SIG_BLOCK, &act.sa_mask, nullptr);
    sigaction(SIGINT, &act, nullptr);
    sigaction(SIGTERM, &act, nullptr);
    sigaction(SIGQUIT, &act, nullptr);
    signals_enabled.store(true);
    sigprocmask(SIG_UNBLOCK, &act.sa_mask, nullptr);
  }

  void AppStateManagerImpl::signalsDisable() {
    auto expected = true;
    if (not signals_enabled.compare_exchange_strong(expected, false)) {
      return;
    }
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-member-init,hicpp-member-init)
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = SIG_DFL;
    sigaction(SIGINT, &act, nullptr);
    sigaction(SIGTERM, &act, nullptr);
    sigaction(SIGQUIT, &act, nullptr);
  }

  void AppStateManagerImpl::shuttingDownSignalsHandler(int signal) {
    signalsDisable();
    if (auto self = wp_to_myself.lock()) {
      SL_INFO(self->logger_, "Signal {} received, shutting down", signal);
      self->shutdown();
    }
  }

  AppStateManagerImpl::AppStateManagerImpl()
      : logger_(log::createLogger("AppStateManager", "application")) {
    signalsEnable();
    SL_TRACE(logger_, "Signal handler set up");
  }

  AppStateManagerImpl::~AppStateManagerImpl() {
    signalsDisable();
    wp_to_myself.reset();
  }

  void AppStateManagerImpl::atInject(OnInject &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Injecting) {
      throw AppStateException("adding callback for stage 'inject'");
    }
    inject_.emplace(std::move(cb));
  }

  void AppStateManagerImpl::atPrepare(OnPrepare &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Prepare) {
      throw AppStateException("adding callback for stage 'prepare'");
    }
    prepare_.emplace(std::move(cb));
  }

  void AppStateManagerImpl::atLaunch(OnLaunch &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::Starting) {
      throw AppStateException("adding callback for stage 'launch'");
    }
    launch_.emplace(std::move(cb));
  }

  void AppStateManagerImpl::atShutdown(OnShutdown &&cb) {
    std::lock_guard lg(mutex_);
    if (state_ > State::ShuttingDown) {
      throw AppStateException("adding callback for stage 'shutdown'");
    }
    shutdown_.emplace(std::move(cb));
  }

  template <typename Queue>
  void AppStateManagerImpl::runStage(Queue &queue,
                                     State expected,
                                     State running,
                                     State done,
                                     const char *name) {
    std::lock_guard lg(mutex_);

    auto state = expected;
    if (not state_.compare_exchange_strong(state, running)) {
      if (state != State::ShuttingDown) {
        throw AppStateException(fmt::format("running stage '{}'", name));
      }
    }

    if (not queue.empty()) {
      SL_TRACE(logger_, "Running stage '{}'…", name);
    }

    while (not queue.empty()) {
      auto &cb = queue.front();
      if (state_.load() == running) {
        if (not cb()) {
          SL_ERROR(logger_, "Stage '{}' is failed", name);
          state = running;
          state_.compare_exchange_strong(state, State::ShuttingDown);
        }
      }
      queue.pop();
    }

    state = running;
    state_.compare_exchange_strong(state, done);
  }

  void AppStateManagerImpl::doInject() {
    runStage(inject_, State::Init, State::Injecting, State::Injected, "inject");
  }

  void AppStateManagerImpl::doPrepare() {
    runStage(prepare_,
             State::Injected,
             State::Prepare,
             State::ReadyToStart,
             "prepare");
  }

  void AppStateManagerImpl::doLaunch() {
    runStage(launch_,
             State::ReadyToStart,
             State::Starting,
             State::Works,
             "launch");
  }

  void AppStateManagerImpl::doShutdown() {
    std::lock_guard lg(mutex_);

    auto state = State::Works;
    if (not state_.compare_exchange_strong(state, State::ShuttingDown)) {
      if (state != State::ShuttingDown) {
        throw AppStateException("running stage 'shutting down'");
      }
    }

    decltype(inject_){}.swap(inject_);
    decltype(prepare_){}.swap(prepare_);
    decltype(launch_){}.swap(launch_);

    while (not shutdown_.empty()) {
      shutdown_.front()();
      shutdown_.pop();
    }

    state = State::ShuttingDown;
    state_.compare_exchange_strong(state, State::ReadyToStop);
  }

  void AppStateManagerImpl::run() {
    wp_to_myself = weak_from_this();
    if (wp_to_myself.expired()) {
      throw std::logic_error(
          "AppStateManager must be instantiated on shared pointer before run");
    }

    doInject();
    doPrepare();
    doLaunch();

    if (state_.load() == State::Works) {
      SL_TRACE(logger_, "All components started; waiting shutdown request…");
      shutdownRequestWaiting();
    }

    SL_TRACE(logger_, "Start doing shutdown…");
    doShutdown();
    SL_TRACE(logger_, "Shutdown is done");

    if (state_.load() != State::ReadyToStop) {
      throw std::logic_error(
          "AppStateManager is expected in stage 'ready to stop'");
    }
  }

  void AppStateManagerImpl::shutdownRequestWaiting() {
    std::unique_lock lock(cv_mutex_);
    cv_.wait(lock, [&] { return state_ == State::ShuttingDown; });
  }

  void AppStateManagerImpl::shutdown() {
    signalsDisable();
    auto state = state_.load();
    if (state == State::ReadyToStop or state == State::ShuttingDown) {
      SL_TRACE(logger_, "Shutdown requested, already in progress");
      return;
    }

    SL_TRACE(logger_, "Shutting down requested…");
    std::lock_guard lg(cv_mutex_);
    state_.store(State::ShuttingDown);
    cv_.notify_one();
  }

}  // namespace conductor::application
