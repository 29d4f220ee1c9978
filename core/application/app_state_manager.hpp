/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <stdexcept>

namespace conductor::application {

  // an object takes part in a stage by having the method of that stage; a
  // method with a wrong return type is a compile error, not a skipped stage
  template <typename T>
  concept AppStateInjectable = requires(T &t) { t.inject(); };
  template <typename T>
  concept AppStatePreparable = requires(T &t) { t.prepare(); };
  template <typename T>
  concept AppStateStartable = requires(T &t) { t.start(); };
  template <typename T>
  concept AppStateStoppable = requires(T &t) { t.stop(); };

  // registering an object without any stage method is a mistake
  template <typename T>
  concept AppStateControllable = AppStatePreparable<T> || AppStateInjectable<T>
                              || AppStateStoppable<T> || AppStateStartable<T>;

  class AppStateManager {
   public:
    using OnInject = std::function<bool()>;
    using OnPrepare = std::function<bool()>;
    using OnLaunch = std::function<bool()>;
    using OnShutdown = std::function<void()>;

    enum class State {
      Init,
      Injecting,
      Injected,
      Prepare,
      ReadyToStart,
      Starting,
      Works,
      ShuttingDown,
      ReadyToStop,
    };

    virtual ~AppStateManager() = default;

    /// Execute \param cb at stage 'injections' of application
    virtual void atInject(OnInject &&cb) = 0;

    /// Execute \param cb at stage 'preparations' of application
    virtual void atPrepare(OnPrepare &&cb) = 0;

    /// Execute \param cb immediately before start application
    virtual void atLaunch(OnLaunch &&cb) = 0;

    /// Execute \param cb at stage of shutting down application
    virtual void atShutdown(OnShutdown &&cb) = 0;

   public:
    /// Registers the stage methods \param entity has
    template <AppStateControllable Controlled>
    void takeControl(Controlled &entity) {
      if constexpr (AppStateInjectable<Controlled>) {
        atInject([&entity]() -> bool { return entity.inject(); });
      }
      if constexpr (AppStatePreparable<Controlled>) {
        atPrepare([&entity]() -> bool { return entity.prepare(); });
      }
      if constexpr (AppStateStartable<Controlled>) {
        atLaunch([&entity]() -> bool { return entity.start(); });
      }
      if constexpr (AppStateStoppable<Controlled>) {
        atShutdown([&entity]() -> void { return entity.stop(); });
      }
    }

    /// Start application life cycle
    virtual void run() = 0;

    /// Initiate shutting down (at any time)
    virtual void shutdown() = 0;

    /// Get current stage
    virtual State state() const = 0;

   protected:
    virtual void doInject() = 0;
    virtual void doPrepare() = 0;
    virtual void doLaunch() = 0;
    virtual void doShutdown() = 0;
  };

  struct AppStateException : public std::runtime_error {
    explicit AppStateException(std::string message)
        : std::runtime_error("Wrong workflow at " + std::move(message)) {}
  };
}  // namespace conductor::application
