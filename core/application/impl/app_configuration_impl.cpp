/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>
#include <limits>
#include <string>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

namespace {
  // default values
  const auto def_storage_backend = "memory";
  const auto def_commit_level = "SoftAndFirm";
  const auto def_empty_block_policy = "execute";
  const uint64_t def_sequencer_block_time = 2000;
  const uint64_t def_celestia_block_time = 6000;
  const uint64_t def_max_soft_firm_spread = 0;
  const uint64_t def_max_concurrent_fetches = 20;
  const uint64_t def_channel_capacity = 64;
  const uint64_t def_retry_initial_delay = 100;
  const uint64_t def_retry_max_delay = 20000;
  const uint64_t def_firm_failure_alert_threshold = 10;
  const uint64_t def_syncing_lag_threshold = 16;
  const uint64_t def_session_poll_interval = 5000;
  const uint64_t def_status_log_interval = 30000;

  template <typename T, typename Func>
  void find_argument(boost::program_options::variables_map &vm,
                     const char *name,
                     Func &&f) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (it->second.defaulted()) {
        return;
      }
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  template <typename T>
  std::optional<T> find_argument(boost::program_options::variables_map &vm,
                                 const std::string &name) {
    if (auto it = vm.find(name); it != vm.end()) {
      if (!it->second.defaulted()) {
        return it->second.as<T>();
      }
    }
    return std::nullopt;
  }
}  // namespace

namespace conductor::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : basePath_{},
        storageBackend_{StorageBackend::RocksDb},
        commitLevel_{reconciliation::CommitLevel::SoftAndFirm},
        maxSoftFirmSpread_{def_max_soft_firm_spread},
        maxConcurrentFetches_{def_max_concurrent_fetches},
        channelCapacity_{def_channel_capacity},
        retryPolicy_{},
        firmFailureAlertThreshold_{def_firm_failure_alert_threshold},
        syncingLagThreshold_{def_syncing_lag_threshold},
        emptyBlockPolicy_{reconciliation::EmptyBlockPolicy::Execute},
        optimisticEnabled_{false},
        logTuning_{},
        devnet_{
            .rollup_name = "astria",
            .sequencer_chain_id = "sequencer-devnet",
            .celestia_chain_id = "celestia-devnet",
        },
        logger_{std::move(logger)},
        sequencer_block_time_{def_sequencer_block_time},
        celestia_block_time_{def_celestia_block_time},
        session_poll_interval_{def_session_poll_interval},
        status_log_interval_{def_status_log_interval},
        commit_level_str_{def_commit_level},
        empty_block_policy_str_{def_empty_block_policy},
        storage_backend_str_{def_storage_backend} {
    SegmentHandler::Handler general = [this](const rapidjson::Value &val) {
      parse_general_segment(val);
    };
    SegmentHandler::Handler storage = [this](const rapidjson::Value &val) {
      parse_storage_segment(val);
    };
    SegmentHandler::Handler conductor = [this](const rapidjson::Value &val) {
      parse_conductor_segment(val);
    };
    SegmentHandler::Handler devnet = [this](const rapidjson::Value &val) {
      parse_devnet_segment(val);
    };
    handlers_ = {
        SegmentHandler{"general", std::move(general)},
        SegmentHandler{"storage", std::move(storage)},
        SegmentHandler{"conductor", std::move(conductor)},
        SegmentHandler{"devnet", std::move(devnet)},
    };
  }

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    return AppConfigurationImpl::FilePtr(std::fopen(filepath.c_str(), "r"),
                                         &std::fclose);
  }

  bool AppConfigurationImpl::load_str(const rapidjson::Value &val,
                                      const char *name,
                                      std::string &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsString()) {
      target.assign(m->value.GetString(), m->value.GetStringLength());
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_bool(const rapidjson::Value &val,
                                       const char *name,
                                       bool &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() != m && m->value.IsBool()) {
      target = m->value.GetBool();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_u64(const rapidjson::Value &val,
                                      const char *name,
                                      uint64_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint64()) {
      target = m->value.GetUint64();
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_ms(const rapidjson::Value &val,
                                     const char *name,
                                     std::chrono::milliseconds &target) {
    uint64_t ms = 0;
    if (load_u64(val, name, ms)) {
      target = std::chrono::milliseconds(ms);
      return true;
    }
    return false;
  }

  bool AppConfigurationImpl::load_vs(const rapidjson::Value &val,
                                     const char *name,
                                     std::vector<std::string> &target) {
    auto m = val.FindMember(name);
    if (val.MemberEnd() == m or not m->value.IsArray()) {
      return false;
    }
    for (auto &v : m->value.GetArray()) {
      if (v.IsString()) {
        target.emplace_back(v.GetString(), v.GetStringLength());
      }
    }
    return not target.empty();
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    load_vs(val, "log", logTuning_);
  }

  void AppConfigurationImpl::parse_storage_segment(
      const rapidjson::Value &val) {
    std::string base_path_str;
    if (load_str(val, "base-path", base_path_str)) {
      basePath_ = base_path_str;
    }
    load_str(val, "database", storage_backend_str_);
  }

  void AppConfigurationImpl::parse_conductor_segment(
      const rapidjson::Value &val) {
    load_str(val, "commit-level", commit_level_str_);
    load_str(val, "empty-block-policy", empty_block_policy_str_);
    load_ms(val, "sequencer-block-time", sequencer_block_time_);
    load_ms(val, "celestia-block-time", celestia_block_time_);
    load_u64(val, "max-soft-firm-spread", maxSoftFirmSpread_);
    uint64_t u = 0;
    if (load_u64(val, "max-concurrent-fetches", u)) {
      maxConcurrentFetches_ = u;
    }
    if (load_u64(val, "channel-capacity", u)) {
      channelCapacity_ = u;
    }
    load_ms(val, "retry-initial-delay", retryPolicy_.initial_delay);
    load_ms(val, "retry-max-delay", retryPolicy_.max_delay);
    if (load_u64(val, "retry-max-attempts", u)) {
      retryPolicy_.max_attempts = u;
    }
    if (load_u64(val, "firm-failure-alert-threshold", u)) {
      firmFailureAlertThreshold_ = u;
    }
    load_u64(val, "syncing-lag-threshold", syncingLagThreshold_);
    load_bool(val, "optimistic", optimisticEnabled_);
    load_ms(val, "session-poll-interval", session_poll_interval_);
    load_ms(val, "status-log-interval", status_log_interval_);
  }

  void AppConfigurationImpl::parse_devnet_segment(const rapidjson::Value &val) {
    load_str(val, "rollup-name", devnet_.rollup_name);
    load_str(val, "sequencer-chain-id", devnet_.sequencer_chain_id);
    load_str(val, "celestia-chain-id", devnet_.celestia_chain_id);
    load_u64(val, "rollup-start", devnet_.rollup_start_block_number);
    load_u64(val, "rollup-end", devnet_.rollup_end_block_number);
    load_u64(val, "sequencer-start", devnet_.sequencer_start_block_height);
    load_u64(val, "celestia-start", devnet_.celestia_start_height);
    load_u64(
        val, "look-ahead", devnet_.celestia_search_height_max_look_ahead);
    load_ms(val, "block-time", devnet_.block_time);
    load_bool(val, "rollback", devnet_.rollback_supported);
  }

  bool AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with -c option",
               filepath);
      return false;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return false;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it) {
        handler.handler(it->value);
      }
    }
    return true;
  }

  bool AppConfigurationImpl::parse_commit_level(std::string_view str) {
    using reconciliation::CommitLevel;
    if (str == "SoftOnly") {
      commitLevel_ = CommitLevel::SoftOnly;
    } else if (str == "FirmOnly") {
      commitLevel_ = CommitLevel::FirmOnly;
    } else if (str == "SoftAndFirm") {
      commitLevel_ = CommitLevel::SoftAndFirm;
    } else {
      SL_ERROR(logger_,
               "Invalid commit level '{}', expected SoftOnly, FirmOnly or "
               "SoftAndFirm",
               str);
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::parse_empty_block_policy(std::string_view str) {
    using reconciliation::EmptyBlockPolicy;
    if (str == "execute") {
      emptyBlockPolicy_ = EmptyBlockPolicy::Execute;
    } else if (str == "skip") {
      emptyBlockPolicy_ = EmptyBlockPolicy::Skip;
    } else {
      SL_ERROR(logger_,
               "Invalid empty block policy '{}', expected execute or skip",
               str);
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::parse_storage_backend(std::string_view str) {
    if (str == "rocksdb") {
      storageBackend_ = StorageBackend::RocksDb;
    } else if (str == "memory") {
      storageBackend_ = StorageBackend::InMemory;
    } else {
      SL_ERROR(
          logger_, "Invalid database '{}', expected rocksdb or memory", str);
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::validate_config() {
    if (not parse_commit_level(commit_level_str_)
        or not parse_empty_block_policy(empty_block_policy_str_)
        or not parse_storage_backend(storage_backend_str_)) {
      return false;
    }

    if (storageBackend_ == StorageBackend::RocksDb and basePath_.empty()) {
      SL_ERROR(logger_,
               "Base path is not provided, use --base-path or "
               "--database memory");
      return false;
    }

    if (emptyBlockPolicy_ == reconciliation::EmptyBlockPolicy::Skip
        and commitLevel_ != reconciliation::CommitLevel::FirmOnly) {
      SL_ERROR(logger_,
               "Empty block policy 'skip' requires commit level FirmOnly");
      return false;
    }

    if (channelCapacity_ == 0) {
      SL_ERROR(logger_, "Channel capacity must be positive");
      return false;
    }

    if (maxConcurrentFetches_ == 0) {
      SL_ERROR(logger_, "Max concurrent fetches must be positive");
      return false;
    }

    if (retryPolicy_.initial_delay.count() == 0
        or retryPolicy_.initial_delay > retryPolicy_.max_delay) {
      SL_ERROR(logger_,
               "Retry initial delay must be positive and not above the max "
               "delay, got {} and {} ms",
               retryPolicy_.initial_delay.count(),
               retryPolicy_.max_delay.count());
      return false;
    }

    if (retryPolicy_.max_attempts == 0) {
      SL_ERROR(logger_, "Retry max attempts must be positive");
      return false;
    }

    if (devnet_.rollup_name.empty()) {
      SL_ERROR(logger_, "Rollup name must not be empty");
      return false;
    }

    if (devnet_.rollup_end_block_number != 0
        and devnet_.rollup_end_block_number
                < devnet_.rollup_start_block_number) {
      SL_ERROR(logger_,
               "Rollup end block {} is before the start block {}",
               devnet_.rollup_end_block_number,
               devnet_.rollup_start_block_number);
      return false;
    }

    if (devnet_.sequencer_start_block_height == 0) {
      SL_ERROR(logger_, "Sequencer start height must be positive");
      return false;
    }

    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lreconciliation=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "soralog YAML configuration file")
        ("config,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description storage_desc("Storage options");
    storage_desc.add_options()
        ("base-path,d", po::value<std::string>(), "directory of the database keeping the commitment state")
        ("database", po::value<std::string>()->default_value(def_storage_backend), "Database backend to use [rocksdb, memory]")
        ;

    po::options_description conductor_desc("Conductor options");
    conductor_desc.add_options()
        ("commit-level", po::value<std::string>()->default_value(def_commit_level),
          "sources driving the commitments: SoftOnly, FirmOnly or SoftAndFirm")
        ("sequencer-block-time", po::value<uint64_t>()->default_value(def_sequencer_block_time), "sequencer polling period <ms>")
        ("celestia-block-time", po::value<uint64_t>()->default_value(def_celestia_block_time), "DA polling period <ms>")
        ("max-soft-firm-spread", po::value<uint64_t>()->default_value(def_max_soft_firm_spread),
          "soft fetching pauses at this many blocks above firm, 0 disables")
        ("max-concurrent-fetches", po::value<uint64_t>()->default_value(def_max_concurrent_fetches), "sequencer blocks fetched in parallel")
        ("channel-capacity", po::value<uint64_t>()->default_value(def_channel_capacity), "candidates buffered per source")
        ("retry-initial-delay", po::value<uint64_t>()->default_value(def_retry_initial_delay), "first retry delay <ms>")
        ("retry-max-delay", po::value<uint64_t>()->default_value(def_retry_max_delay), "retry delay cap <ms>")
        ("retry-max-attempts", po::value<uint64_t>(), "attempts before a call fails, unlimited by default")
        ("firm-failure-alert-threshold", po::value<uint64_t>()->default_value(def_firm_failure_alert_threshold),
          "consecutive firm verification failures reported as critical")
        ("syncing-lag-threshold", po::value<uint64_t>()->default_value(def_syncing_lag_threshold),
          "firm lag below which syncing switches to following")
        ("empty-block-policy", po::value<std::string>()->default_value(def_empty_block_policy),
          "execute or skip firm blocks without rollup transactions, skip needs FirmOnly")
        ("optimistic", po::bool_switch(), "expose soft blocks to the optimistic sink")
        ("no-optimistic", po::bool_switch(), "do not expose soft blocks to the optimistic sink (default)")
        ("session-poll-interval", po::value<uint64_t>()->default_value(def_session_poll_interval),
          "period of asking for a new execution session <ms>")
        ("status-log-interval", po::value<uint64_t>()->default_value(def_status_log_interval),
          "period of logging the engine status <ms>, 0 disables")
        ;

    po::options_description devnet_desc("Devnet options");
    devnet_desc.add_options()
        ("rollup-name", po::value<std::string>(), "rollup id is the SHA-256 of this name")
        ("sequencer-chain-id", po::value<std::string>(), "chain id of the sequencing network")
        ("celestia-chain-id", po::value<std::string>(), "chain id of the DA network")
        ("rollup-start", po::value<uint64_t>(), "first rollup block of the session")
        ("rollup-end", po::value<uint64_t>(), "last rollup block of the session, 0 for unbounded")
        ("sequencer-start", po::value<uint64_t>(), "sequencer height of the first rollup block")
        ("celestia-start", po::value<uint64_t>(), "DA height the firm search starts from")
        ("look-ahead", po::value<uint64_t>(), "DA heights searched per sequencer height")
        ("devnet-block-time", po::value<uint64_t>(), "sequencer block production period <ms>")
        ("no-rollback", po::bool_switch(), "execution engine refuses to roll back")
        ;
    // clang-format on

    desc.add(storage_desc).add(conductor_desc).add(devnet_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    // file values first, the command line overrides them
    if (auto path = find_argument<std::string>(vm, "config")) {
      if (not read_config_from_file(*path)) {
        return false;
      }
    }

    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logTuning_.insert(logTuning_.end(), val.begin(), val.end());
        });

    find_argument<std::string>(
        vm, "base-path", [&](const std::string &val) { basePath_ = val; });
    find_argument<std::string>(vm, "database", [&](const std::string &val) {
      storage_backend_str_ = val;
    });

    find_argument<std::string>(vm, "commit-level", [&](const std::string &val) {
      commit_level_str_ = val;
    });
    find_argument<std::string>(
        vm, "empty-block-policy", [&](const std::string &val) {
          empty_block_policy_str_ = val;
        });
    find_argument<uint64_t>(vm, "sequencer-block-time", [&](uint64_t val) {
      sequencer_block_time_ = std::chrono::milliseconds(val);
    });
    find_argument<uint64_t>(vm, "celestia-block-time", [&](uint64_t val) {
      celestia_block_time_ = std::chrono::milliseconds(val);
    });
    find_argument<uint64_t>(vm, "max-soft-firm-spread", [&](uint64_t val) {
      maxSoftFirmSpread_ = val;
    });
    find_argument<uint64_t>(vm, "max-concurrent-fetches", [&](uint64_t val) {
      maxConcurrentFetches_ = val;
    });
    find_argument<uint64_t>(
        vm, "channel-capacity", [&](uint64_t val) { channelCapacity_ = val; });
    find_argument<uint64_t>(vm, "retry-initial-delay", [&](uint64_t val) {
      retryPolicy_.initial_delay = std::chrono::milliseconds(val);
    });
    find_argument<uint64_t>(vm, "retry-max-delay", [&](uint64_t val) {
      retryPolicy_.max_delay = std::chrono::milliseconds(val);
    });
    find_argument<uint64_t>(vm, "retry-max-attempts", [&](uint64_t val) {
      retryPolicy_.max_attempts = val;
    });
    find_argument<uint64_t>(
        vm, "firm-failure-alert-threshold", [&](uint64_t val) {
          firmFailureAlertThreshold_ = val;
        });
    find_argument<uint64_t>(vm, "syncing-lag-threshold", [&](uint64_t val) {
      syncingLagThreshold_ = val;
    });
    find_argument<uint64_t>(vm, "session-poll-interval", [&](uint64_t val) {
      session_poll_interval_ = std::chrono::milliseconds(val);
    });
    find_argument<uint64_t>(vm, "status-log-interval", [&](uint64_t val) {
      status_log_interval_ = std::chrono::milliseconds(val);
    });

    const bool optimistic = vm["optimistic"].as<bool>();
    const bool no_optimistic = vm["no-optimistic"].as<bool>();
    if (optimistic and no_optimistic) {
      SL_ERROR(logger_, "--optimistic conflicts with --no-optimistic");
      return false;
    }
    if (optimistic) {
      optimisticEnabled_ = true;
    } else if (no_optimistic) {
      optimisticEnabled_ = false;
    }

    find_argument<std::string>(vm, "rollup-name", [&](const std::string &val) {
      devnet_.rollup_name = val;
    });
    find_argument<std::string>(
        vm, "sequencer-chain-id", [&](const std::string &val) {
          devnet_.sequencer_chain_id = val;
        });
    find_argument<std::string>(
        vm, "celestia-chain-id", [&](const std::string &val) {
          devnet_.celestia_chain_id = val;
        });
    find_argument<uint64_t>(vm, "rollup-start", [&](uint64_t val) {
      devnet_.rollup_start_block_number = val;
    });
    find_argument<uint64_t>(vm, "rollup-end", [&](uint64_t val) {
      devnet_.rollup_end_block_number = val;
    });
    find_argument<uint64_t>(vm, "sequencer-start", [&](uint64_t val) {
      devnet_.sequencer_start_block_height = val;
    });
    find_argument<uint64_t>(vm, "celestia-start", [&](uint64_t val) {
      devnet_.celestia_start_height = val;
    });
    find_argument<uint64_t>(vm, "look-ahead", [&](uint64_t val) {
      devnet_.celestia_search_height_max_look_ahead = val;
    });
    find_argument<uint64_t>(vm, "devnet-block-time", [&](uint64_t val) {
      devnet_.block_time = std::chrono::milliseconds(val);
    });
    if (vm["no-rollback"].as<bool>()) {
      devnet_.rollback_supported = false;
    }

    // if something wrong with config print help message
    if (not validate_config()) {
      std::cout << desc << std::endl;
      return false;
    }
    return true;
  }

}  // namespace conductor::application
