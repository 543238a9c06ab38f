/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <iostream>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

#include "application/app_configuration_error.hpp"

namespace {
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
}  // namespace

namespace slotwatch::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)),
        node_url_(kDefaultNodeEndpoint),
        epoch_size_(kDefaultEpochSize),
        watch_seconds_(kDefaultWatchSeconds),
        database_path_(kDefaultDatabasePath),
        store_enabled_(true),
        watch_mode_(false) {}

  AppConfigurationImpl::FilePtr AppConfigurationImpl::open_file(
      const std::string &filepath) {
    if (!filesystem::exists(filepath)) {
      SL_ERROR(logger_, "Configuration file {} does not exist", filepath);
      return {nullptr, &std::fclose};
    }
    return {std::fopen(filepath.c_str(), "r"), &std::fclose};
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

  bool AppConfigurationImpl::load_u32(const rapidjson::Value &val,
                                      const char *name,
                                      uint32_t &target) {
    if (auto m = val.FindMember(name);
        val.MemberEnd() != m && m->value.IsUint()) {
      target = m->value.GetUint();
      return true;
    }
    return false;
  }

  void AppConfigurationImpl::parse_general_segment(
      const rapidjson::Value &val) {
    std::string logger_tuning_config;
    if (load_str(val, "log", logger_tuning_config)) {
      logger_tuning_config_.emplace_back(std::move(logger_tuning_config));
    }
    load_bool(val, "watch", watch_mode_);
    load_u32(val, "watch-seconds", watch_seconds_);
  }

  void AppConfigurationImpl::parse_node_segment(const rapidjson::Value &val) {
    load_str(val, "ws", node_url_);
    std::string keystore_path;
    if (load_str(val, "keystore-path", keystore_path)) {
      keystore_path_ = keystore_path;
    }
  }

  void AppConfigurationImpl::parse_epoch_segment(const rapidjson::Value &val) {
    load_u32(val, "epoch-size", epoch_size_);
    uint32_t value = 0;
    if (load_u32(val, "epoch", value)) {
      epoch_ = value;
    }
    if (load_u32(val, "slots", value)) {
      slots_ = value;
    }
  }

  void AppConfigurationImpl::parse_storage_segment(
      const rapidjson::Value &val) {
    std::string database_path;
    if (load_str(val, "db", database_path)) {
      database_path_ = database_path;
    }
    bool no_store = false;
    if (load_bool(val, "no-store", no_store)) {
      store_enabled_ = not no_store;
    }
  }

  outcome::result<void> AppConfigurationImpl::read_config_from_file(
      const std::string &filepath) {
    auto file = open_file(filepath);
    if (!file) {
      SL_ERROR(logger_,
               "Configuration file path is invalid: {}, "
               "please specify a valid path with --config-file option",
               filepath);
      return AppConfigurationError::CONFIG_FILE_UNREADABLE;
    }

    using FileReadStream = rapidjson::FileReadStream;
    using Document = rapidjson::Document;

    std::array<char, 1024> buffer_size{};
    FileReadStream input_stream(
        file.get(), buffer_size.data(), buffer_size.size());

    Document document;
    document.ParseStream(input_stream);
    if (document.HasParseError() or not document.IsObject()) {
      SL_ERROR(logger_,
               "Configuration file {} parse failed with error {}",
               filepath,
               GetParseError_En(document.GetParseError()));
      return AppConfigurationError::CONFIG_FILE_MALFORMED;
    }

    for (auto &handler : handlers_) {
      auto it = document.FindMember(handler.segment_name);
      if (document.MemberEnd() != it and it->value.IsObject()) {
        handler.handler(it->value);
      }
    }
    return outcome::success();
  }

  outcome::result<void> AppConfigurationImpl::validate_config() const {
    if (node_endpoint_.error().has_value()
        or (node_endpoint_.Schema != "ws" and node_endpoint_.Schema != "wss")) {
      SL_ERROR(logger_, "Node endpoint '{}' is not valid", node_url_);
      return AppConfigurationError::INVALID_NODE_ENDPOINT;
    }
    if (keystore_path_.empty()) {
      return AppConfigurationError::MISSING_KEYSTORE_PATH;
    }
    if (epoch_size_ == 0) {
      return AppConfigurationError::ZERO_EPOCH_SIZE;
    }
    if (slots_.has_value() and slots_.value() == 0) {
      return AppConfigurationError::ZERO_SLOTS_TO_SCAN;
    }
    if (watch_seconds_ == 0) {
      return AppConfigurationError::ZERO_WATCH_INTERVAL;
    }
    if (store_enabled_ and database_path_.empty()) {
      return AppConfigurationError::EMPTY_DATABASE_PATH;
    }
    return outcome::success();
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    namespace po = boost::program_options;

    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<target>=<level>`, e.g. -lrpc=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all targets log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("logcfg", po::value<std::string>(), "Path to a YAML logging configuration")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ;

    po::options_description node_desc("Node options");
    node_desc.add_options()
        ("ws", po::value<std::string>()->default_value(kDefaultNodeEndpoint), "Websocket RPC endpoint of the observed node")
        ("keystore-path", po::value<std::string>(), "required, keystore directory of the observed node; the aura key is detected from it")
        ;

    po::options_description epoch_desc("Schedule options");
    epoch_desc.add_options()
        ("epoch-size", po::value<uint32_t>()->default_value(kDefaultEpochSize), "Number of slots in an epoch")
        ("epoch", po::value<uint32_t>(), "Observe this epoch instead of the current one")
        ("slots", po::value<uint32_t>(), "Number of slots to scan from the epoch start, whole epoch by default")
        ("watch", po::bool_switch(), "Keep polling the node instead of a single pass")
        ("watch-seconds", po::value<uint32_t>()->default_value(kDefaultWatchSeconds), "Longest pause between polls in watch mode <seconds>")
        ;

    po::options_description storage_desc("Storage options");
    storage_desc.add_options()
        ("db", po::value<std::string>()->default_value(kDefaultDatabasePath), "Schedule database directory")
        ("no-store", po::bool_switch(), "Do not write anything to the database")
        ;
    // clang-format on

    desc.add(node_desc).add(epoch_desc).add(storage_desc);

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

    if (auto it = vm.find("config-file"); it != vm.end()) {
      auto res = read_config_from_file(it->second.as<std::string>());
      if (res.has_error()) {
        SL_ERROR(logger_, "Can't apply configuration file: {}", res.error());
        return false;
      }
    }

    find_argument<std::string>(
        vm, "ws", [&](const std::string &val) { node_url_ = val; });
    find_argument<std::string>(vm, "keystore-path", [&](const std::string &val) {
      keystore_path_ = val;
    });
    find_argument<uint32_t>(
        vm, "epoch-size", [&](uint32_t val) { epoch_size_ = val; });
    find_argument<uint32_t>(vm, "epoch", [&](uint32_t val) { epoch_ = val; });
    find_argument<uint32_t>(vm, "slots", [&](uint32_t val) { slots_ = val; });
    find_argument<uint32_t>(
        vm, "watch-seconds", [&](uint32_t val) { watch_seconds_ = val; });
    find_argument<std::string>(vm, "db", [&](const std::string &val) {
      database_path_ = val;
    });
    if (vm["no-store"].as<bool>()) {
      store_enabled_ = false;
    }
    if (vm["watch"].as<bool>()) {
      watch_mode_ = true;
    }
    find_argument<std::vector<std::string>>(
        vm, "log", [&](const std::vector<std::string> &val) {
          logger_tuning_config_.insert(
              logger_tuning_config_.end(), val.begin(), val.end());
        });

    node_endpoint_ = common::Uri::parse(node_url_);

    if (auto res = validate_config(); res.has_error()) {
      SL_ERROR(logger_, "Configuration is not valid: {}", res.error());
      return false;
    }
    return true;
  }

}  // namespace slotwatch::application
