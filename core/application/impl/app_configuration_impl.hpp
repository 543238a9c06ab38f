/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <cstdio>
#include <functional>
#include <memory>

#include <rapidjson/document.h>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace slotwatch::application {

  class AppConfigurationImpl final : public AppConfiguration {
   public:
    static constexpr auto kDefaultNodeEndpoint = "ws://127.0.0.1:9944";
    static constexpr uint32_t kDefaultEpochSize = 1200;
    static constexpr uint32_t kDefaultWatchSeconds = 30;
    static constexpr auto kDefaultDatabasePath = "aura_schedule.db";

    explicit AppConfigurationImpl(log::Logger logger);
    ~AppConfigurationImpl() override = default;

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    AppConfigurationImpl(AppConfigurationImpl &&) = delete;
    AppConfigurationImpl &operator=(AppConfigurationImpl &&) = delete;

    /**
     * Parses command line, config file given by --config-file and checks
     * the result. Command line values override values from the file.
     * @return false if the application must not start; the reason is logged
     */
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    const common::Uri &nodeEndpoint() const override {
      return node_endpoint_;
    }
    const filesystem::path &keystorePath() const override {
      return keystore_path_;
    }
    uint32_t epochSize() const override {
      return epoch_size_;
    }
    std::optional<uint32_t> epoch() const override {
      return epoch_;
    }
    std::optional<uint32_t> slotsToScan() const override {
      return slots_;
    }
    std::chrono::seconds watchInterval() const override {
      return std::chrono::seconds{watch_seconds_};
    }
    const filesystem::path &databasePath() const override {
      return database_path_;
    }
    bool storeEnabled() const override {
      return store_enabled_;
    }
    bool watchMode() const override {
      return watch_mode_;
    }
    const std::vector<std::string> &log() const override {
      return logger_tuning_config_;
    }

   private:
    void parse_general_segment(const rapidjson::Value &val);
    void parse_node_segment(const rapidjson::Value &val);
    void parse_epoch_segment(const rapidjson::Value &val);
    void parse_storage_segment(const rapidjson::Value &val);

    /// Checks that the parsed values are usable
    outcome::result<void> validate_config() const;

    outcome::result<void> read_config_from_file(const std::string &filepath);

    bool load_str(const rapidjson::Value &val,
                  const char *name,
                  std::string &target);
    bool load_bool(const rapidjson::Value &val, const char *name, bool &target);
    bool load_u32(const rapidjson::Value &val,
                  const char *name,
                  uint32_t &target);

    using FilePtr = std::unique_ptr<std::FILE, decltype(&std::fclose)>;

    FilePtr open_file(const std::string &filepath);

    struct SegmentHandler {
      using Handler = std::function<void(const rapidjson::Value &)>;
      const char *segment_name;
      Handler handler;
    };

    // clang-format off
    std::vector<SegmentHandler> handlers_ = {
        SegmentHandler{"general", [this](const rapidjson::Value &val) { parse_general_segment(val); }},
        SegmentHandler{"node",    [this](const rapidjson::Value &val) { parse_node_segment(val); }},
        SegmentHandler{"epoch",   [this](const rapidjson::Value &val) { parse_epoch_segment(val); }},
        SegmentHandler{"storage", [this](const rapidjson::Value &val) { parse_storage_segment(val); }},
    };
    // clang-format on

    log::Logger logger_;

    std::string node_url_;
    common::Uri node_endpoint_;
    filesystem::path keystore_path_;
    uint32_t epoch_size_;
    std::optional<uint32_t> epoch_;
    std::optional<uint32_t> slots_;
    uint32_t watch_seconds_;
    filesystem::path database_path_;
    bool store_enabled_;
    bool watch_mode_;
    std::vector<std::string> logger_tuning_config_;
  };

}  // namespace slotwatch::application
