#include "../src/utils/Config.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

std::string tempPath(const std::string& name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

void test_defaults(TestSuite& suite) {
  AppConfig config = ConfigLoader::fromJson(nlohmann::json::object());
  suite.require(config.scheduler.request_retention == 0.9, "default retention");
  suite.require(config.scheduler.learning_steps.size() == 2, "default learning steps");
  suite.require(config.limits.new_cards_per_day == 20, "default new-card limit");
  suite.require(config.limits.reviews_per_day == 0, "default review limit is unlimited");
  suite.require(config.sync.retry_limit == 3, "default retry limit");
  suite.require(!config.sync.simulate_offline, "online by default");
  suite.require(config.logging.file == "cadence.log" && config.logging.level == "info", "default logging");
  suite.require(!config.timezone_offset_minutes, "host time zone by default");
}

void test_overrides(TestSuite& suite) {
  nlohmann::json j = {
      {"scheduler", {{"request_retention", 0.85}, {"learning_steps", {2.0, 15.0, 60.0}}, {"easy_interval", 5}}},
      {"limits", {{"new_cards_per_day", 5}, {"reviews_per_day", 100}}},
      {"sync", {{"retry_limit", 5}, {"simulate_offline", true}}},
      {"logging", {{"file", "study.log"}, {"level", "debug"}}},
      {"timezone_offset_minutes", -300},
  };
  AppConfig config = ConfigLoader::fromJson(j);

  suite.require(config.scheduler.request_retention == 0.85, "retention override");
  suite.require(config.scheduler.learning_steps == std::vector<double>({2.0, 15.0, 60.0}), "learning steps override");
  suite.require(config.scheduler.easy_interval == 5.0, "integer values are accepted for doubles");
  suite.require(config.scheduler.maximum_interval == 36500.0, "untouched keys keep defaults");
  suite.require(config.limits.new_cards_per_day == 5 && config.limits.reviews_per_day == 100, "limit overrides");
  suite.require(config.sync.retry_limit == 5 && config.sync.simulate_offline, "sync overrides");
  suite.require(config.logging.file == "study.log" && config.logging.level == "debug", "logging overrides");
  suite.require(config.timezone_offset_minutes && *config.timezone_offset_minutes == -300, "time zone override");
}

void test_invalid_values_keep_defaults(TestSuite& suite) {
  nlohmann::json j = {
      {"scheduler",
       {{"request_retention", 1.5},
        {"learning_steps", nlohmann::json::array()},
        {"relearning_steps", nlohmann::json::array({-1.0})},
        {"maximum_interval", "long"},
        {"weights", {1.0, 2.0}},
        {"graduating_interval", 2.0}}},
      {"limits", {{"new_cards_per_day", -1}, {"reviews_per_day", "many"}}},
      {"sync", {{"retry_limit", 0}}},
      {"logging", {{"file", ""}}},
      {"timezone_offset_minutes", 5000},
  };
  AppConfig config = ConfigLoader::fromJson(j);
  SchedulerParams defaults;

  suite.require(config.scheduler.request_retention == defaults.request_retention, "retention outside (0, 1) rejected");
  suite.require(config.scheduler.learning_steps == defaults.learning_steps, "empty learning steps rejected");
  suite.require(config.scheduler.relearning_steps == defaults.relearning_steps, "negative relearning step rejected");
  suite.require(config.scheduler.maximum_interval == defaults.maximum_interval, "wrong type rejected");
  suite.require(config.scheduler.w == defaults.w, "short weight vector rejected");
  suite.require(config.scheduler.graduating_interval == 2.0, "valid keys still apply beside invalid ones");
  suite.require(config.limits.new_cards_per_day == 20, "negative limit rejected");
  suite.require(config.limits.reviews_per_day == 0, "non-numeric limit rejected");
  suite.require(config.sync.retry_limit == 3, "retry limit below one rejected");
  suite.require(config.logging.file == "cadence.log", "empty log file rejected");
  suite.require(!config.timezone_offset_minutes, "impossible time zone rejected");

  AppConfig fromArray = ConfigLoader::fromJson(nlohmann::json::array());
  suite.require(fromArray.limits.new_cards_per_day == 20, "non-object settings give defaults");
}

void test_file_round_trip(TestSuite& suite) {
  const std::string path = tempPath("cadence_test_config.json");
  std::remove(path.c_str());

  AppConfig missing;
  suite.require(ConfigLoader::load(path, missing), "a missing file is not an error");
  suite.require(missing.limits.new_cards_per_day == 20, "a missing file gives defaults");

  AppConfig config;
  config.limits.new_cards_per_day = 7;
  config.scheduler.relearning_steps = {5.0, 20.0};
  config.timezone_offset_minutes = 330;
  suite.require(ConfigLoader::save(path, config), "config saved");

  AppConfig loaded;
  suite.require(ConfigLoader::load(path, loaded), "saved config loads");
  suite.require(loaded.limits.new_cards_per_day == 7, "limit survives the file");
  suite.require(loaded.scheduler.relearning_steps == config.scheduler.relearning_steps, "steps survive the file");
  suite.require(loaded.scheduler.w == config.scheduler.w, "weights survive the file");
  suite.require(loaded.timezone_offset_minutes && *loaded.timezone_offset_minutes == 330, "offset survives the file");

  {
    std::ofstream out(path, std::ios::trunc);
    out << "{ not json";
  }
  AppConfig broken;
  broken.limits.new_cards_per_day = 99;
  suite.require(!ConfigLoader::load(path, broken), "unparseable file is reported");
  suite.require(broken.limits.new_cards_per_day == 20, "unparseable file leaves defaults");

  std::remove(path.c_str());
}

}  // namespace

int main() {
  TestSuite suite;

  test_defaults(suite);
  test_overrides(suite);
  test_invalid_values_keep_defaults(suite);
  test_file_round_trip(suite);

  if (!suite.ok) {
    std::cerr << "Config tests FAILED" << std::endl;
    return 1;
  }

  std::cout << "Config tests passed" << std::endl;
  return 0;
}
