#include "vclock/config/engine_config.hpp"

#include <fstream>
#include <stdexcept>

namespace vclock {

TickClockConfig tickClockConfigFromJson(const nlohmann::json& j) {
  TickClockConfig config;

  if (j.contains("tick_duration_seconds")) {
    config.tick_duration_seconds =
        j.at("tick_duration_seconds").get<std::int64_t>();
  }
  if (j.contains("epoch")) {
    config.epoch = parseIso(j.at("epoch").get<std::string>());
  }
  if (j.contains("seed")) {
    config.seed = j.at("seed").get<std::int64_t>();
  }

  config.validate();
  return config;
}

EngineConfig engineConfigFromJson(const nlohmann::json& j) {
  EngineConfig config;
  config.clock = tickClockConfigFromJson(j);

  if (j.contains("cmd_endpoint")) {
    config.cmd_endpoint = j.at("cmd_endpoint").get<std::string>();
  }
  if (j.contains("pub_endpoint")) {
    config.pub_endpoint = j.at("pub_endpoint").get<std::string>();
  }
  return config;
}

EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("loadEngineConfig: cannot open '" + path + "'");
  }
  return engineConfigFromJson(nlohmann::json::parse(in));
}

}  // namespace vclock
