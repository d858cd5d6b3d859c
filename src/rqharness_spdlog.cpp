//
// Created by consti10 on 13.08.23.
//
#include "rqharness_spdlog.h"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <cassert>
#include <mutex>

namespace {
std::atomic<bool> debug_enabled{false};

spdlog::level::level_enum current_level() {
  return debug_enabled ? spdlog::level::debug : spdlog::level::info;
}
}  // namespace

std::shared_ptr<spdlog::logger> rqharness::log::create_or_get(
    const std::string& logger_name) {
  static std::mutex logger_mutex2{};
  std::lock_guard<std::mutex> guard(logger_mutex2);
  auto ret = spdlog::get(logger_name);
  if (ret == nullptr) {
    auto created = spdlog::stdout_color_mt(logger_name);
    created->set_level(current_level());
    assert(created);
    return created;
  }
  return ret;
}

std::shared_ptr<spdlog::logger> rqharness::log::get_default() {
  return create_or_get("rqharness");
}

void rqharness::log::set_debug_enabled(const bool enable) {
  debug_enabled = enable;
  const auto level = current_level();
  spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& logger) {
    logger->set_level(level);
  });
}
