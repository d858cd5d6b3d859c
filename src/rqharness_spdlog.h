//
// Created by consti10 on 14.11.22.
//

#ifndef RQHARNESS_SRC_RQHARNESS_SPDLOG_H_
#define RQHARNESS_SRC_RQHARNESS_SPDLOG_H_

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace rqharness::log {

std::shared_ptr<spdlog::logger> create_or_get(const std::string& logger_name);

std::shared_ptr<spdlog::logger> get_default();

// Applies to all loggers created so far and to every logger created
// afterwards. Default is info.
void set_debug_enabled(bool enable);

}  // namespace rqharness::log
#endif  // RQHARNESS_SRC_RQHARNESS_SPDLOG_H_
