#pragma once

#include "config/config.hpp"

namespace cmm {

/**
 * Install the default spdlog logger: colored console plus a rotating file
 * under config.log_dir (JSON lines when json_format is set).
 */
void setup_logging(const LoggingConfig& config, const std::string& logger_name = "cmm");

} // namespace cmm
