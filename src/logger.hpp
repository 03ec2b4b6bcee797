#pragma once
#include <spdlog/spdlog.h>
#include <optional>
#include <string>

// TRACE/DEBUG/WARN/ERROR (any case); everything else is INFO.
spdlog::level::level_enum parse_log_level(const std::optional<std::string>& value);

// Installs the default logger: $HOME/termsearch.log, level from TERMSEARCH_LOG.
void setup_logging();
