#pragma once

// Logging facade: conduit logs through spdlog. Level and sinks are owned by the application.
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export

namespace conduit {

namespace log = spdlog;

}  // namespace conduit
