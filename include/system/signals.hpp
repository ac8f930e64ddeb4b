#pragma once

#include <atomic>

namespace otadump {

// Set by SIGINT/SIGTERM. Workers poll it between operations.
extern std::atomic_bool g_cancel;

void InstallSignalHandlers();

} // namespace otadump
