#pragma once

namespace plink {

constexpr const char* CLIENT_VERSION = "0.1.0";
constexpr const char* DEFAULT_URL = "ws://localhost:3001/ws";

constexpr int CORRELATION_TIMEOUT_MS = 30000;
constexpr int MAX_RECONNECT_DELAY_MS = 30000;

} // namespace plink
