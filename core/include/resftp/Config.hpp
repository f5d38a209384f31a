#pragma once
#include "RemoteTypes.hpp"
#include <string>

namespace resftp {

// Checks the fields every backend needs (host, username, port).
bool validateConfig(const Config &cfg, std::string &err);

// Fills cfg from RESFTP_HOST, RESFTP_PORT, RESFTP_USER, RESFTP_PASS,
// RESFTP_TRUSTED_HOST_KEY and RESFTP_CONNECT_TIMEOUT. Variables that are
// unset leave the corresponding field untouched. Fails only on malformed
// values; run validateConfig() once all overrides are applied.
bool loadConfigFromEnvironment(Config &cfg, std::string &err);

// Parses a TCP port in 1..65535.
bool parsePort(const std::string &raw, std::uint16_t &out);

} // namespace resftp
