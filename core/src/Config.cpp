#include "resftp/Config.hpp"
#include "resftp/RuntimeEnv.hpp"

#include <stdexcept>

namespace resftp {

bool validateConfig(const Config &cfg, std::string &err) {
    if (cfg.host.empty()) {
        err = "host is required";
        return false;
    }
    if (cfg.username.empty()) {
        err = "username is required";
        return false;
    }
    if (cfg.port == 0) {
        err = "port must be in 1..65535";
        return false;
    }
    if (cfg.connect_timeout.count() <= 0) {
        err = "connect timeout must be positive";
        return false;
    }
    return true;
}

bool parsePort(const std::string &raw, std::uint16_t &out) {
    try {
        std::size_t used = 0;
        const int n = std::stoi(raw, &used);
        if (used != raw.size() || n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::logic_error &) {
        return false;
    }
}

bool loadConfigFromEnvironment(Config &cfg, std::string &err) {
    if (auto v = envValue("RESFTP_HOST"))
        cfg.host = *v;
    if (auto v = envValue("RESFTP_USER"))
        cfg.username = *v;
    if (auto v = envValue("RESFTP_PASS"))
        cfg.password = *v;
    if (auto v = envValue("RESFTP_TRUSTED_HOST_KEY"))
        cfg.trusted_host_key = *v;
    if (auto v = envValue("RESFTP_PORT")) {
        if (!parsePort(*v, cfg.port)) {
            err = "RESFTP_PORT is invalid: " + *v;
            return false;
        }
    }
    if (auto v = envValue("RESFTP_CONNECT_TIMEOUT")) {
        try {
            std::size_t used = 0;
            const long secs = std::stol(*v, &used);
            if (used != v->size() || secs <= 0) {
                err = "RESFTP_CONNECT_TIMEOUT is invalid: " + *v;
                return false;
            }
            cfg.connect_timeout = std::chrono::seconds(secs);
        } catch (const std::logic_error &) {
            err = "RESFTP_CONNECT_TIMEOUT is invalid: " + *v;
            return false;
        }
    }
    return true;
}

} // namespace resftp
