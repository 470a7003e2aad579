#include "hostname.hpp"
#include "log.hpp"
#include "utils.hpp"
#include <platform/process.hpp>

Result<std::string> resolve_hostname(const std::vector<HostnameSource>& sources) {
    for (const auto& source : sources) {
        std::string host = trimmed(source());
        if (!host.empty()) {
            return Result<std::string>::Ok(host);
        }
    }
    return Result<std::string>::Err(ErrorCode::MissingHostname,
        "Could not determine the hostname (HOSTNAME, HOST and `hostname` all empty)");
}

std::vector<HostnameSource> default_hostname_sources() {
    return {
        [] { return env_or_empty("HOSTNAME"); },
        [] { return env_or_empty("HOST"); },
        [] {
            auto r = platform::run_capture("hostname");
            if (r.failed()) {
                zenv_log(fmt::format("hostname command failed (exit={}): {}",
                                     r.exit_code, trimmed(r.get_output())));
                return std::string();
            }
            return r.stdout_data;
        },
    };
}

Result<std::string> current_hostname() {
    auto result = resolve_hostname(default_hostname_sources());
    if (result.is_ok()) {
        zenv_log("hostname: " + result.value);
    }
    return result;
}
