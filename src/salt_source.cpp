#include "salt_source.hpp"
#include "errors.hpp"
#include "logging.hpp"

#include <fstream>

std::vector<byte> FixedSaltSource::device_salt() const {
    if (salt_.empty()) {
        throw SaltUnavailableError("device salt not configured");
    }
    return salt_;
}

std::vector<std::string> default_machine_id_paths() {
    return { "/etc/machine-id", "/var/lib/dbus/machine-id" };
}

MachineIdSaltSource::MachineIdSaltSource()
    : paths_(default_machine_id_paths())
{
}

static void trim_spaces(std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    auto last = s.find_last_not_of(" \t\r\n");
    if (first == std::string::npos) { s.clear(); return; }
    s = s.substr(first, last - first + 1);
}

std::vector<byte> MachineIdSaltSource::device_salt() const {
    for (const auto& p : paths_) {
        std::ifstream in(p);
        if (!in) continue;

        std::string line;
        while (std::getline(in, line)) {
            trim_spaces(line);
            if (!line.empty()) {
                return std::vector<byte>(line.begin(), line.end());
            }
        }
    }

    audit_log_level(LogLevel::ERROR,
        "No usable machine id found",
        "salt_source",
        "failure");
    throw SaltUnavailableError("no machine id available for device salt");
}

AppNamespaceResolver::AppNamespaceResolver(const std::string& app_id)
    : ns_(app_id + NAMESPACE_SUFFIX)
{
    if (app_id.empty()) {
        throw VaultError("empty application identifier");
    }
}
