#pragma once
#include "tokenvault_common.hpp"

// -------- Device salt --------
// Returns a stable, non-empty, device-bound byte sequence.
// Throws SaltUnavailableError when none can be produced.
class DeviceSaltSource {
public:
    virtual ~DeviceSaltSource() = default;
    virtual std::vector<byte> device_salt() const = 0;
};

class FixedSaltSource : public DeviceSaltSource {
public:
    explicit FixedSaltSource(std::vector<byte> salt) : salt_(std::move(salt)) {}
    explicit FixedSaltSource(const std::string& salt) : salt_(salt.begin(), salt.end()) {}

    std::vector<byte> device_salt() const override;

private:
    std::vector<byte> salt_;
};

// First non-empty line of the first readable machine-id file
class MachineIdSaltSource : public DeviceSaltSource {
public:
    MachineIdSaltSource();
    explicit MachineIdSaltSource(std::vector<std::string> paths) : paths_(std::move(paths)) {}

    std::vector<byte> device_salt() const override;

    const std::vector<std::string>& paths() const { return paths_; }

private:
    std::vector<std::string> paths_;
};

std::vector<std::string> default_machine_id_paths();

// -------- Namespace resolution --------
class NamespaceResolver {
public:
    virtual ~NamespaceResolver() = default;
    virtual std::string resolve() const = 0;
};

// "<app_id>.sdk"
class AppNamespaceResolver : public NamespaceResolver {
public:
    explicit AppNamespaceResolver(const std::string& app_id);

    std::string resolve() const override { return ns_; }

private:
    std::string ns_;
};
