#pragma once

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace listen_along {
namespace platform {

enum class SystemError {
    NotSupported,
    PermissionDenied,
    ResourceNotFound,
    OperationFailed,
    AlreadyExists
};

std::string to_string(SystemError error);

class SingleInstanceManager {
public:
    virtual ~SingleInstanceManager() = default;

    // true if this process now owns the instance, false if another one does.
    virtual std::expected<bool, SystemError> try_acquire_instance() = 0;
    virtual void release_instance() = 0;
    virtual bool is_instance_acquired() const = 0;

    static std::unique_ptr<SingleInstanceManager> create(const std::string& instance_name);
};

// Makes the OS launch this executable for a custom URI scheme.
class UriSchemeRegistrar {
public:
    virtual ~UriSchemeRegistrar() = default;

    virtual std::expected<void, SystemError> register_scheme(const std::string& scheme,
                                                             const std::string& description) = 0;

    static std::unique_ptr<UriSchemeRegistrar> create(const std::string& app_name);

    static std::expected<std::filesystem::path, SystemError> executable_path();
};

} // namespace platform
} // namespace listen_along
