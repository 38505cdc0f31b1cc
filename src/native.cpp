#include "sdid128/native.hpp"

#include "logging_internal.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#ifndef SDID128_SYSTEMD_VERSION
#error "SDID128_SYSTEMD_VERSION must be set to the libsystemd major version by the build"
#endif

namespace sdid128 {
namespace native {

namespace {

using Getter = int (*)(sd_id128_t*);
using AppSpecificGetter = int (*)(sd_id128_t, sd_id128_t*);

template <typename T> Result<T> native_error(const char* call, int rc) {
    ErrorCode code = error_code_from_errno(rc);
    std::string message = std::string(call) + ": " + std::system_category().message(rc < 0 ? -rc : rc);
    SDID128_LOG_DEBUG("{} failed with {} ({})", call, rc, error_code_to_string(code));
    return Result<T>::error(code, std::move(message));
}

template <typename T> Result<T> not_supported(const char* call, int required_version) {
    SDID128_LOG_DEBUG("{} requires libsystemd {}, built against {}", call, required_version,
                      SDID128_SYSTEMD_VERSION);
    return Result<T>::error(ErrorCode::NotSupported,
                            std::string(call) + ": requires libsystemd " +
                                std::to_string(required_version) + " or newer");
}

Result<Id128> retrieve(const char* call, Getter getter) {
    sd_id128_t id{};
    int rc = getter(&id);
    if (rc < 0) {
        return native_error<Id128>(call, rc);
    }
    SDID128_LOG_TRACE("{} succeeded", call);
    return Result<Id128>::ok(from_native(id));
}

[[maybe_unused]] Result<Id128> retrieve_app_specific(const char* call, AppSpecificGetter getter,
                                                     const Id128& app) {
    sd_id128_t id{};
    int rc = getter(to_native(app), &id);
    if (rc < 0) {
        return native_error<Id128>(call, rc);
    }
    SDID128_LOG_TRACE("{} succeeded", call);
    return Result<Id128>::ok(from_native(id));
}

}  // namespace

ErrorCode error_code_from_errno(int error) noexcept {
    if (error < 0) {
        error = -error;
    }

    switch (error) {
        case 0:
            return ErrorCode::Success;

        case EINVAL:
        case EUCLEAN:  // malformed ID file or environment variable
        case EBADMSG:
            return ErrorCode::InvalidArgument;

        case ENOENT:
        case ENOMEDIUM:  // empty machine-id
        case ENXIO:      // no invocation ID set
        case ENOPKG:     // machine-id still "uninitialized"
        case ENODATA:
            return ErrorCode::Unavailable;

        case EPERM:
        case EACCES:
            return ErrorCode::PermissionDenied;

        case EOPNOTSUPP:
        case ENOSYS:
            return ErrorCode::NotSupported;

        default:
            return ErrorCode::Unknown;
    }
}

int systemd_version() noexcept {
    return SDID128_SYSTEMD_VERSION;
}

Id128 from_native(const sd_id128_t& id) noexcept {
    return Id128::from_bytes(id.bytes);
}

sd_id128_t to_native(const Id128& id) noexcept {
    sd_id128_t result{};
    std::memcpy(result.bytes, id.data(), Id128::SIZE);
    return result;
}

Result<Id128> random_id() {
    return retrieve("sd_id128_randomize", sd_id128_randomize);
}

Result<Id128> boot_id() {
    return retrieve("sd_id128_get_boot", sd_id128_get_boot);
}

Result<Id128> boot_id_app_specific(const Id128& app) {
#if SDID128_SYSTEMD_VERSION >= 240
    return retrieve_app_specific("sd_id128_get_boot_app_specific", sd_id128_get_boot_app_specific,
                                 app);
#else
    (void)app;
    return not_supported<Id128>("sd_id128_get_boot_app_specific", 240);
#endif
}

Result<Id128> machine_id() {
    return retrieve("sd_id128_get_machine", sd_id128_get_machine);
}

Result<Id128> machine_id_app_specific(const Id128& app) {
#if SDID128_SYSTEMD_VERSION >= 233
    return retrieve_app_specific("sd_id128_get_machine_app_specific",
                                 sd_id128_get_machine_app_specific, app);
#else
    (void)app;
    return not_supported<Id128>("sd_id128_get_machine_app_specific", 233);
#endif
}

Result<Id128> invocation_id() {
#if SDID128_SYSTEMD_VERSION >= 232
    return retrieve("sd_id128_get_invocation", sd_id128_get_invocation);
#else
    return not_supported<Id128>("sd_id128_get_invocation", 232);
#endif
}

Result<Id128> invocation_id_app_specific(const Id128& app) {
#if SDID128_SYSTEMD_VERSION >= 255
    return retrieve_app_specific("sd_id128_get_invocation_app_specific",
                                 sd_id128_get_invocation_app_specific, app);
#else
    (void)app;
    return not_supported<Id128>("sd_id128_get_invocation_app_specific", 255);
#endif
}

Result<Id128> app_specific(const Id128& base, const Id128& app) {
#if SDID128_SYSTEMD_VERSION >= 255
    sd_id128_t id{};
    int rc = sd_id128_get_app_specific(to_native(base), to_native(app), &id);
    if (rc < 0) {
        return native_error<Id128>("sd_id128_get_app_specific", rc);
    }
    SDID128_LOG_TRACE("sd_id128_get_app_specific succeeded");
    return Result<Id128>::ok(from_native(id));
#else
    (void)base;
    (void)app;
    return not_supported<Id128>("sd_id128_get_app_specific", 255);
#endif
}

Result<Id128> from_string(const std::string& text) {
    if (text.find('\0') != std::string::npos) {
        SDID128_LOG_DEBUG("sd_id128_from_string input contains a NUL byte");
        return Result<Id128>::error(ErrorCode::InvalidArgument,
                                    "sd_id128_from_string: input contains a NUL byte");
    }

    sd_id128_t id{};
    int rc = sd_id128_from_string(text.c_str(), &id);
    if (rc < 0) {
        return native_error<Id128>("sd_id128_from_string", rc);
    }
    return Result<Id128>::ok(from_native(id));
}

Result<std::string> to_string(const Id128& id) {
    char buffer[SD_ID128_STRING_MAX] = {0};
    if (sd_id128_to_string(to_native(id), buffer) == nullptr) {
        return Result<std::string>::error(ErrorCode::Unknown, "sd_id128_to_string failed");
    }
    return Result<std::string>::ok(std::string(buffer));
}

Result<std::string> to_uuid_string(const Id128& id) {
#if SDID128_SYSTEMD_VERSION >= 251
    char buffer[SD_ID128_UUID_STRING_MAX] = {0};
    if (sd_id128_to_uuid_string(to_native(id), buffer) == nullptr) {
        return Result<std::string>::error(ErrorCode::Unknown, "sd_id128_to_uuid_string failed");
    }
    return Result<std::string>::ok(std::string(buffer));
#else
    (void)id;
    return not_supported<std::string>("sd_id128_to_uuid_string", 251);
#endif
}

}  // namespace native
}  // namespace sdid128
