#pragma once

/**
 * @file native.hpp
 * @brief libsystemd sd-id128 calls for sdid128
 *
 * Every function here is a direct call into libsystemd. Negative errno
 * returns are translated to ErrorCode; entry points newer than the
 * libsystemd the library was built against fail with NotSupported.
 */

#include "sdid128/sdid128.hpp"

#include <systemd/sd-id128.h>

#include <string>

namespace sdid128 {
namespace native {

/// Translate a libsystemd errno return (either sign) to an ErrorCode
[[nodiscard]] ErrorCode error_code_from_errno(int error) noexcept;

/// Major version of the libsystemd the library was built against
[[nodiscard]] int systemd_version() noexcept;

/// Wrap a sd_id128_t returned by a direct libsystemd call
[[nodiscard]] Id128 from_native(const sd_id128_t& id) noexcept;

/// Unwrap an identifier for a direct libsystemd call
[[nodiscard]] sd_id128_t to_native(const Id128& id) noexcept;

/**
 * @brief Generate a new random identifier (sd_id128_randomize)
 *
 * Every call returns a new ID from the kernel random number generator. The
 * result is always UUID v4 compatible.
 */
[[nodiscard]] Result<Id128> random_id();

/**
 * @brief Get the boot ID of the running kernel (sd_id128_get_boot)
 *
 * Read from /proc/sys/kernel/random/boot_id and cached by libsystemd, so
 * repeated calls return the same value.
 */
[[nodiscard]] Result<Id128> boot_id();

/**
 * @brief Get the boot ID hashed with an application ID
 *        (sd_id128_get_boot_app_specific, libsystemd 240)
 *
 * Use this instead of boot_id() when handing the ID to untrusted parties:
 * it stays stable for the boot but cannot be correlated with the IDs of
 * other applications.
 */
[[nodiscard]] Result<Id128> boot_id_app_specific(const Id128& app);

/**
 * @brief Get the machine ID of the host (sd_id128_get_machine)
 *
 * Read from /etc/machine-id and cached by libsystemd.
 */
[[nodiscard]] Result<Id128> machine_id();

/**
 * @brief Get the machine ID hashed with an application ID
 *        (sd_id128_get_machine_app_specific, libsystemd 233)
 */
[[nodiscard]] Result<Id128> machine_id_app_specific(const Id128& app);

/**
 * @brief Get the invocation ID of the running service
 *        (sd_id128_get_invocation, libsystemd 232)
 *
 * Fails with Unavailable outside of a service started by the service manager.
 */
[[nodiscard]] Result<Id128> invocation_id();

/// Invocation ID hashed with an application ID (libsystemd 255)
[[nodiscard]] Result<Id128> invocation_id_app_specific(const Id128& app);

/// Any base ID hashed with an application ID (sd_id128_get_app_specific, libsystemd 255)
[[nodiscard]] Result<Id128> app_specific(const Id128& base, const Id128& app);

/**
 * @brief Parse text with libsystemd (sd_id128_from_string)
 *
 * Accepts 32 hex digits or the UUID layout, in either case. Text with an
 * embedded NUL byte is rejected with InvalidArgument before the call.
 */
[[nodiscard]] Result<Id128> from_string(const std::string& text);

/// Format as 32 lower case hex digits with libsystemd (sd_id128_to_string)
[[nodiscard]] Result<std::string> to_string(const Id128& id);

/// Format as a lower case UUID with libsystemd (sd_id128_to_uuid_string, libsystemd 251)
[[nodiscard]] Result<std::string> to_uuid_string(const Id128& id);

}  // namespace native
}  // namespace sdid128
