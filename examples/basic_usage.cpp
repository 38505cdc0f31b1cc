/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the sdid128 library
 *
 * This example demonstrates how to:
 * - Read the boot and machine IDs of the running system
 * - Format an ID in every layout and case
 * - Derive an application-specific machine ID
 * - Parse IDs strictly, laxly and through libsystemd
 * - Handle errors using the Result type
 */

#include <sdid128/native.hpp>
#include <sdid128/sdid128.hpp>

#include <iostream>
#include <set>
#include <string>

int main() {
    using sdid128::Case;
    using sdid128::Format;
    using sdid128::Id128;

    // Example 1: Boot ID in all layouts
    std::cout << "=== Boot ID ===\n";
    {
        auto result = sdid128::native::boot_id();

        if (result.is_ok()) {
            const auto& boot = result.value();
            std::cout << "Default: " << boot << "\n";
            std::cout << "Hex:     " << boot.to_string(Format::Hex) << "\n";
            std::cout << "Grouped: " << boot.to_string(Format::Grouped) << "\n";
            std::cout << "Upper:   " << boot.to_string(Format::Uuid, Case::Upper) << "\n";
        } else {
            std::cerr << "Failed to read boot ID: " << result.error_message() << "\n";
        }
    }

    // Example 2: Machine ID, raw and application-specific
    std::cout << "\n=== Machine ID ===\n";
    {
        // Applications embed a fixed random ID of their own, e.g. from "id128 new"
        auto app = Id128::parse("c273277323db454ea63bb96e79b53e97");

        auto machine = sdid128::native::machine_id();
        if (machine.is_ok()) {
            std::cout << "Machine ID: " << machine.value().to_string(Format::Hex) << "\n";
        } else {
            std::cerr << "Failed to read machine ID: " << machine.error_message() << "\n";

            // Handle specific error codes
            switch (machine.error_code()) {
                case sdid128::ErrorCode::Unavailable:
                    std::cerr << "No machine ID is provisioned on this system.\n";
                    break;
                case sdid128::ErrorCode::PermissionDenied:
                    std::cerr << "The machine ID is not readable.\n";
                    break;
                default:
                    break;
            }
        }

        auto hashed = sdid128::native::machine_id_app_specific(app.value());
        if (hashed.is_ok()) {
            std::cout << "App-specific machine ID: " << hashed.value().to_string(Format::Hex)
                      << "\n";
        } else {
            std::cerr << "Failed to derive app-specific ID: "
                      << sdid128::error_code_to_string(hashed.error_code()) << "\n";
        }
    }

    // Example 3: Parsing
    std::cout << "\n=== Parsing ===\n";
    {
        const std::string inputs[] = {
            "0123456789abcdef0123456789abcdef",
            "01234567-89AB-CDEF-0123-456789ABCDEF",
            "0123-4567-89ab-cdef-0123-4567-89ab-cdef",
            "  01-23-456789AB-C----DEF01234567-89ABCDEF  ",
        };

        for (const auto& input : inputs) {
            auto strict = Id128::parse(input);
            auto lax = Id128::parse_lax(input);
            std::cout << "\"" << input << "\"\n";
            std::cout << "  strict: " << (strict.is_ok() ? strict.value().to_string() : strict.error_message())
                      << "\n";
            std::cout << "  lax:    " << (lax.is_ok() ? lax.value().to_string() : lax.error_message())
                      << "\n";
        }

        auto native = sdid128::native::from_string("0123456789ABCDEF0123456789ABCDEF");
        if (native.is_ok()) {
            std::cout << "libsystemd: " << native.value() << "\n";
        }
    }

    // Example 4: IDs are ordered by their bytes
    std::cout << "\n=== Random IDs ===\n";
    {
        std::set<Id128> ids;
        for (int i = 0; i < 3; ++i) {
            auto random = sdid128::native::random_id();
            if (random.is_error()) {
                std::cerr << "Failed to generate ID: " << random.error_message() << "\n";
                return 1;
            }
            ids.insert(random.value());
        }
        for (const auto& id : ids) {
            std::cout << id << " (UUID v" << id.uuid_version() << ")\n";
        }
    }

    return 0;
}
