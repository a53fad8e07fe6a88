#pragma once

#include <zpr/common.hpp>

#include <optional>

namespace zpr {

    /// Failure categories reported by the identifier and serialization layer
    enum class ErrorKind : dp::u8 {
        InvalidAddressFormat = 1, // Malformed or oversized address input
        MalformedDN = 2,          // Unparseable distinguished name
        WriteError = 3,           // Sink failure during serialization (cause is kept)
        LengthMismatch = 4,       // Declared packet length differs from the payload
        Truncated = 5,            // Decoder ran out of input or met an impossible field
        UnknownCommand = 6        // RPC command name not in the registry
    };

    inline const char *error_kind_name(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::InvalidAddressFormat:
            return "InvalidAddressFormat";
        case ErrorKind::MalformedDN:
            return "MalformedDN";
        case ErrorKind::WriteError:
            return "WriteError";
        case ErrorKind::LengthMismatch:
            return "LengthMismatch";
        case ErrorKind::Truncated:
            return "Truncated";
        case ErrorKind::UnknownCommand:
            return "UnknownCommand";
        }
        return "Unknown";
    }

    /// Error value carried by zpr::Res
    /// WriteError keeps the sink's original dp::Error in `cause`
    struct Error {
        ErrorKind kind;
        dp::String message;
        std::optional<dp::Error> cause;

        static Error invalid_address(const dp::String &msg) { return Error{ErrorKind::InvalidAddressFormat, msg, {}}; }

        static Error malformed_dn(const dp::String &msg) { return Error{ErrorKind::MalformedDN, msg, {}}; }

        static Error write_error(const dp::Error &sink_error) {
            return Error{ErrorKind::WriteError, dp::String("sink write failed: ") + sink_error.message, sink_error};
        }

        static Error length_mismatch(dp::usize declared, dp::usize actual) {
            return Error{ErrorKind::LengthMismatch,
                         dp::String("declared length ") + dp::String(std::to_string(declared).c_str()) +
                             " does not match payload length " + dp::String(std::to_string(actual).c_str()),
                         {}};
        }

        static Error truncated(const dp::String &msg) { return Error{ErrorKind::Truncated, msg, {}}; }

        static Error unknown_command(const dp::String &name) {
            return Error{ErrorKind::UnknownCommand, dp::String("unknown rpc command: ") + name, {}};
        }

        bool is(ErrorKind k) const { return kind == k; }

        inline dp::String to_string() const {
            return dp::String(error_kind_name(kind)) + ": " + message;
        }
    };

    /// Result type used by every fallible zpr operation
    template <typename T> using Res = dp::Result<T, Error>;

} // namespace zpr
