#pragma once

#include <zpr/write_to.hpp>

namespace zpr {

    /// RPC commands that can be sent to a packet handler
    /// Codes are stable: never renumbered, never reused. 0 is reserved.
    enum class Command : dp::u32 {
        CountersReset = 1,
        Counters = 2,
        Echo = 3,
        PerfSample = 4,
        SetCaptureFile = 5,
        FlushCaptureFile = 6,
        CloseCaptureFile = 7,
        SetCaptureProgram = 8,
        DeleteCaptureProgram = 9,
        ConfigureLink = 10,
        StartLink = 11,
        StopLink = 12,
        ResetLink = 13
    };

    struct CommandInfo {
        Command command;
        const char *name; // kebab-case
    };

    constexpr CommandInfo KNOWN_COMMANDS[] = {
        {Command::CountersReset, "counters-reset"},
        {Command::Counters, "counters"},
        {Command::Echo, "echo"},
        {Command::PerfSample, "perf-sample"},
        {Command::SetCaptureFile, "set-capture-file"},
        {Command::FlushCaptureFile, "flush-capture-file"},
        {Command::CloseCaptureFile, "close-capture-file"},
        {Command::SetCaptureProgram, "set-capture-program"},
        {Command::DeleteCaptureProgram, "delete-capture-program"},
        {Command::ConfigureLink, "configure-link"},
        {Command::StartLink, "start-link"},
        {Command::StopLink, "stop-link"},
        {Command::ResetLink, "reset-link"},
    };

    /// A known Command or Unknown(code) for anything received that we do not recognize
    /// Decoding never fails on an unassigned code; encoding Unknown returns the preserved code
    class RpcCommand {
      private:
        dp::u32 code_;
        bool known_;

        RpcCommand(dp::u32 code, bool known) : code_(code), known_(known) {}

        static const CommandInfo *lookup(dp::u32 code) {
            for (const auto &info : KNOWN_COMMANDS) {
                if (static_cast<dp::u32>(info.command) == code) {
                    return &info;
                }
            }
            return nullptr;
        }

      public:
        /// A Command value outside the registry (a cast integer) is kept as Unknown
        RpcCommand(Command command)
            : code_(static_cast<dp::u32>(command)), known_(lookup(static_cast<dp::u32>(command)) != nullptr) {}

        static RpcCommand from_code(dp::u32 code) {
            if (lookup(code) != nullptr) {
                return RpcCommand(code, true);
            }
            echo::warn("unknown rpc command code ", code, ", keeping it as Unknown");
            return RpcCommand(code, false);
        }

        /// Parse a kebab-case command name; closed set, unknown names are rejected
        static Res<RpcCommand> from_name(const dp::String &name) {
            for (const auto &info : KNOWN_COMMANDS) {
                if (name == info.name) {
                    return dp::result::ok(RpcCommand(info.command));
                }
            }
            echo::error("unknown rpc command name: ", name.c_str());
            return dp::result::err(Error::unknown_command(name));
        }

        dp::u32 to_code() const { return code_; }
        bool is_unknown() const { return !known_; }

        /// Known command; only meaningful when !is_unknown()
        Command command() const { return static_cast<Command>(code_); }

        dp::String to_string() const {
            const CommandInfo *info = lookup(code_);
            if (known_ && info != nullptr) {
                return info->name;
            }
            return dp::String("unknown(") + dp::String(std::to_string(code_).c_str()) + ")";
        }

        Res<dp::usize> write_to(Sink &sink) const { return write_u32(sink, code_); }

        static Res<RpcCommand> read_from(Reader &reader) {
            auto code = reader.read_u32();
            if (code.is_err()) {
                return dp::result::err(code.error());
            }
            return dp::result::ok(from_code(code.value()));
        }

        bool operator==(const RpcCommand &other) const { return code_ == other.code_ && known_ == other.known_; }
        bool operator!=(const RpcCommand &other) const { return !(*this == other); }
    };

    /// Traffic classification specification type (open enumeration)
    enum class Tcst : dp::u8 { Ip5Tuple = 0 };

    inline dp::String tcst_to_string(Tcst tcst) {
        switch (tcst) {
        case Tcst::Ip5Tuple:
            return "IP 5-Tuple";
        }
        return dp::String("[unknown TCST ") +
               dp::String(std::to_string(static_cast<unsigned>(static_cast<dp::u8>(tcst))).c_str()) + "]";
    }

} // namespace zpr
