#include "tcpros/cli/commands.hpp"

#include <cstring>

namespace tcpros::cli {
    tcpros::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept {
        const tcpros::core::Status invalid =
            tcpros::core::make_status(tcpros::core::StatusDomain::Cli, tcpros::core::StatusCode::Invalid);
        if (out == nullptr || consumed == nullptr) {
            return invalid;
        }
        *consumed = 0;
        out->id = CommandId::None;
        out->args = CliArgs{};

        if (args.argc == 0 || args.argv == nullptr || args.argv[0] == nullptr) {
            return invalid;
        }
        if (spec_count > 0 && specs == nullptr) {
            return invalid;
        }

        const char* cmd = args.argv[0];
        if (cmd[0] == '-') {
            return invalid;
        }

        for (u32 i = 0; i < spec_count; ++i) {
            if (specs[i].name != nullptr && std::strcmp(specs[i].name, cmd) == 0) {
                out->id = specs[i].id;
                out->args.argv = args.argv + 1;
                out->args.argc = args.argc - 1;
                *consumed = 1;
                return tcpros::core::ok_status();
            }
        }
        return tcpros::core::make_status(tcpros::core::StatusDomain::Cli, tcpros::core::StatusCode::NotFound);
    }
} // namespace tcpros::cli
