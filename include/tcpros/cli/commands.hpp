#pragma once

#include <type_traits>

#include "tcpros/cli/options.hpp"
#include "tcpros/core/errors.hpp"

namespace tcpros::cli {
    using u32 = tcpros::core::u32;

    enum class CommandId : u32 {
        None = 0,
        Help,
        Decode,
        Encode,
        Find,
        Installed,
        Md5,
    };

    struct CommandSpec {
        CommandId id{CommandId::None};
        const char* name{nullptr};
    };

    struct CommandInvocation {
        CommandId id{CommandId::None};
        CliArgs args{};
    };

    tcpros::core::Status parse_command(const CliArgs& args,
        const CommandSpec* specs,
        u32 spec_count,
        CommandInvocation* out,
        u32* consumed) noexcept;

    static_assert(std::is_trivially_copyable_v<CommandSpec>);
    static_assert(std::is_trivially_copyable_v<CommandInvocation>);
    static_assert(std::is_standard_layout_v<CommandSpec>);
    static_assert(std::is_standard_layout_v<CommandInvocation>);

} // namespace tcpros::cli
