#pragma once

#include <type_traits>

#include "tcpros/core/errors.hpp"
#include "tcpros/core/types.hpp"

namespace tcpros::cli {
    using u8 = tcpros::core::u8;
    using u32 = tcpros::core::u32;

    struct CliArgs {
        const char* const* argv{nullptr};
        u32 argc{0};
    };

    enum class OptionType : u8 {
        Flag = 0,
        String = 1,
    };

    enum class OptionId : u32 {
        None = 0,
        CallerId,
        Topic,
        Type,
        Md5Sum,
        Definition,
        Latching,
        TcpNoDelay,
        ToPublisher,
        Output,
        Kind,
        Verbose,
    };

    struct OptionSpec {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        const char* long_name{nullptr};
        char short_name{'\0'};
    };

    struct ParsedOption {
        OptionId id{OptionId::None};
        OptionType type{OptionType::Flag};
        // Points into argv for String options; nullptr for flags.
        const char* value{nullptr};
    };

    // Caller-owned storage; parse_options fails once 'cap' is reached.
    struct ParsedOptions {
        ParsedOption* data{nullptr};
        u32 len{0};
        u32 cap{0};
    };

    // Consumes leading options ("--name value", "--name=value", "-n value",
    // "-nvalue") until the first positional argument or "--".
    tcpros::core::Status parse_options(const CliArgs& args,
        const OptionSpec* specs,
        u32 spec_count,
        ParsedOptions* out,
        u32* consumed) noexcept;

    // Last occurrence of 'id', or nullptr.
    [[nodiscard]] const ParsedOption* find_option(const ParsedOptions& opts, OptionId id) noexcept;

    static_assert(std::is_trivially_copyable_v<CliArgs>);
    static_assert(std::is_trivially_copyable_v<OptionSpec>);
    static_assert(std::is_trivially_copyable_v<ParsedOption>);
    static_assert(std::is_trivially_copyable_v<ParsedOptions>);
    static_assert(std::is_standard_layout_v<CliArgs>);
    static_assert(std::is_standard_layout_v<OptionSpec>);
    static_assert(std::is_standard_layout_v<ParsedOption>);
    static_assert(std::is_standard_layout_v<ParsedOptions>);

} // namespace tcpros::cli
