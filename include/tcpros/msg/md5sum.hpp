#pragma once

#include <string>
#include <string_view>

#include "tcpros/core/errors.hpp"

namespace tcpros::msg {

    // 32 lowercase hex digits.
    inline constexpr unsigned kMd5HexChars = 32;

    [[nodiscard]] bool is_builtin_type(std::string_view type) noexcept;

    // Normalized text the md5sum is computed over: constants first
    // ("type NAME=value"), then fields ("type name"), one per line.
    // Fields of non built-in types are Msg/Unsupported.
    [[nodiscard]] tcpros::core::Status msg_md5_text(std::string_view definition, std::string* out);

    [[nodiscard]] tcpros::core::Status msg_md5sum(std::string_view definition, std::string* hex_out);

} // namespace tcpros::msg
