#pragma once

#include <string>

#include "tcpros/core/types.hpp"

namespace tcpros::core {

    // Strict RFC 3629 check: rejects overlong forms, surrogates and
    // code points above U+10FFFF.
    [[nodiscard]] bool utf8_valid(const u8* data, u32 len) noexcept;

    // Copy of the bytes with every invalid sequence replaced by U+FFFD.
    // Diagnostics only.
    [[nodiscard]] std::string utf8_lossy(const u8* data, u32 len);

} // namespace tcpros::core
