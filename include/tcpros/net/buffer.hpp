#pragma once

#include <cstddef>
#include <type_traits>

#include "tcpros/core/types.hpp"

namespace tcpros::net {
    using u8 = tcpros::core::u8;
    using u32 = tcpros::core::u32;

    struct BufferView {
        const u8* data{nullptr};
        u32 len{0};
    };

    struct BufferMut {
        u8* data{nullptr};
        u32 len{0};
    };

    // Views [data, data + len). Fails, leaving '*out' untouched, when 'len'
    // does not fit the u32 length of a view.
    [[nodiscard]] inline bool buffer_view_of(const u8* data, std::size_t len, BufferView* out) noexcept {
        if (out == nullptr || len > 0xffffffffu) {
            return false;
        }
        *out = BufferView{data, static_cast<u32>(len)};
        return true;
    }

    static_assert(std::is_trivially_copyable_v<BufferView>);
    static_assert(std::is_standard_layout_v<BufferView>);
    static_assert(std::is_trivially_copyable_v<BufferMut>);
    static_assert(std::is_standard_layout_v<BufferMut>);
} // namespace tcpros::net
