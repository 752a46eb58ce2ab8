#pragma once

#include <string>
#include <vector>

#include "tcpros/core/errors.hpp"
#include "tcpros/core/log.hpp"
#include "tcpros/core/types.hpp"
#include "tcpros/net/buffer.hpp"

namespace tcpros::net {
    using u8 = tcpros::core::u8;
    using u32 = tcpros::core::u32;
    using u64 = tcpros::core::u64;

    // Handshake record exchanged once per connection, before any message
    // bytes. Absent fields keep their defaults.
    struct ConnectionHeader {
        std::string caller_id;
        bool latching{false};
        std::string msg_definition;
        std::string md5sum;
        std::string topic;
        std::string topic_type;
        // Only emitted when the header is addressed to a publisher.
        bool tcp_nodelay{false};

        friend bool operator==(const ConnectionHeader&, const ConnectionHeader&) = default;
    };

    // Wire layout (little-endian):
    //   u32 block_len | { u32 field_len | name '=' value }*
    // block_len counts every byte after itself.
    inline constexpr u32 kHeaderLengthBytes = 4;

    // Upper bound accepted by header_peek_length.
    inline constexpr u32 kMaxHeaderBytes = 1u << 20;

    // Reported in Status::aux for Net/Corrupt decode failures.
    enum class HeaderError : u32 {
        None = 0,
        Truncated,
        MissingSeparator,
        FieldUnderflow,
        OuterUnderflow,
        InvalidUtf8,
    };

    enum class HeaderPeekResult : u8 {
        Ok = 0,
        NeedMore,
        Invalid,
    };

    [[nodiscard]] const char* header_error_name(HeaderError e) noexcept;

    // Largest frame a u32 length prefix can describe.
    inline constexpr u64 kMaxFrameBytes = 0xffffffffull;

    // Encoded size of one "name=value" field including its length prefix.
    // Computed in 64 bits so oversized values never wrap.
    [[nodiscard]] constexpr u64 header_field_size(u64 name_len, u64 value_len) noexcept {
        return kHeaderLengthBytes + name_len + 1 + value_len;
    }

    // Size of the frame header_encode produces, including the leading length.
    // May exceed kMaxFrameBytes, in which case the header cannot be encoded.
    [[nodiscard]] u64 header_encoded_size(const ConnectionHeader& h, bool to_publisher) noexcept;

    // Every text field must hold valid UTF-8: encoding copies bytes as they
    // are, and header_decode rejects the frame with InvalidUtf8 otherwise.
    //
    // Returns bytes written (0 if 'out' is too small). Nothing is written
    // past out.len.
    [[nodiscard]] u32 header_encode(const ConnectionHeader& h, bool to_publisher, BufferMut out) noexcept;

    // Field order: callerid, latching, md5sum, message_definition,
    // [tcp_nodelay], topic, type. Empty if the frame exceeds kMaxFrameBytes.
    [[nodiscard]] std::vector<u8> header_encode(const ConnectionHeader& h, bool to_publisher);

    // Unknown fields are logged at Warn and skipped. '*out' is only written
    // on success. Bytes past the advertised block are ignored.
    [[nodiscard]] tcpros::core::Status header_decode(BufferView in,
        ConnectionHeader* out,
        const tcpros::core::LogSink& log = tcpros::core::log_null_sink());

    // Reads the leading block length. On Ok, *frame_len is the number of
    // bytes the whole header occupies (kHeaderLengthBytes + block_len).
    [[nodiscard]] HeaderPeekResult header_peek_length(BufferView in, u32* frame_len) noexcept;

} // namespace tcpros::net
