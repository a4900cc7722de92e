#pragma once

#include <pylon/common.hpp>
#include <pylon/pdu.hpp>
#include <pylon/config.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace pylon
{

using message = std::variant<std::monostate, transit_request, file_offer, offer_answer, file_chunk, transfer_ack, transfer_abort>;

// ============================================================================
// Frame Header
// ============================================================================

struct frame_header
{
    uint32_t frame_length{0};
    message_id id{message_id::transit};
    message_status status{message_status::ok};
    uint32_t sequence_number{0};
};

inline constexpr size_t header_length{10};
inline constexpr uint32_t max_frame_length{static_cast<uint32_t>(max_chunk_size + header_length)};

std::array<uint8_t, header_length> serialize_header(const frame_header& header);

// Throws std::runtime_error on a short buffer or an impossible frame length.
frame_header deserialize_header(std::span<const uint8_t> buf);

// ============================================================================
// Frames
// ============================================================================

template<typename PDU>
std::vector<uint8_t> encode_frame(const PDU& pdu, uint32_t sequence_number, message_status status = message_status::ok)
{
    std::vector<uint8_t> frame(header_length);
    serialize_to(&frame, pdu);

    auto header = serialize_header({
        .frame_length = static_cast<uint32_t>(frame.size()),
        .id = detail::message_id_of(pdu),
        .status = status,
        .sequence_number = sequence_number,
    });
    std::copy(header.begin(), header.end(), frame.begin());

    return frame;
}

struct decoded_frame
{
    frame_header header;
    message body;
};

// Throws std::length_error or std::runtime_error on malformed frames.
decoded_frame decode_frame(std::span<const uint8_t> frame);

}  // namespace pylon
