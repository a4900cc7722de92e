#include <pylon/transfer/frame.hpp>

#include <fmt/core.h>

#include <stdexcept>

namespace pylon
{

std::array<uint8_t, header_length> serialize_header(const frame_header& header)
{
    std::array<uint8_t, header_length> buf{};

    auto serialize_u32 = [](std::span<uint8_t> b, uint32_t val) {
        b[0] = static_cast<uint8_t>((val >> 24) & 0xFF);
        b[1] = static_cast<uint8_t>((val >> 16) & 0xFF);
        b[2] = static_cast<uint8_t>((val >> 8) & 0xFF);
        b[3] = static_cast<uint8_t>((val >> 0) & 0xFF);
    };

    serialize_u32(std::span{buf}.subspan(0, 4), header.frame_length);
    buf[4] = static_cast<uint8_t>(header.id);
    buf[5] = static_cast<uint8_t>(header.status);
    serialize_u32(std::span{buf}.subspan(6, 4), header.sequence_number);

    return buf;
}

frame_header deserialize_header(std::span<const uint8_t> buf)
{
    if (buf.size() < header_length)
        throw std::runtime_error{"Invalid header size"};

    auto deserialize_u32 = [](std::span<const uint8_t> b) -> uint32_t {
        return static_cast<uint32_t>(b[0]) << 24 |
               static_cast<uint32_t>(b[1]) << 16 |
               static_cast<uint32_t>(b[2]) << 8 |
               static_cast<uint32_t>(b[3]);
    };

    frame_header header;
    header.frame_length = deserialize_u32(buf.subspan(0, 4));
    header.id = static_cast<message_id>(buf[4]);
    header.status = static_cast<message_status>(buf[5]);
    header.sequence_number = deserialize_u32(buf.subspan(6, 4));

    if (header.frame_length < header_length)
        throw std::runtime_error{"Invalid frame_length in header"};

    if (header.frame_length > max_frame_length)
        throw std::runtime_error{fmt::format("Frame length {} exceeds maximum {}", header.frame_length, max_frame_length)};

    return header;
}

decoded_frame decode_frame(std::span<const uint8_t> frame)
{
    decoded_frame decoded{deserialize_header(frame), {}};

    if (decoded.header.frame_length != frame.size())
        throw std::length_error{fmt::format("Frame length field {} does not match frame size {}", decoded.header.frame_length, frame.size())};

    auto body = frame.subspan(header_length);

    switch (decoded.header.id)
    {
        case message_id::transit:
            decoded.body = deserialize<transit_request>(body);
            break;
        case message_id::offer:
            decoded.body = deserialize<file_offer>(body);
            break;
        case message_id::answer:
            decoded.body = deserialize<offer_answer>(body);
            break;
        case message_id::chunk:
            decoded.body = deserialize<file_chunk>(body);
            break;
        case message_id::ack:
            decoded.body = deserialize<transfer_ack>(body);
            break;
        case message_id::abort:
            decoded.body = deserialize<transfer_abort>(body);
            break;
        default:
            throw std::runtime_error{fmt::format("Unknown message id 0x{:02x}", static_cast<unsigned>(decoded.header.id))};
    }

    return decoded;
}

}  // namespace pylon
