#pragma once

#include <cinttypes>

namespace pylon
{
enum class message_id : uint8_t
{
    transit = 0x01,
    offer = 0x02,
    answer = 0x82,
    chunk = 0x03,
    ack = 0x83,
    abort = 0x04,
};

enum class message_status : uint8_t
{
    ok = 0x00,
    failed = 0xFF,
};

inline const char* to_string(message_id id)
{
    switch (id)
    {
        case message_id::transit:
            return "transit";
        case message_id::offer:
            return "offer";
        case message_id::answer:
            return "answer";
        case message_id::chunk:
            return "chunk";
        case message_id::ack:
            return "ack";
        case message_id::abort:
            return "abort";
    }
    return "unknown";
}
}  // namespace pylon
