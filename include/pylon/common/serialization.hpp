#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace pylon
{
namespace detail
{
struct enum_flag
{
    template<typename T>
    static auto deserialize(std::span<const uint8_t>* buf, const char* name)
    {
        if (buf->empty())
            throw std::length_error{"buf size should be at least 1, field_name:" + std::string{name}};

        auto val = T::from_u8(*buf->begin());

        *buf = buf->last(buf->size() - 1);

        return val;
    }

    template<typename T>
    static void serialize_to(std::vector<uint8_t>* vec, const T& val, const char*)
    {
        vec->push_back(static_cast<uint8_t>(val));
    }
};

struct boolean
{
    template<typename T>
    static bool deserialize(std::span<const uint8_t>* buf, const char* name)
    {
        if (buf->empty())
            throw std::length_error{"buf size should be at least 1, field_name:" + std::string{name}};

        auto val = *buf->begin();
        if (val > 1)
            throw std::runtime_error{"boolean field holds " + std::to_string(val) + ", field_name:" + std::string{name}};

        *buf = buf->last(buf->size() - 1);

        return val == 1;
    }

    template<typename T>
    static void serialize_to(std::vector<uint8_t>* vec, const bool& val, const char*)
    {
        vec->push_back(val ? 1 : 0);
    }
};

struct u64
{
    template<typename T>
    static uint64_t deserialize(std::span<const uint8_t>* buf, const char* name)
    {
        if (buf->size() < 8)
            throw std::length_error{"buf size should be at least 8, field_name:" + std::string{name}};

        uint64_t val = 0;
        for (size_t i = 0; i < 8; ++i)
            val = val << 8 | (*buf)[i];

        *buf = buf->last(buf->size() - 8);

        return val;
    }

    template<typename T>
    static void serialize_to(std::vector<uint8_t>* vec, const uint64_t& val, const char*)
    {
        for (int shift = 56; shift >= 0; shift -= 8)
            vec->push_back(static_cast<uint8_t>((val >> shift) & 0xFF));
    }
};

template<size_t MAXLEN>
struct u16_octet_str
{
    static_assert(MAXLEN <= 0xFFFF, "u16_octet_str length must fit its length field");

    template<typename T>
    static auto deserialize(std::span<const uint8_t>* buf, const char* name)
    {
        if (buf->size() < 2)
            throw std::length_error{"buf size should be at least 2, field_name:" + std::string{name}};

        auto length = static_cast<size_t>((*buf)[0]) << 8 | (*buf)[1];

        if (length > MAXLEN)
            throw std::length_error{"u16_octet_str exceed its limit, field_name:" + std::string{name}};

        if (buf->size() - 2 < length)
            throw std::length_error{"u16_octet_str buf " + std::to_string(buf->size()) + " is smaller than it's length field " + std::to_string(length) + " , field_name: " + std::string{name}};

        auto str = std::string{buf->begin() + 2, buf->begin() + 2 + static_cast<std::ptrdiff_t>(length)};

        *buf = buf->last(buf->size() - str.size() - 2);  // two for length field

        return str;
    }

    template<typename T>
    static void serialize_to(std::vector<uint8_t>* vec, const std::string& val, const char* name)
    {
        if (val.size() > MAXLEN)
            throw std::length_error{"u16_octet_str exceed its limit, field_name:" + std::string{name}};

        vec->push_back(static_cast<uint8_t>((val.size() >> 8) & 0xFF));
        vec->push_back(static_cast<uint8_t>((val.size() >> 0) & 0xFF));
        vec->insert(vec->end(), val.begin(), val.end());
    }
};

// Takes whatever is left of the body; must be the last member.
struct octets
{
    template<typename T>
    static auto deserialize(std::span<const uint8_t>* buf, const char*)
    {
        auto data = std::vector<uint8_t>{buf->begin(), buf->end()};

        *buf = buf->last(0);

        return data;
    }

    template<typename T>
    static void serialize_to(std::vector<uint8_t>* vec, const std::vector<uint8_t>& val, const char*)
    {
        vec->insert(vec->end(), val.begin(), val.end());
    }
};

template<typename S, typename T>
using member_ptr_t = T S::*;

template<typename R, typename S, typename T>
struct meta_wrapper
{
    member_ptr_t<S, T> ptr;
    const char* name;

    auto deserialize(std::span<const uint8_t>* buf) const
    {
        return R::template deserialize<T>(buf, name);
    }

    void serialize_to(std::vector<uint8_t>* vec, const S& obj) const
    {
        R::template serialize_to<const T&>(vec, obj.*ptr, name);
    }
};

template<typename R, typename S, typename T>
inline consteval auto meta(member_ptr_t<S, T> ptr, const char* name)
{
    return meta_wrapper<R, S, T>{ptr, name};
}

template<typename PDU>
inline consteval auto members() = delete;
}  // namespace detail

template<typename PDU>
inline constexpr auto meta_holder = detail::members<PDU>();

template<typename PDU>
inline void serialize_to(std::vector<uint8_t>* vec, const PDU& pdu)
{
    [&]<size_t... Is>(std::index_sequence<Is...>)
    {
        (std::get<Is>(meta_holder<PDU>).serialize_to(vec, pdu), ...);
    }
    (std::make_index_sequence<std::tuple_size_v<decltype(meta_holder<PDU>)>>());
}

// Throws std::length_error or std::runtime_error on malformed input, including
// bytes left over after the last member.
template<typename PDU>
inline auto deserialize(std::span<const uint8_t> buf)
{
    auto pdu = [&]<size_t... Is>(std::index_sequence<Is...>)
    {
        return PDU{std::get<Is>(meta_holder<PDU>).deserialize(&buf)...};
    }
    (std::make_index_sequence<std::tuple_size_v<decltype(meta_holder<PDU>)>>{});

    if (!buf.empty())
        throw std::length_error{std::to_string(buf.size()) + " trailing bytes after message body"};

    return pdu;
}
}  // namespace pylon
