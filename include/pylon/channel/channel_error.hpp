#pragma once

#include <boost/system/error_code.hpp>

namespace pylon::channel
{

// Failures reported by a secure-channel collaborator.
enum class errc
{
    /// The rendezvous server at the configured URL cannot be reached.
    rendezvous_unreachable = 1,
    /// The code is not of the form <nameplate>-<word>[-<word>...].
    invalid_code,
    /// No side is waiting on the code's nameplate.
    nameplate_unknown,
    /// The nameplate already has two sides.
    nameplate_crowded,
    /// The two sides typed different codes; key confirmation failed.
    key_mismatch,
    /// The other side closed the channel.
    peer_closed,
    /// This side already closed the channel.
    channel_closed
};

const boost::system::error_category& channel_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

}  // namespace pylon::channel

namespace boost::system
{
template<>
struct is_error_code_enum<::pylon::channel::errc>
{
    static const bool value = true;
};
}  // namespace boost::system
