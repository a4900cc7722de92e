#pragma once

#include <boost/system/error_code.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace pylon
{

// ============================================================================
// Error Kinds
// ============================================================================

enum class errc
{
    /// Code generation or joining attempted while a handshake is pending or a channel is established.
    codegen = 1,
    /// Configured relay URL cannot be turned into a relay hint.
    relay_address,
    /// Failure during the send/receive exchange after the channel was established.
    transfer,
    /// Failure reported by the secure-channel collaborator.
    channel,
    /// Local precondition failure not covered above.
    generic
};

const boost::system::error_category& pylon_category() noexcept;

boost::system::error_code make_error_code(errc e) noexcept;

const char* to_string(errc e) noexcept;

// ============================================================================
// Error
// ============================================================================

class error
{
  public:
    error(errc kind, std::string message, boost::system::error_code cause = {})
      : kind_(kind)
      , message_(std::move(message))
      , cause_(cause)
    {
    }

    static error codegen(std::string message)
    {
        return {errc::codegen, std::move(message)};
    }

    static error relay_address(std::string message)
    {
        return {errc::relay_address, std::move(message)};
    }

    static error transfer(std::string message, boost::system::error_code cause = {})
    {
        return {errc::transfer, std::move(message), cause};
    }

    static error channel(std::string message, boost::system::error_code cause = {})
    {
        return {errc::channel, std::move(message), cause};
    }

    static error generic(std::string message)
    {
        return {errc::generic, std::move(message)};
    }

    errc kind() const noexcept
    {
        return kind_;
    }

    const std::string& message() const noexcept
    {
        return message_;
    }

    // Collaborator error this one wraps, empty for locally raised errors.
    const boost::system::error_code& cause() const noexcept
    {
        return cause_;
    }

    boost::system::error_code code() const noexcept
    {
        return make_error_code(kind_);
    }

    // Wrong-state or misconfiguration errors. The session has to be reset (or the
    // configuration fixed) before trying again, whereas channel and transfer errors
    // only need the network step repeated.
    bool is_precondition() const noexcept
    {
        return kind_ == errc::codegen || kind_ == errc::relay_address || kind_ == errc::generic;
    }

    // Display string for the user.
    std::string what() const;

    bool operator==(const error&) const = default;

  private:
    errc kind_;
    std::string message_;
    boost::system::error_code cause_;
};

// ============================================================================
// Result
// ============================================================================

// Success value or error, handed to every completion handler of the public API.
template<typename T>
class result
{
    std::variant<T, pylon::error> storage_;

  public:
    result(T value)
      : storage_(std::in_place_index<0>, std::move(value))
    {
    }

    result(pylon::error err)
      : storage_(std::in_place_index<1>, std::move(err))
    {
    }

    bool has_value() const noexcept
    {
        return storage_.index() == 0;
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    T& value()
    {
        if (!has_value())
            throw std::logic_error{"result holds an error: " + std::get<1>(storage_).what()};
        return std::get<0>(storage_);
    }

    const T& value() const
    {
        if (!has_value())
            throw std::logic_error{"result holds an error: " + std::get<1>(storage_).what()};
        return std::get<0>(storage_);
    }

    const pylon::error& error() const
    {
        if (has_value())
            throw std::logic_error{"result holds a value"};
        return std::get<1>(storage_);
    }
};

template<>
class result<void>
{
    std::optional<pylon::error> error_;

  public:
    result() = default;

    result(pylon::error err)
      : error_(std::move(err))
    {
    }

    bool has_value() const noexcept
    {
        return !error_.has_value();
    }

    explicit operator bool() const noexcept
    {
        return has_value();
    }

    void value() const
    {
        if (error_)
            throw std::logic_error{"result holds an error: " + error_->what()};
    }

    const pylon::error& error() const
    {
        if (!error_)
            throw std::logic_error{"result holds a value"};
        return *error_;
    }
};

}  // namespace pylon

namespace boost::system
{
template<>
struct is_error_code_enum<::pylon::errc>
{
    static const bool value = true;
};
}  // namespace boost::system
