#ifndef SLUGMARK_RESULT_HPP
#define SLUGMARK_RESULT_HPP

#include <concepts>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

namespace slugmark {

struct Bad_Result_Access : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Error_Tag { };
struct Success_Tag { };

/// @brief Either a value of type `T` or an error of type `Error`.
/// Unlike exceptions, errors are part of the function signature and have to be inspected by the
/// caller.
/// Accessing the value of a `Result` holding an error (or vice versa) throws `Bad_Result_Access`.
template <typename T, typename Error>
struct Result {
    static_assert(!std::same_as<T, Error>, "The value and error type must be distinct.");

private:
    std::variant<T, Error> m_storage;

public:
    [[nodiscard]] constexpr Result(Success_Tag, const T& value)
        : m_storage(std::in_place_index<0>, value)
    {
    }

    [[nodiscard]] constexpr Result(Success_Tag, T&& value)
        : m_storage(std::in_place_index<0>, std::move(value))
    {
    }

    [[nodiscard]] constexpr Result(Error_Tag, const Error& error)
        : m_storage(std::in_place_index<1>, error)
    {
    }

    [[nodiscard]] constexpr Result(Error_Tag, Error&& error)
        : m_storage(std::in_place_index<1>, std::move(error))
    {
    }

    [[nodiscard]] constexpr Result(const T& value)
        : m_storage(std::in_place_index<0>, value)
    {
    }

    [[nodiscard]] constexpr Result(T&& value)
        : m_storage(std::in_place_index<0>, std::move(value))
    {
    }

    [[nodiscard]] constexpr Result(const Error& error)
        : m_storage(std::in_place_index<1>, error)
    {
    }

    [[nodiscard]] constexpr Result(Error&& error)
        : m_storage(std::in_place_index<1>, std::move(error))
    {
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return m_storage.index() == 0;
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    [[nodiscard]] constexpr const T* operator->() const
    {
        return std::addressof(value());
    }

    [[nodiscard]] constexpr T* operator->()
    {
        return std::addressof(value());
    }

    [[nodiscard]] constexpr const T& operator*() const&
    {
        return value();
    }

    [[nodiscard]] constexpr T& operator*() &
    {
        return value();
    }

    [[nodiscard]] constexpr T&& operator*() &&
    {
        return std::move(value());
    }

    [[nodiscard]] constexpr const T& value() const&
    {
        if (!has_value()) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]] constexpr T& value() &
    {
        if (!has_value()) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
        return *std::get_if<0>(&m_storage);
    }

    [[nodiscard]] constexpr T&& value() &&
    {
        return std::move(value());
    }

    [[nodiscard]] constexpr const Error& error() const&
    {
        if (has_value()) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]] constexpr Error& error() &
    {
        if (has_value()) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return *std::get_if<1>(&m_storage);
    }

    [[nodiscard]] constexpr Error&& error() &&
    {
        return std::move(error());
    }
};

// =================================================================================================

template <typename Error>
struct Result<void, Error> {
private:
    std::optional<Error> m_error;

public:
    [[nodiscard]] constexpr Result() noexcept = default;

    [[nodiscard]] constexpr Result(const Error& error)
        : m_error(error)
    {
    }

    [[nodiscard]] constexpr Result(Error&& error)
        : m_error(std::move(error))
    {
    }

    [[nodiscard]] constexpr bool has_value() const noexcept
    {
        return !m_error.has_value();
    }

    [[nodiscard]] constexpr explicit operator bool() const noexcept
    {
        return has_value();
    }

    constexpr void value() const
    {
        if (!has_value()) {
            throw Bad_Result_Access { "bad result access in value()" };
        }
    }

    [[nodiscard]] constexpr const Error& error() const&
    {
        if (has_value()) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return *m_error;
    }

    [[nodiscard]] constexpr Error& error() &
    {
        if (has_value()) {
            throw Bad_Result_Access { "bad result access in error()" };
        }
        return *m_error;
    }

    [[nodiscard]] constexpr Error&& error() &&
    {
        return std::move(error());
    }
};

} // namespace slugmark

#endif
