#pragma once

#include <optional>
#include <utility>
#include <variant>

namespace payload_hal {
namespace utils {

/**
 * @brief Value-or-error return type
 *
 * Holds either a T or an E. Testing the result in a boolean context
 * yields true on success. Accessing value() on an error (or error()
 * on a value) throws.
 */
template<typename T, typename E>
class Result {
public:
    Result(const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool ok() const { return storage_.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(storage_); }
    const T& value() const& { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    const E& error() const { return std::get<1>(storage_); }

    T valueOr(T fallback) const {
        return ok() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    std::variant<T, E> storage_;
};

template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    bool ok() const { return !error_.has_value(); }
    explicit operator bool() const { return ok(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

} // namespace utils
} // namespace payload_hal
