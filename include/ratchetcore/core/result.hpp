#pragma once
#include <stdexcept>
#include <utility>
#include <variant>

namespace ratchetcore::protocol {

/// Placeholder payload for operations that only report success or failure.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
};
inline constexpr Unit unit{};

/// Value-or-failure return type used across the library instead of exceptions.
/// Accessing the wrong alternative throws std::logic_error; callers are expected
/// to branch on IsOk()/IsErr() first.
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kOkIndex>, std::move(value));
    }

    static Result Err(E error) {
        return Result(std::in_place_index<kErrIndex>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kOkIndex; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kErrIndex; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOkIndex>(state_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOkIndex>(state_);
    }

    // Moves the payload out; bind the returned reference to a value, not a reference.
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOkIndex>(std::move(state_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErrIndex>(state_);
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErrIndex>(state_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErrIndex>(std::move(state_));
    }

private:
    static constexpr std::size_t kOkIndex = 0;
    static constexpr std::size_t kErrIndex = 1;

    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : state_(tag, std::forward<V>(v)) {}

    void RequireOk() const {
        if (!IsOk()) {
            throw std::logic_error("Result::Unwrap on a failure");
        }
    }

    void RequireErr() const {
        if (!IsErr()) {
            throw std::logic_error("Result::UnwrapErr on a success");
        }
    }

    std::variant<T, E> state_;
};

}
