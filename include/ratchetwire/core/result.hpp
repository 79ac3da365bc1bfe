#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
namespace ratchetwire::protocol {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/**
 * @brief Value-or-failure return type used across every codec
 *
 * Unwrap() on the wrong alternative throws std::runtime_error; callers are
 * expected to branch on IsErr() first.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return outcome_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return outcome_.index() == 1; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<0>(outcome_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<0>(outcome_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<0>(std::move(outcome_));
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<1>(outcome_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<1>(std::move(outcome_));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<1>(std::move(outcome_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<0>(std::move(outcome_))));
    }

private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : outcome_(idx, std::forward<Args>(args)...) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::runtime_error("Called Unwrap() on an Err Result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::runtime_error("Called UnwrapErr() on an Ok Result");
        }
    }

    std::variant<T, E> outcome_;
};
}
