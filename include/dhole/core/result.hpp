#pragma once
#include <variant>
#include <utility>
#include <type_traits>
#include <stdexcept>
#include <optional>
namespace dhole::protocol {

struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/**
 * @brief Value-or-failure return type used by every fallible operation
 *
 * Holds either a T (Ok) or an E (Err). Unwrap() on the wrong alternative
 * throws std::runtime_error; callers are expected to test IsOk()/IsErr()
 * first.
 */
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

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kOkIndex; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kErrIndex; }

    template<typename Pred>
    [[nodiscard]] bool IsOkAnd(Pred&& pred) const {
        return IsOk() && std::forward<Pred>(pred)(std::get<kOkIndex>(storage_));
    }
    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        return IsErr() && std::forward<Pred>(pred)(std::get<kErrIndex>(storage_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOkIndex>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOkIndex>(storage_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kOkIndex>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErrIndex>(storage_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErrIndex>(storage_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kErrIndex>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsErr()) {
            return fallback;
        }
        return std::get<kOkIndex>(std::move(storage_));
    }

    /// Re-types an Err so it can be returned from a function with a different
    /// success type. Only valid on an Err result.
    template<typename U>
    [[nodiscard]] Result<U, E> PropagateErr() && {
        RequireErr();
        return Result<U, E>::Err(std::get<kErrIndex>(std::move(storage_)));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (IsErr()) {
            return Result<U, E>::Err(std::get<kErrIndex>(std::move(storage_)));
        }
        return Result<U, E>::Ok(std::forward<F>(func)(std::get<kOkIndex>(std::move(storage_))));
    }
    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using U = std::invoke_result_t<F, E>;
        if (IsOk()) {
            return Result<T, U>::Ok(std::get<kOkIndex>(std::move(storage_)));
        }
        return Result<T, U>::Err(std::forward<F>(func)(std::get<kErrIndex>(std::move(storage_))));
    }
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind function must return Result with same error type");
        if (IsErr()) {
            return Next::Err(std::get<kErrIndex>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<kOkIndex>(std::move(storage_)));
    }

    [[nodiscard]] std::optional<T> Ok() && {
        if (IsErr()) {
            return std::nullopt;
        }
        return std::get<kOkIndex>(std::move(storage_));
    }
    [[nodiscard]] std::optional<E> Err() && {
        if (IsOk()) {
            return std::nullopt;
        }
        return std::get<kErrIndex>(std::move(storage_));
    }

private:
    static constexpr std::size_t kOkIndex = 0;
    static constexpr std::size_t kErrIndex = 1;

    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : storage_(idx, std::forward<Args>(args)...) {}

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

    std::variant<T, E> storage_;
};

}
