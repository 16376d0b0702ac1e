#pragma once

#include <expected>
#include <utility>

namespace EvoSim {

/**
 * Result<T, E>: value-or-error return for operations whose failure is an ordinary outcome
 * (placement onto an occupied tile, a settings file that does not parse).
 *
 * Thin composition over C++23 std::expected with the okay()/error() factory vocabulary used
 * throughout the simulation code.
 */
template <typename successT, typename failureT>
class Result {
public:
    Result() : inner_(std::unexpected(failureT())) {}

    Result(successT value) : inner_(std::move(value)) {}
    Result(std::unexpected<failureT> err) : inner_(std::move(err)) {}

    static Result okay() { return Result(successT()); }

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmaybe-uninitialized"
    static Result okay(successT value) { return Result(std::move(value)); }
#pragma GCC diagnostic pop

    static Result error() { return Result(std::unexpected(failureT())); }
    static Result error(failureT err) { return Result(std::unexpected(std::move(err))); }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }
    explicit operator bool() const { return inner_.has_value(); }

    const successT& value() const& { return inner_.value(); }
    successT& value() & { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    // Fallback for callers that treat failure as "use this instead".
    successT valueOr(successT fallback) const
    {
        return inner_.has_value() ? *inner_ : std::move(fallback);
    }

    const failureT& errorValue() const& { return inner_.error(); }
    failureT& errorValue() & { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }

private:
    std::expected<successT, failureT> inner_;
};

} // namespace EvoSim
