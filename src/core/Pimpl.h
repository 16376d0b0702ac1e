#pragma once

#include <memory>
#include <utility>

namespace EvoSim {

/**
 * Owning pointer-to-implementation holder.
 *
 * The owning class forward declares `struct Impl;` and keeps a `Pimpl<Impl>` member. Its
 * destructor and move operations must be defined in the .cpp where Impl is complete.
 * Copying is disabled: simulation state is owned by exactly one instance.
 */
template <typename T>
class Pimpl {
public:
    template <typename... Args>
    Pimpl(Args&&... args) : impl_(std::make_unique<T>(std::forward<Args>(args)...))
    {}

    ~Pimpl() = default;

    Pimpl(Pimpl&&) noexcept = default;
    Pimpl& operator=(Pimpl&&) noexcept = default;

    Pimpl(const Pimpl&) = delete;
    Pimpl& operator=(const Pimpl&) = delete;

    T* operator->() { return impl_.get(); }
    const T* operator->() const { return impl_.get(); }

    T& operator*() { return *impl_; }
    const T& operator*() const { return *impl_; }

private:
    std::unique_ptr<T> impl_;
};

} // namespace EvoSim
