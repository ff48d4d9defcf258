/*
 * Owllab License Agreement
 *
 * This software is provided by Owllab and may not be used, copied, modified,
 * merged, published, distributed, sublicensed, or sold without a valid and
 * explicit agreement with Owllab.
 *
 * Copyright (c) 2025 Owllab. All rights reserved.
 */

#pragma once

#include <functional>
#include <utility>

namespace nmk {

template<class>
class SafeFunction;

/**
 * A std::function wrapper which can always be called. When no target is set, calling it does nothing and returns a
 * default constructed value.
 * @tparam R The return type.
 * @tparam Args The argument types.
 */
template<class R, class... Args>
class SafeFunction<R(Args...)> {
  public:
    using Function = std::function<R(Args...)>;

    SafeFunction() = default;

    /**
     * Constructs a SafeFunction with the given target.
     * @param function The target to call.
     */
    SafeFunction(Function function) : function_(std::move(function)) {}  // NOLINT: implicit by intention

    SafeFunction& operator=(Function function) {
        function_ = std::move(function);
        return *this;
    }

    SafeFunction& operator=(std::nullptr_t) {
        function_ = nullptr;
        return *this;
    }

    /**
     * Calls the target, if any.
     * @param args The arguments to pass.
     * @return The value returned by the target, or a default constructed value if there is no target.
     */
    R operator()(Args... args) const {
        if (function_) {
            return function_(std::forward<Args>(args)...);
        }
        if constexpr (!std::is_void_v<R>) {
            return R {};
        }
    }

    /**
     * Removes the target.
     */
    void reset() {
        function_ = nullptr;
    }

    /**
     * @return True if a target is set.
     */
    explicit operator bool() const {
        return static_cast<bool>(function_);
    }

  private:
    Function function_;
};

}  // namespace nmk
