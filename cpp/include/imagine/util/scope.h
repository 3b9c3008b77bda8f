#ifndef IMAGINE_UTIL_SCOPE_H
#define IMAGINE_UTIL_SCOPE_H

#include <type_traits>
#include <utility>

namespace imagine {

    /**
     * Runs a callable when the enclosing scope ends, unless release() was called first.
     * Used to undo a half finished transition when a later step throws.
     */
    template<typename F>
    class [[nodiscard]] ScopeExit {
    public:
        template<typename Fn>
            requires (!std::is_same_v<std::decay_t<Fn>, ScopeExit>)
        explicit ScopeExit(Fn &&fn) noexcept(std::is_nothrow_constructible_v<F, Fn>)
            : _fn{std::forward<Fn>(fn)} {}

        ScopeExit(ScopeExit &&other) noexcept(std::is_nothrow_move_constructible_v<F>)
            : _fn{std::move(other._fn)}, _armed{std::exchange(other._armed, false)} {}

        ScopeExit(const ScopeExit &) = delete;
        ScopeExit &operator=(const ScopeExit &) = delete;
        ScopeExit &operator=(ScopeExit &&) = delete;

        ~ScopeExit() {
            if (_armed) { _fn(); }
        }

        void release() noexcept { _armed = false; }

        [[nodiscard]] bool is_armed() const noexcept { return _armed; }

    private:
        F _fn;
        bool _armed{true};
    };

    template<typename F>
    ScopeExit(F) -> ScopeExit<F>;

    template<typename F>
    [[nodiscard]] ScopeExit<std::decay_t<F>> make_scope_exit(F &&fn) {
        return ScopeExit<std::decay_t<F>>(std::forward<F>(fn));
    }

} // namespace imagine

#endif // IMAGINE_UTIL_SCOPE_H
