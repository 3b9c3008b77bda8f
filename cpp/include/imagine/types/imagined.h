#pragma once

#include <imagine/types/activation.h>

#include <functional>
#include <memory>
#include <string>
#include <type_traits>

namespace imagine {

    /**
     * @brief A wrapped callable evaluated as of an earlier activation depth.
     *
     * Holds a snapshot of the head that was in effect before the n most recent activations, so it can be compared
     * against the current value without leaving any scope. It never moves the cursor.
     */
    template<typename R, typename... Args>
    class Retrospect<R(Args...)> {
    public:
        using scene_type = Scene<R(Args...)>;
        using scene_ptr = typename scene_type::ptr;
        using body_type = std::function<R(Args...)>;

        Retrospect(std::shared_ptr<const body_type> body, scene_ptr head)
            : _body{std::move(body)}, _head{std::move(head)} {}

        R operator()(Args... args) const {
            return resolve(_head.get(), *_body, std::forward<Args>(args)...);
        }

    private:
        std::shared_ptr<const body_type> _body;
        scene_ptr _head;
    };

    /**
     * @brief The adapter exposed to call sites.
     *
     * Calling it walks the active chain of its cursor, head first, and returns the value of the first scene whose
     * guard matches. If none matches the original computation is invoked; anything it throws reaches the caller
     * untouched. Calling never changes the cursor.
     *
     * at(), where() and imagine() start new chains on top of whatever is active when they are called. Each wrapped
     * callable owns its own cursor, nothing is shared between wrapped callables.
     *
     * The wrapped callable must outlive every activation built from it. It is movable (the cursor does not move)
     * but not copyable.
     */
    template<typename R, typename... Args>
    class Imagined<R(Args...)> {
    public:
        using signature = R(Args...);
        using result_type = R;
        using body_type = std::function<R(Args...)>;
        using cursor_type = Cursor<signature>;
        using scene_type = Scene<signature>;
        using scene_ptr = typename scene_type::ptr;
        using guard_type = typename scene_type::guard_type;

        explicit Imagined(body_type body, std::string name = {})
            : _body{std::make_shared<const body_type>(std::move(body))},
              _cursor{std::make_unique<cursor_type>(std::move(name))} {
            if (!*_body) { throw_error<ImagineError>("Cannot imagine '{}', no callable was supplied", _cursor->name()); }
        }

        Imagined(Imagined &&) noexcept = default;
        Imagined &operator=(Imagined &&) noexcept = default;
        Imagined(const Imagined &) = delete;
        Imagined &operator=(const Imagined &) = delete;

        R operator()(Args... args) const {
            return resolve(_cursor->active().get(), *_body, std::forward<Args>(args)...);
        }

        /**
         * Freeze a point in the input space. Note that defaults are not consulted: an optional parameter left as
         * nullopt identifies a different point than the same parameter given its default value explicitly.
         */
        [[nodiscard]] Point<signature> at(std::decay_t<Args>... args) const requires PointComparable<Args...> {
            return Point<signature>(_cursor.get(), _cursor->active(), std::make_tuple(std::move(args)...));
        }

        [[nodiscard]] Region<signature> where(guard_type guard) const {
            return Region<signature>(_cursor.get(), _cursor->active(), std::move(guard));
        }

        /**
         * Turn the callable into a constant, for every input not shadowed by an override entered after this one.
         */
        [[nodiscard]] Activation<signature> imagine(R value) const {
            return Activation<signature>(_cursor.get(), std::make_shared<scene_type>(_cursor->active(), guard_type{},
                                                                                     std::move(value)));
        }

        /**
         * Evaluate as if the n most recently entered (still open) activations for this callable had not been entered,
         * looking_back(0) is equivalent to the callable itself.
         * @code
         * auto scope = f.at(0).imagine(1).scoped();
         * auto difference = f(0) - f.looking_back(1)(0);
         * @endcode
         */
        [[nodiscard]] Retrospect<signature> looking_back(std::size_t n) const {
            return Retrospect<signature>(_body, _cursor->looking_back(n));
        }

        /**
         * The number of open activations for this callable.
         */
        [[nodiscard]] std::size_t depth() const { return _cursor->depth(); }

        [[nodiscard]] bool is_imagining() const { return _cursor->active() != nullptr; }

        [[nodiscard]] const std::string &name() const { return _cursor->name(); }

        [[nodiscard]] const CursorBase &cursor() const { return *_cursor; }

    private:
        std::shared_ptr<const body_type> _body;
        std::unique_ptr<cursor_type> _cursor;
    };

    namespace detail {
        template<typename T>
        struct call_signature;

        template<typename C, typename R, typename... Args>
        struct call_signature<R (C::*)(Args...)> {
            using type = R(Args...);
        };

        template<typename C, typename R, typename... Args>
        struct call_signature<R (C::*)(Args...) const> {
            using type = R(Args...);
        };

        template<typename C, typename R, typename... Args>
        struct call_signature<R (C::*)(Args...) noexcept> {
            using type = R(Args...);
        };

        template<typename C, typename R, typename... Args>
        struct call_signature<R (C::*)(Args...) const noexcept> {
            using type = R(Args...);
        };

        template<typename F>
        concept HasCallSignature = requires { typename call_signature<decltype(&std::decay_t<F>::operator())>::type; };
    } // namespace detail

    /**
     * Wrap any callable with an explicit signature, e.g. wrap<double(double, int)>(model, "discount").
     */
    template<typename Signature, typename F>
    [[nodiscard]] Imagined<Signature> wrap(F &&fn, std::string name = {}) {
        return Imagined<Signature>(std::function<Signature>(std::forward<F>(fn)), std::move(name));
    }

    template<typename R, typename... Args>
    [[nodiscard]] Imagined<R(Args...)> wrap(R (*fn)(Args...), std::string name = {}) {
        return Imagined<R(Args...)>(fn, std::move(name));
    }

    /**
     * Deduces the signature of a lambda or functor with a single, non-template call operator.
     */
    template<detail::HasCallSignature F>
    [[nodiscard]] auto wrap(F &&fn, std::string name = {}) {
        using signature = typename detail::call_signature<decltype(&std::decay_t<F>::operator())>::type;
        return Imagined<signature>(std::forward<F>(fn), std::move(name));
    }

    /**
     * Member functions take the instance as an explicit first argument, so overrides are specific to an instance:
     * @code
     * auto a = wrap(&Account::balance);
     * auto scope = a.at(&account, 2024).imagine(0.0).scoped();
     * @endcode
     */
    template<typename R, typename C, typename... Args>
    [[nodiscard]] Imagined<R(C *, Args...)> wrap(R (C::*fn)(Args...), std::string name = {}) {
        return Imagined<R(C *, Args...)>(
            [fn](C *self, Args... args) -> R { return (self->*fn)(std::forward<Args>(args)...); }, std::move(name));
    }

    template<typename R, typename C, typename... Args>
    [[nodiscard]] Imagined<R(const C *, Args...)> wrap(R (C::*fn)(Args...) const, std::string name = {}) {
        return Imagined<R(const C *, Args...)>(
            [fn](const C *self, Args... args) -> R { return (self->*fn)(std::forward<Args>(args)...); },
            std::move(name));
    }

} // namespace imagine
