#pragma once

#include <imagine/runtime/configuration.h>
#include <imagine/runtime/observers/imagination_observer.h>
#include <imagine/types/activation_component.h>
#include <imagine/types/cursor.h>
#include <imagine/types/scene.h>
#include <imagine/util/errors.h>
#include <imagine/util/scope.h>

#include <concepts>
#include <tuple>
#include <type_traits>
#include <vector>

namespace imagine {

    namespace detail {
        /**
         * The single target activation proper. Activation<Sig> is a handle over one of these so that copies of the
         * handle, and groups built from it, all drive the same entry state.
         *
         * The prior heads are kept as a stack, one per open entry, so the same activation may be re-entered both
         * sequentially and nested inside itself.
         */
        template<typename Signature> class ActivationLeaf;

        template<typename R, typename... Args>
        class ActivationLeaf<R(Args...)> final : public ActivationComponent {
        public:
            using cursor_type = Cursor<R(Args...)>;
            using scene_type = Scene<R(Args...)>;
            using scene_ptr = typename scene_type::ptr;

            ActivationLeaf(cursor_type *cursor, scene_ptr head) : _cursor{cursor}, _head{std::move(head)} {}

            void enter() override {
                auto &observers{ObserverRegistry::instance()};
                observers.notify_before_enter(*_cursor);
                _priors.push_back(_cursor->active());
                _cursor->install(_head, this);
                auto rollback{make_scope_exit([this] {
                    _cursor->restore(_priors.back());
                    _priors.pop_back();
                })};
                observers.notify_after_enter(*_cursor);
                rollback.release();
            }

            void exit() override {
                if (_priors.empty()) {
                    throw_error<ImagineError>("Cannot exit an activation of '{}' that has not been entered",
                                              _cursor->name());
                }
                auto &observers{ObserverRegistry::instance()};
                const bool balanced{_cursor->top_owner() == this};
                auto prior{std::move(_priors.back())};
                _priors.pop_back();
                {
                    // The prior is restored even when an observer objects to the exit
                    auto release{make_scope_exit([this, &prior] { _cursor->restore(std::move(prior)); })};
                    observers.notify_before_exit(*_cursor);
                }
                observers.notify_after_exit(*_cursor);
                if (!balanced && ImagineConfiguration::instance().check_balance()) {
                    observers.notify_unbalanced_exit(*_cursor);
                    throw_error<UnbalancedActivationError>(
                        "Activation of '{}' exited out of order, it was not the most recently entered activation "
                        "for this target", _cursor->name());
                }
            }

            [[nodiscard]] s_ptr rebase() const override {
                return std::make_shared<ActivationLeaf>(_cursor, rebased_head());
            }

            void append_leaves(std::vector<ptr> &leaves) override { leaves.push_back(this); }

            [[nodiscard]] cursor_type *cursor() const { return _cursor; }

            [[nodiscard]] const scene_ptr &head() const { return _head; }

            [[nodiscard]] bool is_entered() const { return !_priors.empty(); }

            /**
             * The scenes of this chain, root-most first, re-linked on top of the target's active head.
             */
            [[nodiscard]] scene_ptr rebased_head() const {
                const auto &base{_cursor->active()};
                if (!base) { return _head; }

                std::vector<const scene_type *> scenes;
                for (auto p = _head.get(); p != nullptr; p = p->parent().get()) { scenes.push_back(p); }

                scene_ptr top{base};
                for (auto it = scenes.rbegin(); it != scenes.rend(); ++it) { top = (*it)->with_parent(std::move(top)); }
                ObserverRegistry::instance().notify_rebase(*_cursor, scenes.size());
                return top;
            }

        private:
            cursor_type *_cursor;
            scene_ptr _head;
            std::vector<scene_ptr> _priors;
        };
    } // namespace detail

    /**
     * Argument types used to identify a point must support ==, the guard compares the captured point against the
     * call's arguments element by element.
     */
    template<typename... Args>
    concept PointComparable = (std::equality_comparable<std::decay_t<Args>> && ...);

    /**
     * @brief A frozen point in the input space, waiting for the value to imagine there.
     *
     * The point remembers the chain that was active (or that its activation held) when it was created. It can be
     * consumed more than once:
     * @code
     * auto at_zero = f.at(0);
     * for (int i : {1, 2, 3}) {
     *     auto scope = at_zero.imagine(i).scoped();
     *     ...
     * }
     * @endcode
     */
    template<typename R, typename... Args>
    class Point<R(Args...)> {
    public:
        using cursor_type = Cursor<R(Args...)>;
        using scene_type = Scene<R(Args...)>;
        using scene_ptr = typename scene_type::ptr;
        using key_type = std::tuple<std::decay_t<Args>...>;

        Point(cursor_type *cursor, scene_ptr base, key_type point)
            : _cursor{cursor}, _base{std::move(base)}, _point{std::move(point)} {}

        /**
         * A new activation whose head maps exactly this point to value. Optional parameters compare by engaged
         * state, so an omitted (nullopt) argument is a different point from one given its default value.
         */
        [[nodiscard]] Activation<R(Args...)> imagine(R value) const;

        [[nodiscard]] const key_type &point() const { return _point; }

    private:
        cursor_type *_cursor;
        scene_ptr _base;
        key_type _point;
    };

    /**
     * @brief Like a Point but the guard is any predicate over the arguments, e.g. a range.
     */
    template<typename R, typename... Args>
    class Region<R(Args...)> {
    public:
        using cursor_type = Cursor<R(Args...)>;
        using scene_type = Scene<R(Args...)>;
        using scene_ptr = typename scene_type::ptr;
        using guard_type = typename scene_type::guard_type;

        Region(cursor_type *cursor, scene_ptr base, guard_type guard)
            : _cursor{cursor}, _base{std::move(base)}, _guard{std::move(guard)} {}

        [[nodiscard]] Activation<R(Args...)> imagine(R value) const;

    private:
        cursor_type *_cursor;
        scene_ptr _base;
        guard_type _guard;
    };

    /**
     * @brief A scoped substitution for one wrapped callable.
     *
     * Building activations is functional: at(), where() and imagine() return new activations whose chains extend
     * this one, this activation is never changed by them. Entering makes the chain the active one for the target and
     * remembers what was active before, exiting restores exactly that. The activation may be entered again in a later,
     * unrelated scope.
     *
     * This is a handle, copies share the same entry state. The wrapped callable must outlive it.
     */
    template<typename R, typename... Args>
    class Activation<R(Args...)> {
    public:
        using signature = R(Args...);
        using leaf_type = detail::ActivationLeaf<signature>;
        using cursor_type = Cursor<signature>;
        using scene_type = Scene<signature>;
        using scene_ptr = typename scene_type::ptr;
        using guard_type = typename scene_type::guard_type;

        Activation(cursor_type *cursor, scene_ptr head)
            : _leaf{std::make_shared<leaf_type>(cursor, std::move(head))} {}

        [[nodiscard]] Point<signature> at(std::decay_t<Args>... args) const requires PointComparable<Args...> {
            return Point<signature>(_leaf->cursor(), _leaf->head(), std::make_tuple(std::move(args)...));
        }

        [[nodiscard]] Region<signature> where(guard_type guard) const {
            return Region<signature>(_leaf->cursor(), _leaf->head(), std::move(guard));
        }

        /**
         * Extend this chain with an unconditional override.
         */
        [[nodiscard]] Activation imagine(R value) const {
            return Activation(_leaf->cursor(), std::make_shared<scene_type>(_leaf->head(), guard_type{},
                                                                                  std::move(value)));
        }

        void enter() { _leaf->enter(); }

        void exit() { _leaf->exit(); }

        [[nodiscard]] ActivationScope scoped() const { return ActivationScope{component()}; }

        /**
         * This chain applied on top of whatever is active for the target right now. Neither this activation nor the
         * active chain is modified.
         */
        [[nodiscard]] Activation rebase() const { return Activation(_leaf->cursor(), _leaf->rebased_head()); }

        template<ActivationLike T>
        [[nodiscard]] ActivationGroup combine(const T &other) const {
            return ActivationGroup(std::vector<ActivationComponent::s_ptr>{component(), other.component()});
        }

        [[nodiscard]] const scene_ptr &head() const { return _leaf->head(); }

        /**
         * The number of scenes in the chain.
         */
        [[nodiscard]] std::size_t size() const { return scene_type::length(_leaf->head().get()); }

        [[nodiscard]] bool is_entered() const { return _leaf->is_entered(); }

        [[nodiscard]] ActivationComponent::s_ptr component() const { return _leaf; }

    private:
        std::shared_ptr<leaf_type> _leaf;
    };

    template<typename R, typename... Args>
    Activation<R(Args...)> Point<R(Args...)>::imagine(R value) const {
        auto guard = [point = _point](const std::decay_t<Args> &...args) {
            return point == std::tie(args...);
        };
        return Activation<R(Args...)>(_cursor, std::make_shared<scene_type>(_base, std::move(guard),
                                                                                  std::move(value)));
    }

    template<typename R, typename... Args>
    Activation<R(Args...)> Region<R(Args...)>::imagine(R value) const {
        return Activation<R(Args...)>(_cursor, std::make_shared<scene_type>(_base, _guard, std::move(value)));
    }

} // namespace imagine
