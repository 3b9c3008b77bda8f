#pragma once

#include <imagine/imagine_base.h>

#include <functional>
#include <memory>
#include <type_traits>

namespace imagine {

    /**
     * @brief One override fact: a guard, a value and the scene beneath it.
     *
     * Scenes form persistent singly-linked chains. A scene and its parent pointer never change after construction, so
     * extending a chain (prepending a new head) never alters what any other chain sharing the same suffix sees.
     * Scenes are shared between activations, look-back frames and derived chains through std::shared_ptr, since a
     * chain only grows by prepending no cycles can form.
     *
     * A scene without a guard applies to every call.
     */
    template<typename R, typename... Args>
    class Scene<R(Args...)> {
    public:
        static_assert(!std::is_void_v<R>, "An imagined callable must produce a value");
        static_assert(!std::is_reference_v<R>, "An imagined callable must return by value");

        using ptr = std::shared_ptr<const Scene>;
        using value_type = R;
        using guard_type = std::function<bool(const std::decay_t<Args> &...)>;

        Scene(ptr parent, guard_type guard, R value)
            : _parent{std::move(parent)}, _guard{std::move(guard)}, _value{std::move(value)} {}

        [[nodiscard]] bool applies(const std::decay_t<Args> &...args) const { return !_guard || _guard(args...); }

        [[nodiscard]] bool is_unconditional() const { return !_guard; }

        [[nodiscard]] const R &value() const { return _value; }

        [[nodiscard]] const ptr &parent() const { return _parent; }

        /**
         * A copy of this scene (same guard and value) hanging off a different parent.
         */
        [[nodiscard]] ptr with_parent(ptr parent) const {
            return std::make_shared<Scene>(std::move(parent), _guard, _value);
        }

        /**
         * Walk from head towards the root and return the first scene that applies to the arguments.
         */
        static const Scene *find(const Scene *head, const std::decay_t<Args> &...args) {
            for (auto p = head; p != nullptr; p = p->_parent.get()) {
                if (p->applies(args...)) { return p; }
            }
            return nullptr;
        }

        static std::size_t length(const Scene *head) {
            std::size_t count{0};
            for (auto p = head; p != nullptr; p = p->_parent.get()) { ++count; }
            return count;
        }

    private:
        ptr _parent;
        guard_type _guard;
        R _value;
    };

    /**
     * The wrapped computation is only reached when no scene in the chain applies.
     */
    template<typename R, typename... Args, typename Body>
    R resolve(const Scene<R(Args...)> *head, const Body &body, std::type_identity_t<Args>... args) {
        if (auto scene = Scene<R(Args...)>::find(head, args...); scene != nullptr) { return scene->value(); }
        return body(std::forward<Args>(args)...);
    }

} // namespace imagine
