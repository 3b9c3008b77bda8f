#pragma once

#include <imagine/imagine_base.h>
#include <imagine/types/scene.h>

#include <string>
#include <vector>

namespace imagine {

    /**
     * @brief Type independent view of a cursor.
     *
     * Observers and error messages only need to know which target a transition belongs to and how deep its
     * activation stack is, so they work against this base rather than the signature specific Cursor.
     */
    class IMAGINE_EXPORT CursorBase {
    public:
        explicit CursorBase(std::string name);

        virtual ~CursorBase() = default;

        CursorBase(const CursorBase &) = delete;
        CursorBase &operator=(const CursorBase &) = delete;

        /**
         * The display name of the wrapped callable, generated from the id when none was supplied.
         */
        [[nodiscard]] const std::string &name() const;

        /**
         * Unique for the life-time of the process.
         */
        [[nodiscard]] std::size_t id() const;

        /**
         * The number of activations entered against this cursor that have not yet exited.
         */
        [[nodiscard]] virtual std::size_t depth() const = 0;

        /**
         * The number of scenes reachable from the active head, zero when nothing is active.
         */
        [[nodiscard]] virtual std::size_t active_length() const = 0;

        /**
         * The activation that installed the current head, or nullptr when nothing is active.
         */
        [[nodiscard]] virtual const ActivationComponent *top_owner() const = 0;

    private:
        std::size_t _id;
        std::string _name;
    };

    /**
     * @brief The mutable pointer to the chain currently in effect for one wrapped callable.
     *
     * Only activations move the cursor: install() on entry and restore() on exit. Next to the active head the cursor
     * keeps one frame per open activation holding the head that was active before it, this is what look-back
     * evaluation reads. Frames are appended on install and truncated on restore.
     *
     * NOTE: No synchronisation is performed. Driving activations for the same target from more than one thread
     *       corrupts the LIFO discipline; callers must confine a target to one thread or lock externally.
     */
    template<typename R, typename... Args>
    class Cursor<R(Args...)> final : public CursorBase {
    public:
        using scene_type = Scene<R(Args...)>;
        using scene_ptr = typename scene_type::ptr;

        struct Frame {
            scene_ptr prior;
            const ActivationComponent *owner;
        };

        explicit Cursor(std::string name) : CursorBase(std::move(name)) {}

        [[nodiscard]] const scene_ptr &active() const { return _active; }

        void install(scene_ptr head, const ActivationComponent *owner) {
            _history.push_back(Frame{_active, owner});
            _active = std::move(head);
        }

        void restore(scene_ptr prior) {
            _active = std::move(prior);
            if (!_history.empty()) { _history.pop_back(); }
        }

        /**
         * The head as it was before the n most recently entered, still open, activations were entered.
         * n == 0 is the active head, n >= depth() is the head before the outermost open activation.
         */
        [[nodiscard]] scene_ptr looking_back(std::size_t n) const {
            if (n == 0) { return _active; }
            if (n >= _history.size()) { return _history.empty() ? _active : _history.front().prior; }
            return _history[_history.size() - n].prior;
        }

        [[nodiscard]] std::size_t depth() const override { return _history.size(); }

        [[nodiscard]] std::size_t active_length() const override { return scene_type::length(_active.get()); }

        [[nodiscard]] const ActivationComponent *top_owner() const override {
            return _history.empty() ? nullptr : _history.back().owner;
        }

    private:
        scene_ptr _active;
        std::vector<Frame> _history;
    };

} // namespace imagine
