#pragma once

#include <imagine/imagine_base.h>

#include <memory>
#include <vector>

namespace imagine {

    /**
     * @brief Hooks called around every cursor transition.
     *
     * Observers are told which target moved through its CursorBase; depth() and active_length() reflect the state at
     * the time of the call. Observers must not enter or exit activations from inside a hook. A hook may add or remove
     * observers; the registry change applies from the next notification on.
     */
    struct IMAGINE_EXPORT ImaginationObserver {
        using ptr = ImaginationObserver *;
        using s_ptr = std::shared_ptr<ImaginationObserver>;

        virtual ~ImaginationObserver() = default;

        virtual void on_before_enter(const CursorBase &) {
        };

        virtual void on_after_enter(const CursorBase &) {
        };

        virtual void on_before_exit(const CursorBase &) {
        };

        virtual void on_after_exit(const CursorBase &) {
        };

        /**
         * Called when a chain of rebased_length scenes has been re-parented onto the target's active chain.
         */
        virtual void on_rebase(const CursorBase &, std::size_t /*rebased_length*/) {
        };

        /**
         * Called when balance checking found an exit that was not the most recently entered activation.
         */
        virtual void on_unbalanced_exit(const CursorBase &) {
        };
    };

    /**
     * @brief The process wide set of observers notified by every activation.
     *
     * When ImagineConfiguration::trace() is set at start-up an ImaginationTrace is registered on first use.
     */
    class IMAGINE_EXPORT ObserverRegistry {
    public:
        static ObserverRegistry &instance();

        ObserverRegistry(const ObserverRegistry &) = delete;
        ObserverRegistry &operator=(const ObserverRegistry &) = delete;

        void add(ImaginationObserver::s_ptr observer);

        void remove(const ImaginationObserver::s_ptr &observer);

        void clear();

        [[nodiscard]] bool empty() const;

        [[nodiscard]] std::size_t size() const;

        void notify_before_enter(const CursorBase &cursor) const;

        void notify_after_enter(const CursorBase &cursor) const;

        void notify_before_exit(const CursorBase &cursor) const;

        void notify_after_exit(const CursorBase &cursor) const;

        void notify_rebase(const CursorBase &cursor, std::size_t rebased_length) const;

        void notify_unbalanced_exit(const CursorBase &cursor) const;

    private:
        ObserverRegistry();

        [[nodiscard]] std::vector<ImaginationObserver::s_ptr> snapshot() const;

        std::vector<ImaginationObserver::s_ptr> _observers;
    };

} // namespace imagine
