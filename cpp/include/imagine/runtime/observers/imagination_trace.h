#pragma once

#include <imagine/runtime/observers/imagination_observer.h>

#include <optional>
#include <string>

namespace imagine {

    /**
     * @brief Logs out every activation transition.
     *
     * This is voluminous but can be helpful tracing down an override that is, or is not, in effect when expected.
     * Each line carries the target name and id, the activation depth and the length of the active chain.
     */
    class IMAGINE_EXPORT ImaginationTrace : public ImaginationObserver {
    public:
        /**
         * @param filter Used to restrict which targets to report (substring match on the target name)
         * @param enter Log enter related events
         * @param exit Log exit related events
         * @param rebase Log rebase events
         */
        explicit ImaginationTrace(const std::optional<std::string> &filter = std::nullopt,
                                  bool enter = true, bool exit = true, bool rebase = true);

        void on_before_enter(const CursorBase &cursor) override;
        void on_after_enter(const CursorBase &cursor) override;
        void on_before_exit(const CursorBase &cursor) override;
        void on_after_exit(const CursorBase &cursor) override;
        void on_rebase(const CursorBase &cursor, std::size_t rebased_length) override;
        void on_unbalanced_exit(const CursorBase &cursor) override;

        // Static configuration
        static void set_use_logger(bool value);

    protected:
        /**
         * Writes a finished line, stderr when using the logger otherwise stdout.
         */
        virtual void print(const std::string &msg) const;

    private:
        std::optional<std::string> _filter;
        bool _enter;
        bool _exit;
        bool _rebase;

        static bool _use_logger;

        void _print_cursor(const CursorBase &cursor, const std::string &msg) const;
        [[nodiscard]] bool _should_log(const CursorBase &cursor) const;
    };

} // namespace imagine
