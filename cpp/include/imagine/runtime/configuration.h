#pragma once

#include <imagine/imagine_base.h>

#include <optional>
#include <string>

namespace imagine {

    /**
     * @brief Process wide switches for the engine.
     *
     * The initial values are read once from the environment:
     *
     * * IMAGINE_CHECK_BALANCE - "1" enables, "0" disables detection of out-of-order exits. When unset this follows
     *   the build type (enabled unless NDEBUG is defined).
     * * IMAGINE_TRACE - when set (and not "0") an ImaginationTrace observer is registered on start-up.
     * * IMAGINE_TRACE_FILTER - restricts the start-up trace to targets whose name contains this text.
     *
     * Every value can be changed afterwards through the setters. Like the rest of the engine this is not
     * synchronised, configure it before activations are used from the driving thread.
     */
    class IMAGINE_EXPORT ImagineConfiguration {
    public:
        static ImagineConfiguration &instance();

        ImagineConfiguration(const ImagineConfiguration &) = delete;
        ImagineConfiguration &operator=(const ImagineConfiguration &) = delete;

        [[nodiscard]] bool check_balance() const;

        void set_check_balance(bool value);

        [[nodiscard]] bool trace() const;

        void set_trace(bool value);

        [[nodiscard]] const std::optional<std::string> &trace_filter() const;

        void set_trace_filter(std::optional<std::string> filter);

        /**
         * Re-read the environment, discarding programmatic changes.
         */
        void reload();

    private:
        ImagineConfiguration();

        bool _check_balance{false};
        bool _trace{false};
        std::optional<std::string> _trace_filter;
    };

} // namespace imagine
