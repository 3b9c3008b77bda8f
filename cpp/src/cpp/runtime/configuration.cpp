#include <imagine/runtime/configuration.h>

#include <cstdlib>
#include <string_view>

namespace imagine {

    namespace {
        std::optional<bool> env_flag(const char *name) {
            const char *value = std::getenv(name);
            if (value == nullptr) { return std::nullopt; }
            std::string_view text{value};
            return !(text.empty() || text == "0" || text == "false" || text == "off");
        }

#ifdef NDEBUG
        constexpr bool DEFAULT_CHECK_BALANCE = false;
#else
        constexpr bool DEFAULT_CHECK_BALANCE = true;
#endif
    } // namespace

    ImagineConfiguration &ImagineConfiguration::instance() {
        static ImagineConfiguration configuration;
        return configuration;
    }

    ImagineConfiguration::ImagineConfiguration() { reload(); }

    bool ImagineConfiguration::check_balance() const { return _check_balance; }

    void ImagineConfiguration::set_check_balance(bool value) { _check_balance = value; }

    bool ImagineConfiguration::trace() const { return _trace; }

    void ImagineConfiguration::set_trace(bool value) { _trace = value; }

    const std::optional<std::string> &ImagineConfiguration::trace_filter() const { return _trace_filter; }

    void ImagineConfiguration::set_trace_filter(std::optional<std::string> filter) { _trace_filter = std::move(filter); }

    void ImagineConfiguration::reload() {
        _check_balance = env_flag("IMAGINE_CHECK_BALANCE").value_or(DEFAULT_CHECK_BALANCE);
        _trace = env_flag("IMAGINE_TRACE").value_or(false);
        const char *filter = std::getenv("IMAGINE_TRACE_FILTER");
        _trace_filter = filter != nullptr && *filter != '\0' ? std::optional<std::string>{filter} : std::nullopt;
    }

} // namespace imagine
