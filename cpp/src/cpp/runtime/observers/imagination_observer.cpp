#include <imagine/runtime/configuration.h>
#include <imagine/runtime/observers/imagination_observer.h>
#include <imagine/runtime/observers/imagination_trace.h>

#include <algorithm>

namespace imagine {

    ObserverRegistry &ObserverRegistry::instance() {
        static ObserverRegistry registry;
        return registry;
    }

    ObserverRegistry::ObserverRegistry() {
        const auto &configuration = ImagineConfiguration::instance();
        if (configuration.trace()) { _observers.push_back(std::make_shared<ImaginationTrace>(configuration.trace_filter())); }
    }

    void ObserverRegistry::add(ImaginationObserver::s_ptr observer) {
        if (observer == nullptr) { return; }
        if (std::find(_observers.begin(), _observers.end(), observer) == _observers.end()) {
            _observers.push_back(std::move(observer));
        }
    }

    void ObserverRegistry::remove(const ImaginationObserver::s_ptr &observer) {
        std::erase(_observers, observer);
    }

    void ObserverRegistry::clear() { _observers.clear(); }

    bool ObserverRegistry::empty() const { return _observers.empty(); }

    std::size_t ObserverRegistry::size() const { return _observers.size(); }

    std::vector<ImaginationObserver::s_ptr> ObserverRegistry::snapshot() const {
        // Hooks may add or remove observers, the change takes effect from the next notification
        return _observers;
    }

    void ObserverRegistry::notify_before_enter(const CursorBase &cursor) const {
        for (const auto &observer : snapshot()) { observer->on_before_enter(cursor); }
    }

    void ObserverRegistry::notify_after_enter(const CursorBase &cursor) const {
        for (const auto &observer : snapshot()) { observer->on_after_enter(cursor); }
    }

    void ObserverRegistry::notify_before_exit(const CursorBase &cursor) const {
        for (const auto &observer : snapshot()) { observer->on_before_exit(cursor); }
    }

    void ObserverRegistry::notify_after_exit(const CursorBase &cursor) const {
        for (const auto &observer : snapshot()) { observer->on_after_exit(cursor); }
    }

    void ObserverRegistry::notify_rebase(const CursorBase &cursor, std::size_t rebased_length) const {
        for (const auto &observer : snapshot()) { observer->on_rebase(cursor, rebased_length); }
    }

    void ObserverRegistry::notify_unbalanced_exit(const CursorBase &cursor) const {
        for (const auto &observer : snapshot()) { observer->on_unbalanced_exit(cursor); }
    }

} // namespace imagine
