#include <imagine/runtime/observers/imagination_trace.h>
#include <imagine/types/cursor.h>

#include <fmt/format.h>
#include <iostream>

namespace imagine {

    bool ImaginationTrace::_use_logger = true;

    ImaginationTrace::ImaginationTrace(const std::optional<std::string> &filter, bool enter, bool exit, bool rebase)
        : _filter(filter), _enter(enter), _exit(exit), _rebase(rebase) {
    }

    void ImaginationTrace::set_use_logger(bool value) {
        _use_logger = value;
    }

    void ImaginationTrace::print(const std::string &msg) const {
        if (_use_logger) {
            std::cerr << msg << std::endl;
        } else {
            std::cout << msg << std::endl;
        }
    }

    void ImaginationTrace::_print_cursor(const CursorBase &cursor, const std::string &msg) const {
        print(fmt::format("[{}#{}] depth={} scenes={} {}", cursor.name(), cursor.id(), cursor.depth(),
                          cursor.active_length(), msg));
    }

    bool ImaginationTrace::_should_log(const CursorBase &cursor) const {
        if (!_filter.has_value()) {
            return true;
        }
        return cursor.name().find(_filter.value()) != std::string::npos;
    }

    void ImaginationTrace::on_before_enter(const CursorBase &cursor) {
        if (_enter && _should_log(cursor)) {
            _print_cursor(cursor, ">> Entering");
        }
    }

    void ImaginationTrace::on_after_enter(const CursorBase &cursor) {
        if (_enter && _should_log(cursor)) {
            _print_cursor(cursor, "<< Entered");
        }
    }

    void ImaginationTrace::on_before_exit(const CursorBase &cursor) {
        if (_exit && _should_log(cursor)) {
            _print_cursor(cursor, ">> Exiting");
        }
    }

    void ImaginationTrace::on_after_exit(const CursorBase &cursor) {
        if (_exit && _should_log(cursor)) {
            _print_cursor(cursor, "<< Exited");
        }
    }

    void ImaginationTrace::on_rebase(const CursorBase &cursor, std::size_t rebased_length) {
        if (_rebase && _should_log(cursor)) {
            _print_cursor(cursor, fmt::format("Rebased {} scene(s) onto the active chain", rebased_length));
        }
    }

    void ImaginationTrace::on_unbalanced_exit(const CursorBase &cursor) {
        // Always reported, whatever the event switches say
        if (_should_log(cursor)) {
            _print_cursor(cursor, "!! Exit out of order, the restored chain may not be what the caller intended");
        }
    }

} // namespace imagine
