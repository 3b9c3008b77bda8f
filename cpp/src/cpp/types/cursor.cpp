#include <imagine/types/cursor.h>

namespace imagine {

    namespace {
        std::size_t next_cursor_id() {
            static std::size_t id{0};
            return ++id;
        }
    } // namespace

    CursorBase::CursorBase(std::string name) : _id{next_cursor_id()}, _name{std::move(name)} {
        if (_name.empty()) { _name = fmt::format("imagined_{}", _id); }
    }

    const std::string &CursorBase::name() const { return _name; }

    std::size_t CursorBase::id() const { return _id; }

} // namespace imagine
