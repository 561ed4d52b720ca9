#include "error.hh"

#include <wrinkle/native.hh>

#include <format>
#include <utility>

char const* wr::to_string(error_kind kind)
{
    switch (kind)
    {
    case error_kind::out_of_range:
        return "out_of_range";
    case error_kind::illegal_cursor_state:
        return "illegal_cursor_state";
    case error_kind::stale_cursor:
        return "stale_cursor";
    case error_kind::exhausted:
        return "exhausted";
    }

    WR_ASSERT(false, "unknown error_kind");
    return "<unknown>";
}

wr::sequence_error::sequence_error(error_kind kind, isize index, isize size, std::string message, wr::source_location site)
  : _kind(kind), _index(index), _size(size), _message(std::move(message)), _site(site)
{
}

std::string wr::sequence_error::to_string() const
{
    std::string result;

    result += "error: ";
    result += wr::to_string(_kind);
    result += ": ";
    result += _message;
    result += "\n";

    result += "  at ";
    result += _site.file_name();
    result += ":";
    result += std::to_string(_site.line());
    result += " - ";
    result += wr::demangle_symbol(_site.function_name());
    result += "\n";

    return result;
}

void wr::impl::throw_element_index_out_of_range(isize index, isize size, wr::source_location site)
{
    throw sequence_error(error_kind::out_of_range, index, size, std::format("index {} out of range [0, {})", index, size), site);
}

void wr::impl::throw_position_out_of_range(isize index, isize size, wr::source_location site)
{
    throw sequence_error(error_kind::out_of_range, index, size, std::format("position {} out of range [0, {}]", index, size), site);
}

void wr::impl::throw_range_out_of_range(isize from, isize to, isize size, wr::source_location site)
{
    // report the first bound that breaks 0 <= from <= to <= size
    auto const offending = (from < 0 || from > to) ? from : to;
    throw sequence_error(error_kind::out_of_range, offending, size,
                         std::format("range [{}, {}) out of range [0, {}]", from, to, size), site);
}

void wr::impl::throw_illegal_cursor_state(isize index, isize size, wr::source_location site)
{
    throw sequence_error(error_kind::illegal_cursor_state, index, size,
                         "no element to modify: call next() or previous() first", site);
}

void wr::impl::throw_stale_cursor(isize index, isize size, wr::source_location site)
{
    throw sequence_error(error_kind::stale_cursor, index, size, "list was modified outside of this cursor", site);
}

void wr::impl::throw_exhausted(isize index, isize size, bool forward, wr::source_location site)
{
    throw sequence_error(error_kind::exhausted, index, size,
                         std::format("no {} element at position {} (size {})", forward ? "next" : "previous", index, size), site);
}
