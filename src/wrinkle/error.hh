#pragma once

#include <wrinkle/assert.hh>
#include <wrinkle/fwd.hh>

#include <exception>
#include <string>

/// Caller-facing contract violations of wr::wrinkle_list and its cursor.
/// None of them is transient: they all indicate misuse and are never recovered internally.
enum class wr::error_kind
{
    // index outside [0, size) for element access or outside [0, size] for insertion / cursor creation
    out_of_range,
    // cursor set_last/remove_last without a preceding next()/previous()
    illegal_cursor_state,
    // the list was structurally modified behind the cursor's back
    stale_cursor,
    // cursor next()/previous() without an element in that direction
    exhausted,
};

namespace wr
{
[[nodiscard]] char const* to_string(error_kind kind);
}

/// Exception thrown for all error_kind violations.
/// Carries the offending index and the list size at the time of the call (-1 where not meaningful)
/// and the source location of the library call that detected the violation.
///
/// The container is unchanged when this is thrown: every operation validates before it mutates.
struct wr::sequence_error : std::exception
{
public:
    sequence_error(error_kind kind, isize index, isize size, std::string message, wr::source_location site);

    [[nodiscard]] error_kind kind() const { return _kind; }
    [[nodiscard]] isize index() const { return _index; }
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] wr::source_location site() const { return _site; }
    [[nodiscard]] std::string const& message() const { return _message; }

    [[nodiscard]] char const* what() const noexcept override { return _message.c_str(); }

    /// Multi-line developer-facing rendering:
    ///   error: stale_cursor: list was modified outside of this cursor
    ///     at .../wrinkle_list.hh:412 - wr::wrinkle_list<int>::cursor::next()
    [[nodiscard]] std::string to_string() const;

private:
    error_kind _kind;
    isize _index = -1;
    isize _size = -1;
    std::string _message;
    wr::source_location _site;
};

// =========================================================================================================
// Throwing helpers
// =========================================================================================================
// Out-of-line and cold so that the hot paths only contain a compare and a never-taken call.

namespace wr::impl
{
[[noreturn]] WR_COLD_FUNC void throw_element_index_out_of_range(isize index, isize size, wr::source_location site);
[[noreturn]] WR_COLD_FUNC void throw_position_out_of_range(isize index, isize size, wr::source_location site);
[[noreturn]] WR_COLD_FUNC void throw_range_out_of_range(isize from, isize to, isize size, wr::source_location site);
[[noreturn]] WR_COLD_FUNC void throw_illegal_cursor_state(isize index, isize size, wr::source_location site);
[[noreturn]] WR_COLD_FUNC void throw_stale_cursor(isize index, isize size, wr::source_location site);
[[noreturn]] WR_COLD_FUNC void throw_exhausted(isize index, isize size, bool forward, wr::source_location site);

/// 0 <= index < size
WR_FORCE_INLINE void check_element_index(isize index, isize size, wr::source_location site = wr::source_location::current())
{
    if (index < 0 || index >= size) [[unlikely]]
        throw_element_index_out_of_range(index, size, site);
}

/// 0 <= index <= size
WR_FORCE_INLINE void check_position(isize index, isize size, wr::source_location site = wr::source_location::current())
{
    if (index < 0 || index > size) [[unlikely]]
        throw_position_out_of_range(index, size, site);
}
} // namespace wr::impl
