#pragma once

#include <string>
#include <string_view>

namespace wr
{
/// Demangle a C++ symbol name into a human-readable form.
///   - MSVC: UnDecorateSymbolName from dbghelp
///   - GCC/Clang: __cxa_demangle
///   - Other: returns the input unchanged
///
/// Returns the original symbol if demangling fails (already-readable names such as
/// std::source_location::function_name() on GCC are passed through unchanged).
///
/// Usage:
///   auto name = wr::demangle_symbol("_Z3fooi"); // "foo(int)"
[[nodiscard]] std::string demangle_symbol(std::string_view symbol);
} // namespace wr
