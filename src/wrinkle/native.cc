#include "native.hh"

#include <wrinkle/macros.hh>

#include <mutex>

#ifdef WR_COMPILER_MSVC
#include <DbgHelp.h>
#include <Windows.h>

#pragma comment(lib, "dbghelp.lib")
#endif

#ifdef WR_COMPILER_POSIX
#include <cxxabi.h>

#include <cstdlib>
#endif

std::string wr::demangle_symbol(std::string_view symbol)
{
    // UnDecorateSymbolName is documented as single-threaded
    // __cxa_demangle thread-safety is not guaranteed
    static std::mutex demangle_mutex;
    std::lock_guard<std::mutex> lock(demangle_mutex);

    // both APIs want a null-terminated string
    auto const symbol_nt = std::string(symbol);

#ifdef WR_COMPILER_MSVC
    constexpr DWORD buffer_size = 4096;
    char buffer[buffer_size];

    DWORD const result = UnDecorateSymbolName(symbol_nt.c_str(), buffer, buffer_size, UNDNAME_COMPLETE);
    if (result > 0)
        return std::string(buffer, result);

    return symbol_nt;

#elif defined(WR_COMPILER_POSIX)
    int status = 0;
    char* demangled = abi::__cxa_demangle(symbol_nt.c_str(), nullptr, nullptr, &status);

    if (status == 0 && demangled != nullptr)
    {
        std::string result = demangled;
        std::free(demangled);
        return result;
    }

    if (demangled != nullptr)
        std::free(demangled);
    return symbol_nt;

#else
    return symbol_nt;
#endif
}
