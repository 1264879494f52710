#include "qf/console.hpp"

#include <cstdio>
#include <mutex>
#include <print>

namespace qf {

static std::mutex g_print_mtx;

void console_println(std::string_view line)
{
    std::lock_guard<std::mutex> lk(g_print_mtx);
    std::println("{}", line);
    std::fflush(stdout);
}

void console_eprintln(std::string_view line)
{
    std::lock_guard<std::mutex> lk(g_print_mtx);
    std::println(stderr, "{}", line);
}

} // namespace qf
