#include <unistd.h>

#include <cstdlib>
#include <exception>

#include <unistdx/base/log_message>
#include <unistdx/ipc/process>
#include <unistdx/ipc/signal>
#include <unistdx/util/backtrace>

#include <topology/core/error_handler.hh>

namespace {

    template <class ... Args>
    inline void
    message(const Args& ... args) {
        sys::log_message("error", args ...);
    }

    [[noreturn]] void
    on_terminate() noexcept {
        topo::print_error();
    }

}

void topo::print_backtrace(int sig) noexcept {
    sys::backtrace(STDERR_FILENO);
    std::_Exit(sig);
}

void topo::print_error() noexcept {
    if (std::exception_ptr ptr = std::current_exception()) {
        try {
            std::rethrow_exception(ptr);
        } catch (const std::exception& err) {
            message("unhandled exception: _", err.what());
        } catch (...) {
            message("unhandled exception of unknown type");
        }
    }
    sys::backtrace(STDERR_FILENO);
    std::_Exit(1);
}

void
topo::install_error_handler() {
    using namespace sys::this_process;
    using s = sys::signal;
    std::set_terminate(on_terminate);
    ignore_signal(s::broken_pipe);
    bind_signal(s::segmentation_fault, print_backtrace);
    bind_signal(s::abort, print_backtrace);
}
