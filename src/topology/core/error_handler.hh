#ifndef TOPOLOGY_CORE_ERROR_HANDLER_HH
#define TOPOLOGY_CORE_ERROR_HANDLER_HH

namespace topo {

    [[noreturn]] void
    print_backtrace(int sig) noexcept;

    /// Logs the exception that is currently being handled and exits with status 1.
    [[noreturn]] void
    print_error() noexcept;

    void
    install_error_handler();

}

#endif // vim:filetype=cpp
