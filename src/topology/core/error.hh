#ifndef TOPOLOGY_CORE_ERROR_HH
#define TOPOLOGY_CORE_ERROR_HH

#include <unistdx/system/error>

#include <sstream>
#include <string>

namespace topo {

    /// Error with the message assembled from all constructor arguments.
    class error: public sys::error {

    public:
        template <class ... Arguments> inline explicit
        error(const char* what, const Arguments& ... args):
        sys::error(make_message(what, args...).data()) {}

    private:

        static inline void print(std::ostream&) {}

        template <class Head, class ... Tail>
        static void print(std::ostream& out, const Head& head, const Tail& ... tail) {
            out << head;
            print(out, tail...);
        }

        template <class ... Args>
        static std::string make_message(const char* what, const Args& ... args) {
            std::stringstream tmp;
            tmp << what;
            print(tmp, args...);
            return tmp.str();
        }

    };

    template <class ... Arguments>
    [[noreturn]] inline void throw_error(const char* what, const Arguments& ... args) {
        throw error(what, args...);
    }

}

#endif // vim:filetype=cpp
