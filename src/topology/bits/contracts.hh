#ifndef TOPOLOGY_BITS_CONTRACTS_HH
#define TOPOLOGY_BITS_CONTRACTS_HH

#if defined(TOPO_DEBUG)

#include <unistdx/base/contracts>
/// Precondition of a function, e.g. the caller holds the lock.
#define Expects(cond) UNISTDX_PRECONDITION(cond)
/// Internal invariant, e.g. a valid index into a handler table.
#define Assert(cond) UNISTDX_ASSERTION(cond)

#else

#define Expects(cond)
#define Assert(cond)

#endif

#endif // vim:filetype=cpp
