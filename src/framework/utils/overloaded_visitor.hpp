#ifndef _V6N_UTILS_OVERLOADED_VISITOR_HPP_
#define _V6N_UTILS_OVERLOADED_VISITOR_HPP_

namespace v6net::utils {

/**
 * Combine a set of lambdas into one visitor for std::visit.  A variant
 * alternative without a matching lambda is a compile error, so every
 * visit is exhaustive.
 */
template <typename... Ts> struct overloaded_visitor : Ts...
{
    overloaded_visitor(const Ts&... args)
        : Ts(args)...
    {}

    using Ts::operator()...;
};

} // namespace v6net::utils

#endif /* _V6N_UTILS_OVERLOADED_VISITOR_HPP_ */
