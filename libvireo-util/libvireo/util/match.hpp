#pragma once

namespace vireo::util {

/**
 * @brief Overload set of lambdas for `std::visit`, e.g. to dispatch on error codes or command states.
 *
 */
template <class... TVisitors>
struct match : TVisitors... {  // NOLINT
  using TVisitors::operator()...;
};

template <class... TVisitors>
match(TVisitors...) -> match<TVisitors...>;

}  // namespace vireo::util
