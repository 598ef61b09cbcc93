#pragma once

namespace pxu::common {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const JobData& job) { ... },
//       [](const CategoryData& category) { ... },
//   }, unit.data());

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace pxu::common
