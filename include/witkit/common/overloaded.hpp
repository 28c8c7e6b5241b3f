#pragma once

namespace witkit {

// Combines several lambdas into one visitor for std::visit:
//
//   std::visit(Overloaded{
//       [](const ListTyp& l) { ... },
//       [](const RecordTyp& r) { ... },
//   }, payload);
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace witkit
