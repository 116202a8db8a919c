#include "internal/model/hand_state_machine.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace pokertable::model {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[noreturn]] void Reject(HandStatus from, std::string_view event) {
  throw util::InvalidState("hand transition: " + std::string(event) + " is not valid from " + std::string(ToString(from)));
}

} // namespace

HandStatus StatusForStreet(int street_index) {
  switch (street_index) {
    case 0:
      return pokertable::v1::HAND_STATUS_PREFLOP;
    case 1:
      return pokertable::v1::HAND_STATUS_FLOP;
    case 2:
      return pokertable::v1::HAND_STATUS_TURN;
    case 3:
      return pokertable::v1::HAND_STATUS_RIVER;
    default:
      throw util::InvalidState("hand transition: unknown street index " + std::to_string(street_index));
  }
}

HandStatus Transition(HandStatus from, const HandEvent& event) {
  return std::visit(Overloaded{
                        [from](const StreetDealt& dealt) -> HandStatus {
                          if (!IsBettingStatus(from) || from == pokertable::v1::HAND_STATUS_RIVER) {
                            Reject(from, "street dealt");
                          }
                          const auto to = StatusForStreet(dealt.street_index);
                          if (static_cast<int>(to) != static_cast<int>(from) + 1) {
                            Reject(from, "street dealt to " + std::string(ToString(to)));
                          }
                          return to;
                        },
                        [from](const HandCompleted&) -> HandStatus {
                          if (!IsBettingStatus(from)) {
                            Reject(from, "hand completed");
                          }
                          return pokertable::v1::HAND_STATUS_INTER_HAND_WAIT;
                        },
                        [from](const InterHandResolved&) -> HandStatus {
                          if (from != pokertable::v1::HAND_STATUS_INTER_HAND_WAIT) {
                            Reject(from, "inter-hand resolved");
                          }
                          return pokertable::v1::HAND_STATUS_ENDED;
                        },
                    },
                    event);
}

} // namespace pokertable::model
