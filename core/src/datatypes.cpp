#include "datatypes.hpp"

namespace core {

    std::string toString(SignalType signal) {
        switch (signal) {
            case SignalType::Buy:  return "BUY";
            case SignalType::Sell: return "SELL";
            case SignalType::Hold: return "HOLD";
        }
        return "UNKNOWN";
    }

    std::string toString(TradeAction action) {
        return action == TradeAction::Buy ? "BUY" : "SELL";
    }

    std::string toString(CloseReason reason) {
        switch (reason) {
            case CloseReason::None:         return "NONE";
            case CloseReason::Signal:       return "SIGNAL";
            case CloseReason::StopLoss:     return "STOP_LOSS";
            case CloseReason::TakeProfit:   return "TAKE_PROFIT";
            case CloseReason::EndOfSession: return "END_OF_SESSION";
            case CloseReason::Manual:       return "MANUAL";
        }
        return "UNKNOWN";
    }

    std::string toString(Direction direction) {
        return direction == Direction::Long ? "LONG" : "SHORT";
    }

} // namespace core
