#pragma once

#include <string>

namespace tradeguard {
namespace domain {

// Trade intent. Exit closes whatever position is open on the symbol.
enum class Direction {
  Long,
  Short,
  Exit,
};

inline const char* toString(Direction d) {
  switch (d) {
    case Direction::Long:  return "Long";
    case Direction::Short: return "Short";
    case Direction::Exit:  return "Exit";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Decision: abstract trade instruction from a strategy
// -----------------------------------------------------------------------------
//
// @brief  What the strategy wants, independent of venue mechanics.
//
// @details
// size_hint is the fraction of current equity to commit, in (0, 1]. It is
// ignored for Direction::Exit (the full position is closed). confidence is
// in [0, 1] and is carried through for logging only.
//
// A Decision outside these ranges is a programmer error:
// RiskManager::validate() throws std::invalid_argument for it.
// -----------------------------------------------------------------------------
struct Decision {
  std::string symbol;
  Direction direction{Direction::Long};
  double size_hint{0.0};
  double confidence{0.0};
  std::string reason;
};

}  // namespace domain
}  // namespace tradeguard
