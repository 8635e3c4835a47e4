#include "gambit/engine/uci/move_codec.hpp"

namespace gambit::engine::uci
{
  namespace
  {
    core::PieceType promotionFromChar(char c) noexcept
    {
      switch (c)
      {
      case 'q':
        return core::PieceType::Queen;
      case 'r':
        return core::PieceType::Rook;
      case 'b':
        return core::PieceType::Bishop;
      case 'n':
        return core::PieceType::Knight;
      default:
        return core::PieceType::None;
      }
    }

    char promotionToChar(core::PieceType p) noexcept
    {
      switch (p)
      {
      case core::PieceType::Knight:
        return 'n';
      case core::PieceType::Bishop:
        return 'b';
      case core::PieceType::Rook:
        return 'r';
      default:
        return 'q';
      }
    }
  } // namespace

  std::optional<core::Square> parseSquare(std::string_view sv) noexcept
  {
    if (sv.size() < 2)
      return std::nullopt;
    const char f = sv[0];
    const char r = sv[1];
    if (f < 'a' || f > 'h' || r < '1' || r > '8')
      return std::nullopt;
    return core::makeSquare(f - 'a', r - '1');
  }

  std::string squareToString(core::Square sq)
  {
    if (!core::validSquare(sq))
      return "--";
    std::string s;
    s.push_back(static_cast<char>('a' + core::fileOf(sq)));
    s.push_back(static_cast<char>('1' + core::rankOf(sq)));
    return s;
  }

  std::string encodeMove(const model::Move &m)
  {
    std::string uci = squareToString(m.from()) + squareToString(m.to());
    if (m.isPromotion())
      uci.push_back(promotionToChar(m.promotion()));
    return uci;
  }

  std::optional<model::Move> decodeMove(std::string_view text,
                                        const std::vector<model::Move> &legalMoves)
  {
    if (text.size() < 4)
      return std::nullopt;

    const auto from = parseSquare(text.substr(0, 2));
    const auto to = parseSquare(text.substr(2, 2));
    if (!from || !to)
      return std::nullopt;

    // An unknown fifth character counts as no promotion letter.
    const core::PieceType promo =
        text.size() >= 5 ? promotionFromChar(text[4]) : core::PieceType::None;

    for (const auto &m : legalMoves)
    {
      if (m.from() != *from || m.to() != *to)
        continue;
      if (promo == core::PieceType::None || m.promotion() == promo)
        return m;
    }
    return std::nullopt;
  }
} // namespace gambit::engine::uci
