// include/igknight/chess/move.h
#ifndef IGKNIGHT_CHESS_MOVE_H
#define IGKNIGHT_CHESS_MOVE_H

#include <optional>
#include <string>
#include "igknight/chess/chess_types.h"
#include "igknight/chess/position.h"

namespace igknight {
namespace chess {

/**
 * @brief A move from one square to another
 *
 * The capture, castling and en passant flags are filled in by the generator.
 * A move parsed from a label carries none of them; MoveValidator::resolve
 * maps it onto the flagged legal move.
 */
struct Move {
    Position from;
    Position to;
    std::optional<PieceType> promotion;
    bool isCapture = false;
    bool isCastling = false;
    bool isEnPassant = false;

    Move(Position from_, Position to_,
         std::optional<PieceType> promotion_ = std::nullopt,
         bool capture = false, bool castling = false, bool enPassant = false)
        : from(from_), to(to_), promotion(promotion_),
          isCapture(capture), isCastling(castling), isEnPassant(enPassant) {}

    bool isPromotion() const { return promotion.has_value(); }

    /**
     * @brief Label form: "e2e4", "e7e8q"
     */
    std::string toAlgebraic() const;

    /**
     * @brief Parse a four or five character label
     *
     * @throws core::FormatError on a malformed label or promotion letter
     */
    static Move fromAlgebraic(const std::string& label);

    // Same squares and promotion, ignoring the generator flags
    bool sameAction(const Move& other) const {
        return from == other.from && to == other.to && promotion == other.promotion;
    }

    bool operator==(const Move& other) const {
        return sameAction(other) &&
               isCapture == other.isCapture &&
               isCastling == other.isCastling &&
               isEnPassant == other.isEnPassant;
    }
    bool operator!=(const Move& other) const { return !(*this == other); }
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_MOVE_H
