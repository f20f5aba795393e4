// include/igknight/chess/notation.h
#ifndef IGKNIGHT_CHESS_NOTATION_H
#define IGKNIGHT_CHESS_NOTATION_H

#include <string>
#include "igknight/chess/board.h"
#include "igknight/chess/game_state_service.h"
#include "igknight/chess/move.h"

namespace igknight {
namespace chess {

/**
 * @brief Standard algebraic notation for move logs
 */
class Notation {
public:
    Notation() = default;
    explicit Notation(const GameStateService& service) : service_(service) {}

    /**
     * @brief Render a move in short algebraic notation
     *
     * Piece letter (none for pawns), origin file for pawn captures, 'x' on
     * captures, destination, "=Q" style promotion, then '#' on mate or '+' on
     * check. Castling renders as "O-O" or "O-O-O" with no suffix.
     *
     * @param before Board before the move
     * @param move Resolved move (as returned by MoveValidator::resolveMove)
     * @return SAN string, or the move label if the origin square is empty
     */
    std::string toSAN(const Board& before, const Move& move) const;

    /**
     * @brief Resolve a SAN token against the legal moves of the side to move
     *
     * Accepts optional file/rank disambiguation and trailing check marks.
     *
     * @throws core::FormatError if the token is malformed or ambiguous
     * @throws core::IllegalMoveError if no legal move matches
     */
    Move fromSAN(const Board& board, const std::string& san) const;

    /**
     * @brief Parse either a move label ("g1f3") or a SAN token ("Nf3")
     *
     * Labels are returned unresolved; SAN tokens are resolved.
     */
    Move parseMove(const Board& board, const std::string& text) const;

private:
    GameStateService service_;
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_NOTATION_H
