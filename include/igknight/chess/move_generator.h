// include/igknight/chess/move_generator.h
#ifndef IGKNIGHT_CHESS_MOVE_GENERATOR_H
#define IGKNIGHT_CHESS_MOVE_GENERATOR_H

#include <utility>
#include <vector>
#include "igknight/chess/board.h"
#include "igknight/chess/move.h"

namespace igknight {
namespace chess {

/**
 * @brief Pseudo-legal move generation
 *
 * Moves obey piece geometry and blocking but may leave the mover's own king
 * attacked. Filtering to legal moves is MoveValidator's job, as is the attack
 * test on castling squares.
 */
class MoveGenerator {
public:
    /**
     * @brief Generate pseudo-legal moves for every piece of a color
     *
     * @param board Board to generate on
     * @param color Side to generate for
     * @return Moves in board order (a1 to h8)
     */
    std::vector<Move> generatePseudoLegalMoves(const Board& board, PieceColor color) const;

    /**
     * @brief Generate pseudo-legal moves for the piece on one square
     *
     * @return Moves of that piece, empty if the square is empty
     */
    std::vector<Move> generatePseudoLegalMovesForPiece(const Board& board, const Position& from) const;

    /**
     * @brief Check if a square is attacked by a color
     *
     * Reuses the per-piece generator. Pawns attack only along their capture
     * diagonals, never with a forward push.
     *
     * @param board Board to inspect
     * @param square Target square
     * @param byColor Attacking side
     * @return true if any piece of byColor attacks the square
     */
    bool isSquareAttacked(const Board& board, const Position& square, PieceColor byColor) const;

private:
    using Direction = std::pair<int, int>;

    void addPawnMoves(std::vector<Move>& moves, const Board& board, const Position& from, PieceColor color) const;
    void addStepMoves(std::vector<Move>& moves, const Board& board, const Position& from, PieceColor color,
                      const std::vector<Direction>& offsets) const;
    void addSlidingMoves(std::vector<Move>& moves, const Board& board, const Position& from, PieceColor color,
                         const std::vector<Direction>& directions) const;
    void addCastlingMoves(std::vector<Move>& moves, const Board& board, const Position& from, PieceColor color) const;

    void addPieceMoves(std::vector<Move>& moves, const Board& board, const Position& from,
                       const Piece& piece, bool includeCastling) const;

    static bool pawnAttacks(const Position& pawn, PieceColor color, const Position& square);
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_MOVE_GENERATOR_H
