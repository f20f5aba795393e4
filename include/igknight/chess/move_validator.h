// include/igknight/chess/move_validator.h
#ifndef IGKNIGHT_CHESS_MOVE_VALIDATOR_H
#define IGKNIGHT_CHESS_MOVE_VALIDATOR_H

#include <optional>
#include <vector>
#include "igknight/chess/board.h"
#include "igknight/chess/move.h"
#include "igknight/chess/move_generator.h"

namespace igknight {
namespace chess {

/**
 * @brief Legal move filtering and move execution
 *
 * Legality is decided by executing each candidate on a scratch copy of the
 * board and checking whether the mover's king is attacked afterwards.
 */
class MoveValidator {
public:
    MoveValidator() = default;
    explicit MoveValidator(const MoveGenerator& generator) : generator_(generator) {}

    /**
     * @brief Generate all legal moves of a color
     *
     * @param board Current board
     * @param color Side to generate for
     * @return Pseudo-legal moves that do not leave the king attacked
     */
    std::vector<Move> generateLegalMoves(const Board& board, PieceColor color) const;

    /**
     * @brief Generate legal moves of the piece on one square
     *
     * @return Legal moves, empty if the square is empty
     */
    std::vector<Move> generateLegalMovesForPiece(const Board& board, const Position& from) const;

    /**
     * @brief Check whether a pseudo-legal move keeps the mover's king safe
     *
     * Castling additionally requires canCastleThrough. A board without the
     * mover's king after execution yields false.
     */
    bool isMoveLegal(const Board& board, const Move& move, PieceColor color) const;

    /**
     * @brief Validate a requested move against the current position
     *
     * The piece on the origin square must belong to the side to move and the
     * move must match one of its legal moves on squares and promotion.
     */
    bool validateMove(const Board& board, const Move& move) const;

    /**
     * @brief Find the legal move matching a requested move
     *
     * @return The generated move, with its capture, castling and en passant
     * flags, or empty if the request is not legal
     */
    std::optional<Move> resolveMove(const Board& board, const Move& move) const;

    /**
     * @brief Execute a move on a board in place
     *
     * Handles captures, castling, en passant, promotion, castling rights,
     * clocks, the turn switch and the position history. The move is assumed to
     * be legal.
     *
     * @throws core::IllegalMoveError if the origin square is empty
     */
    void executeMove(Board& board, const Move& move) const;

    /**
     * @brief Validate, resolve and execute a requested move
     *
     * @return The executed move with its flags filled in
     * @throws core::IllegalMoveError if the move is not legal
     */
    Move applyMove(Board& board, const Move& move) const;

    /**
     * @brief Check whether the king of a color is attacked
     *
     * @throws core::CorruptStateError if that king is missing
     */
    bool isKingInCheck(const Board& board, PieceColor color) const;

    /**
     * @brief Check that castling does not start in, pass through or land in check
     *
     * @param kingside true for the g-file castle, false for the c-file castle
     */
    bool canCastleThrough(const Board& board, PieceColor color, bool kingside) const;

    const MoveGenerator& getGenerator() const { return generator_; }

private:
    MoveGenerator generator_;

    void executeCastling(Board& board, const Move& move, PieceColor color) const;
    void updateCastlingRights(Board& board, const Move& move, const Piece& piece) const;
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_MOVE_VALIDATOR_H
