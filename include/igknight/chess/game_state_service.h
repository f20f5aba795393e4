// include/igknight/chess/game_state_service.h
#ifndef IGKNIGHT_CHESS_GAME_STATE_SERVICE_H
#define IGKNIGHT_CHESS_GAME_STATE_SERVICE_H

#include <string>
#include "igknight/chess/board.h"
#include "igknight/chess/move_validator.h"

namespace igknight {
namespace chess {

/**
 * @brief Status of a game
 *
 * GameStateService::determineGameStatus only ever produces IN_PROGRESS,
 * CHECKMATE, STALEMATE and the three rule-based draws. The remaining values
 * are assigned by the game service that owns the board.
 */
enum class GameStatus {
    WAITING,
    IN_PROGRESS,
    CHECKMATE,
    STALEMATE,
    DRAW_AGREEMENT,
    DRAW_REPETITION,
    DRAW_FIFTY_MOVE,
    DRAW_INSUFFICIENT_MATERIAL,
    RESIGNATION,
    TIMEOUT,
    ABANDONED
};

std::string gameStatusToString(GameStatus status);

/**
 * @brief Whether a status ends the game
 */
bool isTerminalStatus(GameStatus status);

/**
 * @brief Summary of a position for status queries
 */
struct GameSnapshot {
    std::string fen;
    PieceColor currentTurn;
    GameStatus status;
    bool isCheck;
    int legalMovesCount;
    int halfMoveClock;
    int fullMoveNumber;
};

/**
 * @brief Terminal-state classification of a board
 */
class GameStateService {
public:
    GameStateService() = default;
    explicit GameStateService(const MoveValidator& validator) : validator_(validator) {}

    bool isInCheck(const Board& board, PieceColor color) const;
    bool hasLegalMoves(const Board& board, PieceColor color) const;

    /**
     * @brief In check with no legal move
     */
    bool isCheckmate(const Board& board, PieceColor color) const;

    /**
     * @brief Not in check but without a legal move
     */
    bool isStalemate(const Board& board, PieceColor color) const;

    /**
     * @brief Fifty-move rule (100 half-moves without capture or pawn move)
     */
    bool isDrawByFiftyMoveRule(const Board& board) const;

    /**
     * @brief Threefold repetition
     *
     * Only the piece placement field is compared; side to move, castling
     * rights and the en passant target are not part of the comparison.
     */
    bool isDrawByThreefoldRepetition(const Board& board) const;

    /**
     * @brief K v K, K+minor v K, or K+B v K+B with both bishops on one square color
     */
    bool isDrawByInsufficientMaterial(const Board& board) const;

    /**
     * @brief Classify the position for the side to move
     *
     * Checked in order: checkmate, stalemate, fifty-move rule, repetition,
     * insufficient material.
     */
    GameStatus determineGameStatus(const Board& board) const;

    GameSnapshot getSnapshot(const Board& board) const;

    const MoveValidator& getValidator() const { return validator_; }

private:
    MoveValidator validator_;
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_GAME_STATE_SERVICE_H
