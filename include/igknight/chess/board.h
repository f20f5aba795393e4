// include/igknight/chess/board.h
#ifndef IGKNIGHT_CHESS_BOARD_H
#define IGKNIGHT_CHESS_BOARD_H

#include <array>
#include <optional>
#include <string>
#include <vector>
#include "igknight/chess/chess_types.h"
#include "igknight/chess/piece.h"
#include "igknight/chess/position.h"

namespace igknight {
namespace chess {

/**
 * @brief Castling availability for both sides
 */
struct CastlingRights {
    bool white_kingside = true;
    bool white_queenside = true;
    bool black_kingside = true;
    bool black_queenside = true;

    bool operator==(const CastlingRights& other) const {
        return white_kingside == other.white_kingside &&
               white_queenside == other.white_queenside &&
               black_kingside == other.black_kingside &&
               black_queenside == other.black_queenside;
    }
    bool operator!=(const CastlingRights& other) const { return !(*this == other); }
};

/**
 * @brief Full chess position: piece placement plus side to move, castling
 * rights, en passant target, clocks and the placement history used for
 * repetition counting
 *
 * Squares are stored in a flat array indexed by Position::index(), so copying
 * a board is a plain value copy.
 */
class Board {
public:
    static constexpr int NUM_SQUARES = 64;
    static constexpr const char* START_FEN =
        "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

    /**
     * @brief Construct the standard starting position
     */
    Board();

    /**
     * @brief Decode a FEN string
     *
     * The half-move clock and full-move number fields may be omitted.
     *
     * @param fen Position string
     * @return Decoded board with an empty history
     * @throws core::FormatError if the string is malformed
     */
    static Board fromFEN(const std::string& fen);

    /**
     * @brief Encode the board as a six-field FEN string
     */
    std::string toFEN() const;

    /**
     * @brief Piece placement field of the FEN string
     */
    std::string placement() const;

    /**
     * @brief Independent clone, including the position history
     */
    Board copy() const { return *this; }

    // Square access
    const std::optional<Piece>& getPiece(const Position& pos) const {
        return squares_[pos.index()];
    }
    void setPiece(const Position& pos, const std::optional<Piece>& piece) {
        squares_[pos.index()] = piece;
    }
    void removePiece(const Position& pos) { squares_[pos.index()].reset(); }

    /**
     * @brief Remove every piece and reset all auxiliary state
     */
    void clear();

    // Side to move
    PieceColor getCurrentTurn() const { return currentTurn_; }
    void setCurrentTurn(PieceColor color) { currentTurn_ = color; }

    // En passant target
    const std::optional<Position>& getEnPassantTarget() const { return enPassantTarget_; }
    void setEnPassantTarget(const std::optional<Position>& target) { enPassantTarget_ = target; }

    // Castling rights
    const CastlingRights& getCastlingRights() const { return castlingRights_; }
    bool canCastleKingside(PieceColor color) const;
    bool canCastleQueenside(PieceColor color) const;
    void setCastlingRights(PieceColor color, bool kingside, bool queenside);

    // Clocks
    int getHalfMoveClock() const { return halfMoveClock_; }
    void setHalfMoveClock(int clock) { halfMoveClock_ = clock; }
    void incrementHalfMoveClock() { ++halfMoveClock_; }
    void resetHalfMoveClock() { halfMoveClock_ = 0; }
    int getFullMoveNumber() const { return fullMoveNumber_; }
    void setFullMoveNumber(int number) { fullMoveNumber_ = number; }
    void incrementFullMoveNumber() { ++fullMoveNumber_; }

    /**
     * @brief Locate the king of a color
     *
     * @return King square, or empty if there is none
     */
    std::optional<Position> findKing(PieceColor color) const;

    /**
     * @brief Squares holding pieces of a color, a1 to h8
     */
    std::vector<Position> piecePositions(PieceColor color) const;

    // Position history (placement fields, oldest first)
    const std::vector<std::string>& getPositionHistory() const { return positionHistory_; }
    void addToPositionHistory(const std::string& placementField);
    void setPositionHistory(const std::vector<std::string>& history) { positionHistory_ = history; }
    int countPositionOccurrences(const std::string& placementField) const;

    /**
     * @brief Text diagram with rank and file labels
     */
    std::string toString() const;

    /**
     * @brief Compare placement (type and color only), side to move, castling
     * rights, en passant target and clocks; the history is not compared
     */
    bool operator==(const Board& other) const;
    bool operator!=(const Board& other) const { return !(*this == other); }

private:
    std::array<std::optional<Piece>, NUM_SQUARES> squares_;
    PieceColor currentTurn_;
    std::optional<Position> enPassantTarget_;
    CastlingRights castlingRights_;
    int halfMoveClock_;
    int fullMoveNumber_;
    std::vector<std::string> positionHistory_;

    void initializeStartingPosition();
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_BOARD_H
