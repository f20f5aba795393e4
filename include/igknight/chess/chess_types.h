// include/igknight/chess/chess_types.h
#ifndef IGKNIGHT_CHESS_TYPES_H
#define IGKNIGHT_CHESS_TYPES_H

#include <array>
#include <string>

namespace igknight {
namespace chess {

/**
 * @brief Side of a piece (white moves first)
 */
enum class PieceColor {
    WHITE,
    BLACK
};

/**
 * @brief Kind of a piece
 */
enum class PieceType {
    PAWN,
    KNIGHT,
    BISHOP,
    ROOK,
    QUEEN,
    KING
};

// Promotion choices in generation order
constexpr std::array<PieceType, 4> PROMOTION_TYPES = {
    PieceType::QUEEN, PieceType::ROOK, PieceType::BISHOP, PieceType::KNIGHT
};

inline PieceColor oppositeColor(PieceColor color) {
    return color == PieceColor::WHITE ? PieceColor::BLACK : PieceColor::WHITE;
}

// Rank direction a pawn of this color advances in
inline int pawnDirection(PieceColor color) {
    return color == PieceColor::WHITE ? 1 : -1;
}

// Rank holding the king and rooks at the start
inline int homeRank(PieceColor color) {
    return color == PieceColor::WHITE ? 1 : 8;
}

inline int pawnHomeRank(PieceColor color) {
    return color == PieceColor::WHITE ? 2 : 7;
}

inline int promotionRank(PieceColor color) {
    return color == PieceColor::WHITE ? 8 : 1;
}

/**
 * @brief Uppercase notation letter of a piece type (P, N, B, R, Q, K)
 */
char pieceTypeLetter(PieceType type);

/**
 * @brief Relative material value (pawn = 1, king = 1000)
 */
int pieceTypeValue(PieceType type);

/**
 * @brief Parse a notation letter, either case
 *
 * @throws core::FormatError on an unknown letter
 */
PieceType pieceTypeFromLetter(char letter);

std::string colorToString(PieceColor color);
std::string pieceTypeToString(PieceType type);

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_TYPES_H
