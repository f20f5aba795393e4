// include/igknight/chess/piece.h
#ifndef IGKNIGHT_CHESS_PIECE_H
#define IGKNIGHT_CHESS_PIECE_H

#include <string>
#include "igknight/chess/chess_types.h"

namespace igknight {
namespace chess {

/**
 * @brief A chess piece
 *
 * Type and color are fixed for the lifetime of the piece. The moved flag is
 * only set by MoveValidator::execute and gates castling eligibility.
 */
class Piece {
public:
    Piece(PieceType type, PieceColor color, bool hasMoved = false)
        : type_(type), color_(color), hasMoved_(hasMoved) {}

    PieceType getType() const { return type_; }
    PieceColor getColor() const { return color_; }
    bool hasMoved() const { return hasMoved_; }
    void setMoved(bool moved) { hasMoved_ = moved; }

    int getValue() const { return pieceTypeValue(type_); }

    /**
     * @brief FEN letter, uppercase for white and lowercase for black
     */
    char toFEN() const;

    /**
     * @brief Parse a FEN letter
     *
     * @throws core::FormatError on an unknown letter
     */
    static Piece fromFEN(char letter);

    // Same type and color, ignoring the moved flag
    bool sameKind(const Piece& other) const {
        return type_ == other.type_ && color_ == other.color_;
    }

    bool operator==(const Piece& other) const {
        return sameKind(other) && hasMoved_ == other.hasMoved_;
    }
    bool operator!=(const Piece& other) const { return !(*this == other); }

    std::string toString() const;

private:
    PieceType type_;
    PieceColor color_;
    bool hasMoved_;
};

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_PIECE_H
