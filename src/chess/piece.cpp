// src/chess/piece.cpp
#include "igknight/chess/piece.h"
#include <cctype>

namespace igknight {
namespace chess {

char Piece::toFEN() const {
    char letter = pieceTypeLetter(type_);
    return color_ == PieceColor::WHITE
        ? letter
        : static_cast<char>(std::tolower(static_cast<unsigned char>(letter)));
}

Piece Piece::fromFEN(char letter) {
    PieceType type = pieceTypeFromLetter(letter);
    PieceColor color = std::isupper(static_cast<unsigned char>(letter))
        ? PieceColor::WHITE : PieceColor::BLACK;
    return Piece(type, color);
}

std::string Piece::toString() const {
    return colorToString(color_) + " " + pieceTypeToString(type_);
}

} // namespace chess
} // namespace igknight
