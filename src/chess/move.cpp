// src/chess/move.cpp
#include "igknight/chess/move.h"
#include "igknight/core/exceptions.h"
#include <cctype>

namespace igknight {
namespace chess {

std::string Move::toAlgebraic() const {
    std::string result = from.toAlgebraic() + to.toAlgebraic();
    if (promotion) {
        result += static_cast<char>(std::tolower(static_cast<unsigned char>(pieceTypeLetter(*promotion))));
    }
    return result;
}

Move Move::fromAlgebraic(const std::string& label) {
    if (label.length() != 4 && label.length() != 5) {
        throw core::FormatError("Invalid move label: " + label);
    }

    Position fromSquare = Position::fromAlgebraic(label.substr(0, 2));
    Position toSquare = Position::fromAlgebraic(label.substr(2, 2));

    std::optional<PieceType> promotion;
    if (label.length() == 5) {
        PieceType type = pieceTypeFromLetter(label[4]);
        if (type == PieceType::PAWN || type == PieceType::KING) {
            throw core::FormatError("Invalid promotion piece in move label: " + label);
        }
        promotion = type;
    }

    return Move(fromSquare, toSquare, promotion);
}

} // namespace chess
} // namespace igknight
