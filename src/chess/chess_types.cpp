// src/chess/chess_types.cpp
#include "igknight/chess/chess_types.h"
#include "igknight/core/exceptions.h"
#include <cctype>

namespace igknight {
namespace chess {

char pieceTypeLetter(PieceType type) {
    switch (type) {
        case PieceType::PAWN:   return 'P';
        case PieceType::KNIGHT: return 'N';
        case PieceType::BISHOP: return 'B';
        case PieceType::ROOK:   return 'R';
        case PieceType::QUEEN:  return 'Q';
        case PieceType::KING:   return 'K';
    }
    return '?';
}

int pieceTypeValue(PieceType type) {
    switch (type) {
        case PieceType::PAWN:   return 1;
        case PieceType::KNIGHT: return 3;
        case PieceType::BISHOP: return 3;
        case PieceType::ROOK:   return 5;
        case PieceType::QUEEN:  return 9;
        case PieceType::KING:   return 1000;
    }
    return 0;
}

PieceType pieceTypeFromLetter(char letter) {
    switch (std::toupper(static_cast<unsigned char>(letter))) {
        case 'P': return PieceType::PAWN;
        case 'N': return PieceType::KNIGHT;
        case 'B': return PieceType::BISHOP;
        case 'R': return PieceType::ROOK;
        case 'Q': return PieceType::QUEEN;
        case 'K': return PieceType::KING;
        default:
            throw core::FormatError(std::string("Invalid piece letter: ") + letter);
    }
}

std::string colorToString(PieceColor color) {
    return color == PieceColor::WHITE ? "WHITE" : "BLACK";
}

std::string pieceTypeToString(PieceType type) {
    switch (type) {
        case PieceType::PAWN:   return "PAWN";
        case PieceType::KNIGHT: return "KNIGHT";
        case PieceType::BISHOP: return "BISHOP";
        case PieceType::ROOK:   return "ROOK";
        case PieceType::QUEEN:  return "QUEEN";
        case PieceType::KING:   return "KING";
    }
    return "UNKNOWN";
}

} // namespace chess
} // namespace igknight
