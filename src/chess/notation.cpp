// src/chess/notation.cpp
#include "igknight/chess/notation.h"
#include "igknight/core/exceptions.h"
#include <cctype>
#include <vector>

namespace igknight {
namespace chess {

namespace {

bool looksLikeLabel(const std::string& text) {
    if (text.length() != 4 && text.length() != 5) {
        return false;
    }
    return text[0] >= 'a' && text[0] <= 'h' && text[1] >= '1' && text[1] <= '8' &&
           text[2] >= 'a' && text[2] <= 'h' && text[3] >= '1' && text[3] <= '8';
}

} // namespace

std::string Notation::toSAN(const Board& before, const Move& move) const {
    const auto& movingPiece = before.getPiece(move.from);
    if (!movingPiece) {
        return move.toAlgebraic();
    }

    if (move.isCastling) {
        return move.to.getFile() == 7 ? "O-O" : "O-O-O";
    }

    bool isCapture = before.getPiece(move.to).has_value() || move.isEnPassant;

    std::string san;
    if (movingPiece->getType() != PieceType::PAWN) {
        san += pieceTypeLetter(movingPiece->getType());
    } else if (isCapture) {
        san += static_cast<char>('a' + move.from.getFile() - 1);
    }

    if (isCapture) {
        san += 'x';
    }

    san += move.to.toAlgebraic();

    if (move.promotion) {
        san += '=';
        san += pieceTypeLetter(*move.promotion);
    }

    Board after = before.copy();
    service_.getValidator().executeMove(after, move);
    PieceColor opponent = oppositeColor(movingPiece->getColor());
    if (service_.isCheckmate(after, opponent)) {
        san += '#';
    } else if (service_.isInCheck(after, opponent)) {
        san += '+';
    }

    return san;
}

Move Notation::fromSAN(const Board& board, const std::string& san) const {
    std::string token = san;
    while (!token.empty() && (token.back() == '+' || token.back() == '#' ||
                              token.back() == '!' || token.back() == '?')) {
        token.pop_back();
    }
    if (token.empty()) {
        throw core::FormatError("Empty SAN move");
    }

    const MoveValidator& validator = service_.getValidator();
    std::vector<Move> legalMoves = validator.generateLegalMoves(board, board.getCurrentTurn());

    // Castling
    if (token == "O-O" || token == "0-0" || token == "O-O-O" || token == "0-0-0") {
        int targetFile = token.length() == 3 ? 7 : 3;
        for (const Move& move : legalMoves) {
            if (move.isCastling && move.to.getFile() == targetFile) {
                return move;
            }
        }
        throw core::IllegalMoveError("Illegal castling: " + san, san);
    }

    std::size_t pos = 0;
    PieceType pieceType = PieceType::PAWN;
    if (std::string("NBRQK").find(token[0]) != std::string::npos) {
        pieceType = pieceTypeFromLetter(token[0]);
        pos = 1;
    }

    // Promotion suffix "=Q" (the '=' may be omitted)
    std::optional<PieceType> promotion;
    if (token.length() >= 2 && std::string("NBRQ").find(token.back()) != std::string::npos &&
        pieceType == PieceType::PAWN) {
        promotion = pieceTypeFromLetter(token.back());
        token.pop_back();
        if (!token.empty() && token.back() == '=') {
            token.pop_back();
        }
    }

    if (token.length() < pos + 2) {
        throw core::FormatError("Invalid SAN move: " + san);
    }
    Position to = Position::fromAlgebraic(token.substr(token.length() - 2));

    // Disambiguation and capture marker between the piece letter and destination
    std::optional<int> fromFile;
    std::optional<int> fromRank;
    for (std::size_t i = pos; i < token.length() - 2; ++i) {
        char c = token[i];
        if (c >= 'a' && c <= 'h') {
            fromFile = c - 'a' + 1;
        } else if (c >= '1' && c <= '8') {
            fromRank = c - '0';
        } else if (c != 'x') {
            throw core::FormatError("Invalid SAN move: " + san);
        }
    }

    std::vector<Move> matches;
    for (const Move& move : legalMoves) {
        if (move.to != to || move.promotion != promotion || move.isCastling) {
            continue;
        }
        if (board.getPiece(move.from)->getType() != pieceType) {
            continue;
        }
        if ((fromFile && move.from.getFile() != *fromFile) ||
            (fromRank && move.from.getRank() != *fromRank)) {
            continue;
        }
        matches.push_back(move);
    }

    if (matches.empty()) {
        throw core::IllegalMoveError("Illegal move: " + san, san);
    }
    if (matches.size() > 1) {
        throw core::FormatError("Ambiguous SAN move: " + san);
    }
    return matches.front();
}

Move Notation::parseMove(const Board& board, const std::string& text) const {
    if (looksLikeLabel(text)) {
        return Move::fromAlgebraic(text);
    }
    return fromSAN(board, text);
}

} // namespace chess
} // namespace igknight
