// src/chess/move_validator.cpp
#include "igknight/chess/move_validator.h"
#include "igknight/core/exceptions.h"
#include <cstdlib>

namespace igknight {
namespace chess {

std::vector<Move> MoveValidator::generateLegalMoves(const Board& board, PieceColor color) const {
    std::vector<Move> legalMoves;
    for (const Move& move : generator_.generatePseudoLegalMoves(board, color)) {
        if (isMoveLegal(board, move, color)) {
            legalMoves.push_back(move);
        }
    }
    return legalMoves;
}

std::vector<Move> MoveValidator::generateLegalMovesForPiece(const Board& board, const Position& from) const {
    std::vector<Move> legalMoves;
    const auto& piece = board.getPiece(from);
    if (!piece) {
        return legalMoves;
    }

    for (const Move& move : generator_.generatePseudoLegalMovesForPiece(board, from)) {
        if (isMoveLegal(board, move, piece->getColor())) {
            legalMoves.push_back(move);
        }
    }
    return legalMoves;
}

bool MoveValidator::isMoveLegal(const Board& board, const Move& move, PieceColor color) const {
    if (move.isCastling && !canCastleThrough(board, color, move.to.getFile() == 7)) {
        return false;
    }

    // Play the move on a scratch copy
    Board testBoard = board.copy();
    executeMove(testBoard, move);

    auto kingPos = testBoard.findKing(color);
    if (!kingPos) {
        return false;
    }

    return !generator_.isSquareAttacked(testBoard, *kingPos, oppositeColor(color));
}

bool MoveValidator::validateMove(const Board& board, const Move& move) const {
    return resolveMove(board, move).has_value();
}

std::optional<Move> MoveValidator::resolveMove(const Board& board, const Move& move) const {
    const auto& piece = board.getPiece(move.from);
    if (!piece || piece->getColor() != board.getCurrentTurn()) {
        return std::nullopt;
    }

    for (const Move& legalMove : generateLegalMovesForPiece(board, move.from)) {
        if (legalMove.sameAction(move)) {
            return legalMove;
        }
    }
    return std::nullopt;
}

Move MoveValidator::applyMove(Board& board, const Move& move) const {
    auto resolved = resolveMove(board, move);
    if (!resolved) {
        throw core::IllegalMoveError("Illegal move: " + move.toAlgebraic(), move.toAlgebraic());
    }
    executeMove(board, *resolved);
    return *resolved;
}

void MoveValidator::executeMove(Board& board, const Move& move) const {
    const auto& origin = board.getPiece(move.from);
    if (!origin) {
        throw core::IllegalMoveError("No piece on " + move.from.toAlgebraic(), move.toAlgebraic());
    }
    Piece piece = *origin;
    PieceColor color = piece.getColor();

    board.setEnPassantTarget(std::nullopt);

    if (move.isCastling) {
        executeCastling(board, move, color);
        board.incrementHalfMoveClock();
        board.setCastlingRights(color, false, false);
    } else if (move.isEnPassant) {
        piece.setMoved(true);
        board.removePiece(move.from);
        board.setPiece(move.to, piece);
        board.removePiece(Position(move.to.getRank() - pawnDirection(color), move.to.getFile()));
        board.resetHalfMoveClock();
    } else if (move.isPromotion()) {
        board.removePiece(move.from);
        board.setPiece(move.to, Piece(*move.promotion, color, true));
        board.resetHalfMoveClock();
    } else {
        bool isCapture = board.getPiece(move.to).has_value();
        bool isPawnMove = piece.getType() == PieceType::PAWN;

        piece.setMoved(true);
        board.removePiece(move.from);
        board.setPiece(move.to, piece);

        if (isPawnMove && std::abs(move.to.getRank() - move.from.getRank()) == 2) {
            int passedRank = (move.from.getRank() + move.to.getRank()) / 2;
            board.setEnPassantTarget(Position(passedRank, move.from.getFile()));
        }

        if (isCapture || isPawnMove) {
            board.resetHalfMoveClock();
        } else {
            board.incrementHalfMoveClock();
        }
    }

    updateCastlingRights(board, move, piece);

    board.setCurrentTurn(oppositeColor(board.getCurrentTurn()));
    if (board.getCurrentTurn() == PieceColor::WHITE) {
        board.incrementFullMoveNumber();
    }

    board.addToPositionHistory(board.placement());
}

void MoveValidator::executeCastling(Board& board, const Move& move, PieceColor color) const {
    int rank = homeRank(color);
    bool kingside = move.to.getFile() == 7;

    Piece king = *board.getPiece(move.from);
    king.setMoved(true);
    board.removePiece(move.from);
    board.setPiece(move.to, king);

    Position rookFrom(rank, kingside ? 8 : 1);
    Position rookTo(rank, kingside ? 6 : 4);
    auto rook = board.getPiece(rookFrom);
    board.removePiece(rookFrom);
    if (rook) {
        rook->setMoved(true);
        board.setPiece(rookTo, rook);
    }
}

void MoveValidator::updateCastlingRights(Board& board, const Move& move, const Piece& piece) const {
    PieceColor color = piece.getColor();

    if (piece.getType() == PieceType::KING) {
        board.setCastlingRights(color, false, false);
    }

    // A rook leaving its corner gives up that wing
    if (piece.getType() == PieceType::ROOK) {
        int rank = homeRank(color);
        if (move.from == Position(rank, 1)) {
            board.setCastlingRights(color, board.canCastleKingside(color), false);
        } else if (move.from == Position(rank, 8)) {
            board.setCastlingRights(color, false, board.canCastleQueenside(color));
        }
    }

    // Landing on an enemy corner captures (or finds absent) that rook
    PieceColor opponent = oppositeColor(color);
    int opponentRank = homeRank(opponent);
    if (move.to == Position(opponentRank, 1)) {
        board.setCastlingRights(opponent, board.canCastleKingside(opponent), false);
    } else if (move.to == Position(opponentRank, 8)) {
        board.setCastlingRights(opponent, false, board.canCastleQueenside(opponent));
    }
}

bool MoveValidator::isKingInCheck(const Board& board, PieceColor color) const {
    auto kingPos = board.findKing(color);
    if (!kingPos) {
        throw core::CorruptStateError("No " + colorToString(color) + " king on the board");
    }
    return generator_.isSquareAttacked(board, *kingPos, oppositeColor(color));
}

bool MoveValidator::canCastleThrough(const Board& board, PieceColor color, bool kingside) const {
    auto kingPos = board.findKing(color);
    if (!kingPos) {
        return false;
    }

    PieceColor opponent = oppositeColor(color);
    if (generator_.isSquareAttacked(board, *kingPos, opponent)) {
        return false;
    }

    int rank = homeRank(color);
    int firstFile = kingside ? 6 : 3;
    int lastFile = kingside ? 7 : 4;
    for (int file = firstFile; file <= lastFile; ++file) {
        if (generator_.isSquareAttacked(board, Position(rank, file), opponent)) {
            return false;
        }
    }
    return true;
}

} // namespace chess
} // namespace igknight
