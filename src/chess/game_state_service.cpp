// src/chess/game_state_service.cpp
#include "igknight/chess/game_state_service.h"
#include <optional>

namespace igknight {
namespace chess {

std::string gameStatusToString(GameStatus status) {
    switch (status) {
        case GameStatus::WAITING:                    return "WAITING";
        case GameStatus::IN_PROGRESS:                return "IN_PROGRESS";
        case GameStatus::CHECKMATE:                  return "CHECKMATE";
        case GameStatus::STALEMATE:                  return "STALEMATE";
        case GameStatus::DRAW_AGREEMENT:             return "DRAW_AGREEMENT";
        case GameStatus::DRAW_REPETITION:            return "DRAW_REPETITION";
        case GameStatus::DRAW_FIFTY_MOVE:            return "DRAW_FIFTY_MOVE";
        case GameStatus::DRAW_INSUFFICIENT_MATERIAL: return "DRAW_INSUFFICIENT_MATERIAL";
        case GameStatus::RESIGNATION:                return "RESIGNATION";
        case GameStatus::TIMEOUT:                    return "TIMEOUT";
        case GameStatus::ABANDONED:                  return "ABANDONED";
    }
    return "UNKNOWN";
}

bool isTerminalStatus(GameStatus status) {
    return status != GameStatus::WAITING && status != GameStatus::IN_PROGRESS;
}

bool GameStateService::isInCheck(const Board& board, PieceColor color) const {
    return validator_.isKingInCheck(board, color);
}

bool GameStateService::hasLegalMoves(const Board& board, PieceColor color) const {
    return !validator_.generateLegalMoves(board, color).empty();
}

bool GameStateService::isCheckmate(const Board& board, PieceColor color) const {
    return isInCheck(board, color) && !hasLegalMoves(board, color);
}

bool GameStateService::isStalemate(const Board& board, PieceColor color) const {
    return !isInCheck(board, color) && !hasLegalMoves(board, color);
}

bool GameStateService::isDrawByFiftyMoveRule(const Board& board) const {
    return board.getHalfMoveClock() >= 100;
}

bool GameStateService::isDrawByThreefoldRepetition(const Board& board) const {
    return board.countPositionOccurrences(board.placement()) >= 3;
}

bool GameStateService::isDrawByInsufficientMaterial(const Board& board) const {
    std::vector<Position> whitePieces = board.piecePositions(PieceColor::WHITE);
    std::vector<Position> blackPieces = board.piecePositions(PieceColor::BLACK);

    // The single non-king piece of a side, if it has exactly one
    auto loneMinor = [&board](const std::vector<Position>& positions) -> std::optional<Position> {
        if (positions.size() != 2) {
            return std::nullopt;
        }
        for (const Position& pos : positions) {
            if (board.getPiece(pos)->getType() != PieceType::KING) {
                return pos;
            }
        }
        return std::nullopt;
    };
    auto isMinor = [&board](const Position& pos) {
        PieceType type = board.getPiece(pos)->getType();
        return type == PieceType::BISHOP || type == PieceType::KNIGHT;
    };

    // King vs King
    if (whitePieces.size() == 1 && blackPieces.size() == 1) {
        return true;
    }

    // King and minor piece vs King
    if (whitePieces.size() == 2 && blackPieces.size() == 1) {
        auto minor = loneMinor(whitePieces);
        return minor && isMinor(*minor);
    }
    if (whitePieces.size() == 1 && blackPieces.size() == 2) {
        auto minor = loneMinor(blackPieces);
        return minor && isMinor(*minor);
    }

    // King and Bishop vs King and Bishop on the same square color
    if (whitePieces.size() == 2 && blackPieces.size() == 2) {
        auto whiteMinor = loneMinor(whitePieces);
        auto blackMinor = loneMinor(blackPieces);
        if (whiteMinor && blackMinor &&
            board.getPiece(*whiteMinor)->getType() == PieceType::BISHOP &&
            board.getPiece(*blackMinor)->getType() == PieceType::BISHOP) {
            return whiteMinor->isLightSquare() == blackMinor->isLightSquare();
        }
    }

    return false;
}

GameStatus GameStateService::determineGameStatus(const Board& board) const {
    PieceColor currentPlayer = board.getCurrentTurn();
    bool inCheck = isInCheck(board, currentPlayer);
    bool canMove = hasLegalMoves(board, currentPlayer);

    if (inCheck && !canMove) {
        return GameStatus::CHECKMATE;
    }
    if (!inCheck && !canMove) {
        return GameStatus::STALEMATE;
    }
    if (isDrawByFiftyMoveRule(board)) {
        return GameStatus::DRAW_FIFTY_MOVE;
    }
    if (isDrawByThreefoldRepetition(board)) {
        return GameStatus::DRAW_REPETITION;
    }
    if (isDrawByInsufficientMaterial(board)) {
        return GameStatus::DRAW_INSUFFICIENT_MATERIAL;
    }
    return GameStatus::IN_PROGRESS;
}

GameSnapshot GameStateService::getSnapshot(const Board& board) const {
    PieceColor currentPlayer = board.getCurrentTurn();

    GameSnapshot snapshot;
    snapshot.fen = board.toFEN();
    snapshot.currentTurn = currentPlayer;
    snapshot.status = determineGameStatus(board);
    snapshot.isCheck = isInCheck(board, currentPlayer);
    snapshot.legalMovesCount = static_cast<int>(validator_.generateLegalMoves(board, currentPlayer).size());
    snapshot.halfMoveClock = board.getHalfMoveClock();
    snapshot.fullMoveNumber = board.getFullMoveNumber();
    return snapshot;
}

} // namespace chess
} // namespace igknight
