// src/chess/move_generator.cpp
#include "igknight/chess/move_generator.h"
#include <cstdlib>

namespace igknight {
namespace chess {

namespace {

const std::vector<std::pair<int, int>> KNIGHT_OFFSETS = {
    {2, 1}, {2, -1}, {-2, 1}, {-2, -1}, {1, 2}, {1, -2}, {-1, 2}, {-1, -2}
};

const std::vector<std::pair<int, int>> KING_OFFSETS = {
    {1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}
};

const std::vector<std::pair<int, int>> BISHOP_DIRECTIONS = {
    {1, 1}, {1, -1}, {-1, 1}, {-1, -1}
};

const std::vector<std::pair<int, int>> ROOK_DIRECTIONS = {
    {1, 0}, {-1, 0}, {0, 1}, {0, -1}
};

const std::vector<std::pair<int, int>> QUEEN_DIRECTIONS = {
    {1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}
};

// Push one move per promotion piece, or a single move off the promotion rank
void addPawnTarget(std::vector<Move>& moves, const Position& from, const Position& to,
                   PieceColor color, bool capture) {
    if (to.getRank() == promotionRank(color)) {
        for (PieceType promotion : PROMOTION_TYPES) {
            moves.emplace_back(from, to, promotion, capture, false, false);
        }
    } else {
        moves.emplace_back(from, to, std::nullopt, capture, false, false);
    }
}

} // namespace

std::vector<Move> MoveGenerator::generatePseudoLegalMoves(const Board& board, PieceColor color) const {
    std::vector<Move> moves;
    for (const Position& from : board.piecePositions(color)) {
        addPieceMoves(moves, board, from, *board.getPiece(from), true);
    }
    return moves;
}

std::vector<Move> MoveGenerator::generatePseudoLegalMovesForPiece(const Board& board, const Position& from) const {
    std::vector<Move> moves;
    const auto& piece = board.getPiece(from);
    if (piece) {
        addPieceMoves(moves, board, from, *piece, true);
    }
    return moves;
}

void MoveGenerator::addPieceMoves(std::vector<Move>& moves, const Board& board, const Position& from,
                                  const Piece& piece, bool includeCastling) const {
    PieceColor color = piece.getColor();
    switch (piece.getType()) {
        case PieceType::PAWN:
            addPawnMoves(moves, board, from, color);
            break;
        case PieceType::KNIGHT:
            addStepMoves(moves, board, from, color, KNIGHT_OFFSETS);
            break;
        case PieceType::BISHOP:
            addSlidingMoves(moves, board, from, color, BISHOP_DIRECTIONS);
            break;
        case PieceType::ROOK:
            addSlidingMoves(moves, board, from, color, ROOK_DIRECTIONS);
            break;
        case PieceType::QUEEN:
            addSlidingMoves(moves, board, from, color, QUEEN_DIRECTIONS);
            break;
        case PieceType::KING:
            addStepMoves(moves, board, from, color, KING_OFFSETS);
            if (includeCastling) {
                addCastlingMoves(moves, board, from, color);
            }
            break;
    }
}

void MoveGenerator::addPawnMoves(std::vector<Move>& moves, const Board& board, const Position& from,
                                 PieceColor color) const {
    int direction = pawnDirection(color);

    // Forward pushes
    auto oneForward = from.offset(direction, 0);
    if (oneForward && !board.getPiece(*oneForward)) {
        addPawnTarget(moves, from, *oneForward, color, false);

        if (from.getRank() == pawnHomeRank(color)) {
            auto twoForward = from.offset(2 * direction, 0);
            if (twoForward && !board.getPiece(*twoForward)) {
                moves.emplace_back(from, *twoForward);
            }
        }
    }

    // Diagonal captures, including en passant
    const auto& enPassant = board.getEnPassantTarget();
    for (int fileDelta : {-1, 1}) {
        auto target = from.offset(direction, fileDelta);
        if (!target) {
            continue;
        }

        const auto& occupant = board.getPiece(*target);
        if (occupant) {
            if (occupant->getColor() != color) {
                addPawnTarget(moves, from, *target, color, true);
            }
        } else if (enPassant && *enPassant == *target &&
                   target->getRank() == promotionRank(color) - 2 * direction) {
            moves.emplace_back(from, *target, std::nullopt, true, false, true);
        }
    }
}

void MoveGenerator::addStepMoves(std::vector<Move>& moves, const Board& board, const Position& from,
                                 PieceColor color, const std::vector<Direction>& offsets) const {
    for (const auto& [rankDelta, fileDelta] : offsets) {
        auto to = from.offset(rankDelta, fileDelta);
        if (!to) {
            continue;
        }
        const auto& target = board.getPiece(*to);
        if (!target) {
            moves.emplace_back(from, *to);
        } else if (target->getColor() != color) {
            moves.emplace_back(from, *to, std::nullopt, true, false, false);
        }
    }
}

void MoveGenerator::addSlidingMoves(std::vector<Move>& moves, const Board& board, const Position& from,
                                    PieceColor color, const std::vector<Direction>& directions) const {
    for (const auto& [rankDelta, fileDelta] : directions) {
        std::optional<Position> current = from;
        while ((current = current->offset(rankDelta, fileDelta))) {
            const auto& target = board.getPiece(*current);
            if (!target) {
                moves.emplace_back(from, *current);
                continue;
            }
            if (target->getColor() != color) {
                moves.emplace_back(from, *current, std::nullopt, true, false, false);
            }
            break;
        }
    }
}

void MoveGenerator::addCastlingMoves(std::vector<Move>& moves, const Board& board, const Position& from,
                                     PieceColor color) const {
    int rank = homeRank(color);
    const auto& king = board.getPiece(from);
    if (!king || king->hasMoved() || from != Position(rank, 5)) {
        return;
    }

    auto rookReady = [&](int file) {
        const auto& rook = board.getPiece(Position(rank, file));
        return rook && rook->getType() == PieceType::ROOK &&
               rook->getColor() == color && !rook->hasMoved();
    };
    auto pathClear = [&](int firstFile, int lastFile) {
        for (int file = firstFile; file <= lastFile; ++file) {
            if (board.getPiece(Position(rank, file))) {
                return false;
            }
        }
        return true;
    };

    if (board.canCastleKingside(color) && rookReady(8) && pathClear(6, 7)) {
        moves.emplace_back(from, Position(rank, 7), std::nullopt, false, true, false);
    }

    if (board.canCastleQueenside(color) && rookReady(1) && pathClear(2, 4)) {
        moves.emplace_back(from, Position(rank, 3), std::nullopt, false, true, false);
    }
}

bool MoveGenerator::pawnAttacks(const Position& pawn, PieceColor color, const Position& square) {
    return square.getRank() - pawn.getRank() == pawnDirection(color) &&
           std::abs(square.getFile() - pawn.getFile()) == 1;
}

bool MoveGenerator::isSquareAttacked(const Board& board, const Position& square, PieceColor byColor) const {
    std::vector<Move> moves;
    for (const Position& attackerPos : board.piecePositions(byColor)) {
        const Piece& attacker = *board.getPiece(attackerPos);

        if (attacker.getType() == PieceType::PAWN) {
            if (pawnAttacks(attackerPos, byColor, square)) {
                return true;
            }
            continue;
        }

        moves.clear();
        addPieceMoves(moves, board, attackerPos, attacker, false);
        for (const Move& move : moves) {
            if (move.to == square) {
                return true;
            }
        }
    }
    return false;
}

} // namespace chess
} // namespace igknight
