// src/chess/perft.cpp
#include "igknight/chess/perft.h"

namespace igknight {
namespace chess {

uint64_t perft(const Board& board, int depth, const MoveValidator& validator) {
    if (depth <= 0) {
        return 1;
    }

    std::vector<Move> moves = validator.generateLegalMoves(board, board.getCurrentTurn());
    if (depth == 1) {
        return moves.size();
    }

    uint64_t nodes = 0;
    for (const Move& move : moves) {
        Board next = board.copy();
        validator.executeMove(next, move);
        nodes += perft(next, depth - 1, validator);
    }
    return nodes;
}

std::map<std::string, uint64_t> perftDivide(const Board& board, int depth,
                                            const MoveValidator& validator) {
    std::map<std::string, uint64_t> result;
    if (depth <= 0) {
        return result;
    }

    for (const Move& move : validator.generateLegalMoves(board, board.getCurrentTurn())) {
        Board next = board.copy();
        validator.executeMove(next, move);
        result[move.toAlgebraic()] = perft(next, depth - 1, validator);
    }
    return result;
}

} // namespace chess
} // namespace igknight
