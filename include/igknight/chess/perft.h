// include/igknight/chess/perft.h
#ifndef IGKNIGHT_CHESS_PERFT_H
#define IGKNIGHT_CHESS_PERFT_H

#include <cstdint>
#include <map>
#include <string>
#include "igknight/chess/board.h"
#include "igknight/chess/move_validator.h"

namespace igknight {
namespace chess {

/**
 * @brief Count the leaf nodes of the legal move tree
 *
 * @param board Root position (not modified)
 * @param depth Number of plies to expand; depth 0 counts the root itself
 * @param validator Validator used for move generation and execution
 * @return Number of leaf positions
 */
uint64_t perft(const Board& board, int depth, const MoveValidator& validator = MoveValidator());

/**
 * @brief Per-move node counts at the root, keyed by move label
 */
std::map<std::string, uint64_t> perftDivide(const Board& board, int depth,
                                            const MoveValidator& validator = MoveValidator());

} // namespace chess
} // namespace igknight

#endif // IGKNIGHT_CHESS_PERFT_H
