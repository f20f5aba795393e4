// src/chess/position.cpp
#include "igknight/chess/position.h"
#include "igknight/core/exceptions.h"

namespace igknight {
namespace chess {

Position::Position(int rank, int file) : rank_(rank), file_(file) {
    if (!isValid(rank, file)) {
        throw core::FormatError("Invalid position: rank=" + std::to_string(rank) +
                                ", file=" + std::to_string(file));
    }
}

Position Position::fromAlgebraic(const std::string& label) {
    if (label.length() != 2) {
        throw core::FormatError("Invalid square label: " + label);
    }

    char fileChar = label[0];
    char rankChar = label[1];

    if (fileChar < 'a' || fileChar > 'h' || rankChar < '1' || rankChar > '8') {
        throw core::FormatError("Invalid square label: " + label);
    }

    return Position(rankChar - '0', fileChar - 'a' + 1);
}

Position Position::fromIndex(int index) {
    if (index < 0 || index >= 64) {
        throw core::FormatError("Invalid square index: " + std::to_string(index));
    }
    return Position(index / 8 + 1, index % 8 + 1);
}

std::optional<Position> Position::offset(int rankDelta, int fileDelta) const {
    int newRank = rank_ + rankDelta;
    int newFile = file_ + fileDelta;
    if (!isValid(newRank, newFile)) {
        return std::nullopt;
    }
    return Position(newRank, newFile);
}

std::string Position::toAlgebraic() const {
    char fileChar = static_cast<char>('a' + file_ - 1);
    char rankChar = static_cast<char>('0' + rank_);
    return std::string({fileChar, rankChar});
}

} // namespace chess
} // namespace igknight
