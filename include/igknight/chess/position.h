// include/igknight/chess/position.h
#ifndef IGKNIGHT_CHESS_POSITION_H
#define IGKNIGHT_CHESS_POSITION_H

#include <optional>
#include <string>
#include <functional>

namespace igknight {
namespace chess {

/**
 * @brief A square on the board as (rank, file), both 1-8
 *
 * File 1 is the a-file, rank 1 is white's back rank.
 */
class Position {
public:
    /**
     * @brief Constructor
     *
     * @param rank Rank 1-8
     * @param file File 1-8 (a-h)
     * @throws core::FormatError if either coordinate is out of range
     */
    Position(int rank, int file);

    /**
     * @brief Parse a square label such as "e4"
     *
     * @throws core::FormatError on anything but a file letter a-h followed by a rank digit 1-8
     */
    static Position fromAlgebraic(const std::string& label);

    /**
     * @brief Position for a flat board index ((rank - 1) * 8 + (file - 1))
     */
    static Position fromIndex(int index);

    static bool isValid(int rank, int file) {
        return rank >= 1 && rank <= 8 && file >= 1 && file <= 8;
    }

    int getRank() const { return rank_; }
    int getFile() const { return file_; }
    int index() const { return (rank_ - 1) * 8 + (file_ - 1); }

    // Light squares have an odd rank + file sum (a1 is dark)
    bool isLightSquare() const { return (rank_ + file_) % 2 != 0; }

    /**
     * @brief Step by a rank/file delta
     *
     * @return The new position, or empty if it falls off the board
     */
    std::optional<Position> offset(int rankDelta, int fileDelta) const;

    std::string toAlgebraic() const;

    bool operator==(const Position& other) const {
        return rank_ == other.rank_ && file_ == other.file_;
    }
    bool operator!=(const Position& other) const { return !(*this == other); }
    bool operator<(const Position& other) const { return index() < other.index(); }

private:
    int rank_;
    int file_;
};

} // namespace chess
} // namespace igknight

namespace std {
template <>
struct hash<igknight::chess::Position> {
    size_t operator()(const igknight::chess::Position& pos) const {
        return std::hash<int>()(pos.index());
    }
};
} // namespace std

#endif // IGKNIGHT_CHESS_POSITION_H
