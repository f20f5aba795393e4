// src/chess/board.cpp
#include "igknight/chess/board.h"
#include "igknight/core/exceptions.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace igknight {
namespace chess {

namespace {

const std::array<PieceType, 8> BACK_RANK = {
    PieceType::ROOK, PieceType::KNIGHT, PieceType::BISHOP, PieceType::QUEEN,
    PieceType::KING, PieceType::BISHOP, PieceType::KNIGHT, PieceType::ROOK
};

// Upper bound for decoded clocks, leaves room to keep counting without overflow
const int MAX_FEN_COUNTER = 100000;

int parseCounter(const std::string& field, const std::string& name) {
    if (field.empty() || field.size() > 6 ||
        !std::all_of(field.begin(), field.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw core::FormatError("Invalid " + name + " in FEN: " + field);
    }
    int value = std::stoi(field);
    if (value > MAX_FEN_COUNTER) {
        throw core::FormatError("Invalid " + name + " in FEN: " + field);
    }
    return value;
}

} // namespace

Board::Board() {
    clear();
    initializeStartingPosition();
}

void Board::clear() {
    for (auto& square : squares_) {
        square.reset();
    }
    currentTurn_ = PieceColor::WHITE;
    enPassantTarget_.reset();
    castlingRights_ = CastlingRights();
    halfMoveClock_ = 0;
    fullMoveNumber_ = 1;
    positionHistory_.clear();
}

void Board::initializeStartingPosition() {
    for (int file = 1; file <= 8; ++file) {
        setPiece(Position(1, file), Piece(BACK_RANK[file - 1], PieceColor::WHITE));
        setPiece(Position(2, file), Piece(PieceType::PAWN, PieceColor::WHITE));
        setPiece(Position(7, file), Piece(PieceType::PAWN, PieceColor::BLACK));
        setPiece(Position(8, file), Piece(BACK_RANK[file - 1], PieceColor::BLACK));
    }
}

bool Board::canCastleKingside(PieceColor color) const {
    return color == PieceColor::WHITE ? castlingRights_.white_kingside
                                      : castlingRights_.black_kingside;
}

bool Board::canCastleQueenside(PieceColor color) const {
    return color == PieceColor::WHITE ? castlingRights_.white_queenside
                                      : castlingRights_.black_queenside;
}

void Board::setCastlingRights(PieceColor color, bool kingside, bool queenside) {
    if (color == PieceColor::WHITE) {
        castlingRights_.white_kingside = kingside;
        castlingRights_.white_queenside = queenside;
    } else {
        castlingRights_.black_kingside = kingside;
        castlingRights_.black_queenside = queenside;
    }
}

std::optional<Position> Board::findKing(PieceColor color) const {
    for (int index = 0; index < NUM_SQUARES; ++index) {
        const auto& piece = squares_[index];
        if (piece && piece->getType() == PieceType::KING && piece->getColor() == color) {
            return Position::fromIndex(index);
        }
    }
    return std::nullopt;
}

std::vector<Position> Board::piecePositions(PieceColor color) const {
    std::vector<Position> positions;
    for (int index = 0; index < NUM_SQUARES; ++index) {
        const auto& piece = squares_[index];
        if (piece && piece->getColor() == color) {
            positions.push_back(Position::fromIndex(index));
        }
    }
    return positions;
}

void Board::addToPositionHistory(const std::string& placementField) {
    positionHistory_.push_back(placementField);
}

int Board::countPositionOccurrences(const std::string& placementField) const {
    return static_cast<int>(std::count(positionHistory_.begin(), positionHistory_.end(), placementField));
}

std::string Board::placement() const {
    std::string result;
    for (int rank = 8; rank >= 1; --rank) {
        int emptyCount = 0;
        for (int file = 1; file <= 8; ++file) {
            const auto& piece = getPiece(Position(rank, file));
            if (!piece) {
                ++emptyCount;
                continue;
            }
            if (emptyCount > 0) {
                result += static_cast<char>('0' + emptyCount);
                emptyCount = 0;
            }
            result += piece->toFEN();
        }
        if (emptyCount > 0) {
            result += static_cast<char>('0' + emptyCount);
        }
        if (rank > 1) {
            result += '/';
        }
    }
    return result;
}

std::string Board::toFEN() const {
    std::stringstream ss;

    ss << placement();

    // Active color
    ss << ' ' << (currentTurn_ == PieceColor::WHITE ? 'w' : 'b');

    // Castling availability
    ss << ' ';
    std::string castling;
    if (castlingRights_.white_kingside) castling += 'K';
    if (castlingRights_.white_queenside) castling += 'Q';
    if (castlingRights_.black_kingside) castling += 'k';
    if (castlingRights_.black_queenside) castling += 'q';
    ss << (castling.empty() ? "-" : castling);

    // En passant target square
    ss << ' ' << (enPassantTarget_ ? enPassantTarget_->toAlgebraic() : "-");

    ss << ' ' << halfMoveClock_ << ' ' << fullMoveNumber_;

    return ss.str();
}

Board Board::fromFEN(const std::string& fen) {
    std::istringstream ss(fen);
    std::vector<std::string> fields;
    std::string field;
    while (ss >> field) {
        fields.push_back(field);
    }

    if (fields.size() < 4) {
        throw core::FormatError("Invalid FEN string (expected at least 4 fields): " + fen);
    }
    if (fields.size() > 6) {
        throw core::FormatError("Invalid FEN string (too many fields): " + fen);
    }

    Board board;
    board.clear();

    // Piece placement, rank 8 first
    int rank = 8;
    int file = 1;
    for (char c : fields[0]) {
        if (c == '/') {
            if (file != 9) {
                throw core::FormatError("Invalid FEN rank length: " + fields[0]);
            }
            --rank;
            file = 1;
            if (rank < 1) {
                throw core::FormatError("Too many ranks in FEN: " + fields[0]);
            }
        } else if (c >= '1' && c <= '8') {
            file += c - '0';
            if (file > 9) {
                throw core::FormatError("Invalid FEN rank length: " + fields[0]);
            }
        } else {
            if (file > 8) {
                throw core::FormatError("Invalid FEN rank length: " + fields[0]);
            }
            board.setPiece(Position(rank, file), Piece::fromFEN(c));
            ++file;
        }
    }
    if (rank != 1 || file != 9) {
        throw core::FormatError("Incomplete piece placement in FEN: " + fields[0]);
    }

    // Active color
    if (fields[1] == "w") {
        board.currentTurn_ = PieceColor::WHITE;
    } else if (fields[1] == "b") {
        board.currentTurn_ = PieceColor::BLACK;
    } else {
        throw core::FormatError("Invalid active color in FEN: " + fields[1]);
    }

    // Castling availability
    const std::string& castling = fields[2];
    if (castling != "-" &&
        castling.find_first_not_of("KQkq") != std::string::npos) {
        throw core::FormatError("Invalid castling field in FEN: " + castling);
    }
    board.castlingRights_.white_kingside = castling.find('K') != std::string::npos;
    board.castlingRights_.white_queenside = castling.find('Q') != std::string::npos;
    board.castlingRights_.black_kingside = castling.find('k') != std::string::npos;
    board.castlingRights_.black_queenside = castling.find('q') != std::string::npos;

    // En passant target square
    if (fields[3] != "-") {
        board.enPassantTarget_ = Position::fromAlgebraic(fields[3]);
    }

    if (fields.size() >= 5) {
        board.halfMoveClock_ = parseCounter(fields[4], "halfmove clock");
    }
    if (fields.size() >= 6) {
        board.fullMoveNumber_ = parseCounter(fields[5], "fullmove number");
        if (board.fullMoveNumber_ < 1) {
            throw core::FormatError("Invalid fullmove number in FEN: " + fields[5]);
        }
    }

    return board;
}

std::string Board::toString() const {
    std::stringstream ss;

    ss << "  a b c d e f g h" << std::endl;
    for (int rank = 8; rank >= 1; --rank) {
        ss << rank << " ";
        for (int file = 1; file <= 8; ++file) {
            const auto& piece = getPiece(Position(rank, file));
            ss << (piece ? piece->toFEN() : '.') << " ";
        }
        ss << rank << std::endl;
    }
    ss << "  a b c d e f g h" << std::endl;

    return ss.str();
}

bool Board::operator==(const Board& other) const {
    for (int index = 0; index < NUM_SQUARES; ++index) {
        const auto& mine = squares_[index];
        const auto& theirs = other.squares_[index];
        if (mine.has_value() != theirs.has_value()) {
            return false;
        }
        if (mine && !mine->sameKind(*theirs)) {
            return false;
        }
    }

    return currentTurn_ == other.currentTurn_ &&
           castlingRights_ == other.castlingRights_ &&
           enPassantTarget_ == other.enPassantTarget_ &&
           halfMoveClock_ == other.halfMoveClock_ &&
           fullMoveNumber_ == other.fullMoveNumber_;
}

} // namespace chess
} // namespace igknight
