#include <gtest/gtest.h>
#include <algorithm>
#include "igknight/chess/move_validator.h"
#include "igknight/core/exceptions.h"

namespace igknight {
namespace chess {

class MoveValidatorTest : public ::testing::Test {
protected:
    MoveValidator validator;
    MoveGenerator generator;

    void play(Board& board, const std::vector<std::string>& moves) {
        for (const auto& label : moves) {
            validator.applyMove(board, Move::fromAlgebraic(label));
        }
    }

    bool isLegal(const Board& board, const std::string& label) {
        return validator.validateMove(board, Move::fromAlgebraic(label));
    }

    static bool hasCastle(const std::vector<Move>& moves, int file) {
        return std::any_of(moves.begin(), moves.end(), [file](const Move& move) {
            return move.isCastling && move.to.getFile() == file;
        });
    }
};

TEST_F(MoveValidatorTest, StartingPositionHasTwentyLegalMoves) {
    Board board;
    EXPECT_EQ(validator.generateLegalMoves(board, PieceColor::WHITE).size(), 20u);
    EXPECT_TRUE(isLegal(board, "e2e4"));
    EXPECT_TRUE(isLegal(board, "g1f3"));
    EXPECT_FALSE(isLegal(board, "e2e5"));
    EXPECT_FALSE(isLegal(board, "e7e5"));  // not black's turn
    EXPECT_FALSE(isLegal(board, "e3e4"));  // empty square
}

TEST_F(MoveValidatorTest, PawnDoublePushEncoding) {
    Board board;
    Move executed = validator.applyMove(board, Move::fromAlgebraic("e2e4"));

    EXPECT_EQ(executed.toAlgebraic(), "e2e4");
    EXPECT_EQ(board.toFEN(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq e3 0 1");
    ASSERT_EQ(board.getPositionHistory().size(), 1u);
    EXPECT_EQ(board.getPositionHistory()[0], board.placement());

    const auto& pawn = board.getPiece(Position::fromAlgebraic("e4"));
    ASSERT_TRUE(pawn.has_value());
    EXPECT_TRUE(pawn->hasMoved());
}

TEST_F(MoveValidatorTest, ClocksFollowMoves) {
    Board board;
    play(board, {"g1f3", "g8f6"});
    EXPECT_EQ(board.getHalfMoveClock(), 2);
    EXPECT_EQ(board.getFullMoveNumber(), 2);

    play(board, {"e2e4"});
    EXPECT_EQ(board.getHalfMoveClock(), 0);

    play(board, {"f6e4"});
    EXPECT_EQ(board.getHalfMoveClock(), 0);
    EXPECT_EQ(board.getFullMoveNumber(), 3);
}

TEST_F(MoveValidatorTest, PinnedPieceCannotMove) {
    // Bishop on e2 pinned by the rook on e8
    Board board = Board::fromFEN("4r1k1/8/8/8/8/8/4B3/4K3 w - - 0 1");
    EXPECT_TRUE(validator.generateLegalMovesForPiece(board, Position::fromAlgebraic("e2")).empty());
    EXPECT_FALSE(isLegal(board, "e2d3"));
}

TEST_F(MoveValidatorTest, MustAnswerCheck) {
    Board board = Board::fromFEN("4r1k1/8/8/8/8/8/3P4/3QK3 w - - 0 1");
    EXPECT_TRUE(validator.isKingInCheck(board, PieceColor::WHITE));

    auto moves = validator.generateLegalMoves(board, PieceColor::WHITE);
    for (const auto& move : moves) {
        Board next = board.copy();
        validator.executeMove(next, move);
        EXPECT_FALSE(validator.isKingInCheck(next, PieceColor::WHITE)) << move.toAlgebraic();
    }
    EXPECT_TRUE(isLegal(board, "d1e2"));
    EXPECT_TRUE(isLegal(board, "e1f2"));
    EXPECT_FALSE(isLegal(board, "d2d3"));
}

TEST_F(MoveValidatorTest, LegalMovesNeverLeaveKingInCheck) {
    const std::vector<std::string> fens = {
        Board::START_FEN,
        "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1",
        "8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1",
        "r1bqkbnr/pppp1ppp/2n5/4p2Q/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 3 3",
    };
    for (const auto& fen : fens) {
        Board board = Board::fromFEN(fen);
        PieceColor mover = board.getCurrentTurn();
        for (const auto& move : validator.generateLegalMoves(board, mover)) {
            Board next = board.copy();
            validator.executeMove(next, move);
            auto king = next.findKing(mover);
            ASSERT_TRUE(king.has_value());
            EXPECT_FALSE(generator.isSquareAttacked(next, *king, oppositeColor(mover)))
                << fen << " " << move.toAlgebraic();
        }
    }
}

TEST_F(MoveValidatorTest, CastlingExecutesFromBareLabel) {
    Board board = Board::fromFEN("4k3/8/8/8/8/8/8/R3K2R w KQ - 0 1");
    Move executed = validator.applyMove(board, Move::fromAlgebraic("e1g1"));

    EXPECT_TRUE(executed.isCastling);
    EXPECT_EQ(board.toFEN(), "4k3/8/8/8/8/8/8/R4RK1 b - - 1 1");

    const auto& rook = board.getPiece(Position::fromAlgebraic("f1"));
    ASSERT_TRUE(rook.has_value());
    EXPECT_EQ(rook->getType(), PieceType::ROOK);
    EXPECT_TRUE(rook->hasMoved());
}

TEST_F(MoveValidatorTest, QueensideCastling) {
    Board board = Board::fromFEN("r3k3/8/8/8/8/8/8/4K3 b q - 0 1");
    validator.applyMove(board, Move::fromAlgebraic("e8c8"));
    EXPECT_EQ(board.toFEN(), "2kr4/8/8/8/8/8/8/4K3 w - - 1 2");
}

TEST_F(MoveValidatorTest, CannotCastleThroughAttackedSquare) {
    // Black rook on f2 covers f1
    Board board = Board::fromFEN("4k3/8/8/8/8/8/5r2/R3K2R w KQ - 0 1");
    auto moves = validator.generateLegalMoves(board, PieceColor::WHITE);
    EXPECT_FALSE(hasCastle(moves, 7));
    EXPECT_TRUE(hasCastle(moves, 3));
    EXPECT_FALSE(validator.canCastleThrough(board, PieceColor::WHITE, true));
    EXPECT_TRUE(validator.canCastleThrough(board, PieceColor::WHITE, false));
}

TEST_F(MoveValidatorTest, CannotCastleOutOfCheck) {
    Board board = Board::fromFEN("4k3/8/8/8/8/8/4r3/R3K2R w KQ - 0 1");
    auto moves = validator.generateLegalMoves(board, PieceColor::WHITE);
    EXPECT_FALSE(hasCastle(moves, 7));
    EXPECT_FALSE(hasCastle(moves, 3));
}

TEST_F(MoveValidatorTest, CannotCastleIntoCheck) {
    // Black bishop on b6 covers g1
    Board board = Board::fromFEN("4k3/8/1b6/8/8/8/8/R3K2R w KQ - 0 1");
    auto moves = validator.generateLegalMoves(board, PieceColor::WHITE);
    EXPECT_FALSE(hasCastle(moves, 7));
    EXPECT_TRUE(hasCastle(moves, 3));
}

TEST_F(MoveValidatorTest, QueensideAllowsAttackedRookTransitSquare) {
    // b1 is attacked but the king never crosses it
    Board board = Board::fromFEN("1r2k3/8/8/8/8/8/8/R3K3 w Q - 0 1");
    EXPECT_TRUE(hasCastle(validator.generateLegalMoves(board, PieceColor::WHITE), 3));
}

TEST_F(MoveValidatorTest, KingMoveRemovesCastlingRights) {
    Board board = Board::fromFEN("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    play(board, {"e1f1"});
    EXPECT_FALSE(board.canCastleKingside(PieceColor::WHITE));
    EXPECT_FALSE(board.canCastleQueenside(PieceColor::WHITE));
    EXPECT_EQ(board.toFEN(), "r3k2r/8/8/8/8/8/8/R4K1R b kq - 1 1");

    play(board, {"e8d8", "f1e1"});
    auto moves = validator.generateLegalMoves(board, PieceColor::WHITE);
    EXPECT_FALSE(hasCastle(moves, 7));
    EXPECT_FALSE(hasCastle(moves, 3));
}

TEST_F(MoveValidatorTest, RookMoveRemovesOneWing) {
    Board board = Board::fromFEN("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    play(board, {"h1h2"});
    EXPECT_FALSE(board.canCastleKingside(PieceColor::WHITE));
    EXPECT_TRUE(board.canCastleQueenside(PieceColor::WHITE));

    // The rook returning to its corner does not restore the right
    play(board, {"e8d8", "h2h1"});
    EXPECT_FALSE(board.canCastleKingside(PieceColor::WHITE));
    play(board, {"d8e8"});
    auto moves = validator.generateLegalMoves(board, PieceColor::WHITE);
    EXPECT_FALSE(hasCastle(moves, 7));
    EXPECT_TRUE(hasCastle(moves, 3));
}

TEST_F(MoveValidatorTest, CapturingCornerRookRemovesOpponentRight) {
    Board board = Board::fromFEN("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    Move executed = validator.applyMove(board, Move::fromAlgebraic("a1a8"));
    EXPECT_TRUE(executed.isCapture);
    EXPECT_EQ(board.toFEN(), "R3k2r/8/8/8/8/8/8/4K2R b Kk - 0 1");
}

TEST_F(MoveValidatorTest, EnPassantCaptureRemovesPawn) {
    Board board;
    play(board, {"e2e4", "a7a6", "e4e5", "d7d5"});
    ASSERT_TRUE(board.getEnPassantTarget().has_value());
    EXPECT_EQ(board.getEnPassantTarget()->toAlgebraic(), "d6");

    Move executed = validator.applyMove(board, Move::fromAlgebraic("e5d6"));
    EXPECT_TRUE(executed.isEnPassant);
    EXPECT_TRUE(executed.isCapture);
    EXPECT_FALSE(board.getPiece(Position::fromAlgebraic("d5")).has_value());
    EXPECT_EQ(board.toFEN(), "rnbqkbnr/1pp1pppp/p2P4/8/8/8/PPPP1PPP/RNBQKBNR b KQkq - 0 3");
}

TEST_F(MoveValidatorTest, EnPassantExpiresAfterOnePly) {
    Board board;
    play(board, {"e2e4", "a7a6", "e4e5", "d7d5", "a2a3"});
    EXPECT_FALSE(board.getEnPassantTarget().has_value());

    play(board, {"h7h6"});
    EXPECT_FALSE(isLegal(board, "e5d6"));
}

TEST_F(MoveValidatorTest, PromotionRequiresPieceChoice) {
    Board board = Board::fromFEN("8/P7/8/8/8/8/8/k6K w - - 5 40");
    EXPECT_FALSE(isLegal(board, "a7a8"));
    EXPECT_THROW(validator.applyMove(board, Move::fromAlgebraic("a7a8")), core::IllegalMoveError);

    validator.applyMove(board, Move::fromAlgebraic("a7a8n"));
    const auto& knight = board.getPiece(Position::fromAlgebraic("a8"));
    ASSERT_TRUE(knight.has_value());
    EXPECT_EQ(knight->getType(), PieceType::KNIGHT);
    EXPECT_EQ(knight->getColor(), PieceColor::WHITE);
    EXPECT_EQ(board.getHalfMoveClock(), 0);
}

TEST_F(MoveValidatorTest, ApplyRejectsIllegalMoves) {
    Board board;
    try {
        validator.applyMove(board, Move::fromAlgebraic("e2e5"));
        FAIL() << "Expected IllegalMoveError";
    } catch (const core::IllegalMoveError& e) {
        EXPECT_EQ(e.getMove(), "e2e5");
    }
    EXPECT_EQ(board.toFEN(), Board::START_FEN);
}

TEST_F(MoveValidatorTest, ExecuteFromEmptySquareThrows) {
    Board board;
    EXPECT_THROW(validator.executeMove(board, Move::fromAlgebraic("e4e5")), core::IllegalMoveError);
}

TEST_F(MoveValidatorTest, MissingKing) {
    Board board = Board::fromFEN("4k3/8/8/8/8/8/8/R7 w - - 0 1");
    EXPECT_FALSE(validator.isMoveLegal(board, Move::fromAlgebraic("a1a2"), PieceColor::WHITE));
    EXPECT_THROW(validator.isKingInCheck(board, PieceColor::WHITE), core::CorruptStateError);
    EXPECT_FALSE(validator.isKingInCheck(board, PieceColor::BLACK));
}

TEST_F(MoveValidatorTest, LegalMovesForEmptySquare) {
    Board board;
    EXPECT_TRUE(validator.generateLegalMovesForPiece(board, Position::fromAlgebraic("e4")).empty());
}

} // namespace chess
} // namespace igknight
