#include <gtest/gtest.h>
#include "igknight/chess/game_state_service.h"
#include "igknight/core/exceptions.h"

namespace igknight {
namespace chess {

class GameStateServiceTest : public ::testing::Test {
protected:
    GameStateService service;

    void play(Board& board, const std::vector<std::string>& moves) {
        for (const auto& label : moves) {
            service.getValidator().applyMove(board, Move::fromAlgebraic(label));
        }
    }

    GameStatus statusOf(const std::string& fen) {
        return service.determineGameStatus(Board::fromFEN(fen));
    }
};

TEST_F(GameStateServiceTest, StartingPositionIsInProgress) {
    Board board;
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::IN_PROGRESS);
    EXPECT_FALSE(service.isInCheck(board, PieceColor::WHITE));
    EXPECT_TRUE(service.hasLegalMoves(board, PieceColor::WHITE));

    GameSnapshot snapshot = service.getSnapshot(board);
    EXPECT_EQ(snapshot.fen, Board::START_FEN);
    EXPECT_EQ(snapshot.currentTurn, PieceColor::WHITE);
    EXPECT_EQ(snapshot.status, GameStatus::IN_PROGRESS);
    EXPECT_FALSE(snapshot.isCheck);
    EXPECT_EQ(snapshot.legalMovesCount, 20);
    EXPECT_EQ(snapshot.halfMoveClock, 0);
    EXPECT_EQ(snapshot.fullMoveNumber, 1);
}

TEST_F(GameStateServiceTest, ScholarsMate) {
    Board board;
    play(board, {"e2e4", "e7e5", "d1h5", "b8c6", "f1c4", "g8f6"});
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::IN_PROGRESS);

    play(board, {"h5f7"});
    EXPECT_TRUE(service.isInCheck(board, PieceColor::BLACK));
    EXPECT_TRUE(service.isCheckmate(board, PieceColor::BLACK));
    EXPECT_FALSE(service.isStalemate(board, PieceColor::BLACK));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::CHECKMATE);
    EXPECT_EQ(service.getSnapshot(board).legalMovesCount, 0);
}

TEST_F(GameStateServiceTest, CheckIsNotMateWhenEscapeExists) {
    Board board;
    play(board, {"e2e4", "f7f6", "d1h5"});
    EXPECT_TRUE(service.isInCheck(board, PieceColor::BLACK));
    EXPECT_FALSE(service.isCheckmate(board, PieceColor::BLACK));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::IN_PROGRESS);
    EXPECT_TRUE(service.getSnapshot(board).isCheck);
}

TEST_F(GameStateServiceTest, Stalemate) {
    Board board = Board::fromFEN("7k/5Q2/6K1/8/8/8/8/8 b - - 0 1");
    EXPECT_TRUE(service.isStalemate(board, PieceColor::BLACK));
    EXPECT_FALSE(service.isCheckmate(board, PieceColor::BLACK));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::STALEMATE);
}

TEST_F(GameStateServiceTest, CheckmateAndStalemateAreExclusive) {
    const std::vector<std::string> fens = {
        Board::START_FEN,
        "7k/5Q2/6K1/8/8/8/8/8 b - - 0 1",
        "r1bqkb1r/pppp1Qpp/2n2n2/4p3/2B1P3/8/PPPP1PPP/RNB1K1NR b KQkq - 0 4",
        "6rk/6pp/8/8/8/8/8/6RK w - - 0 1",
    };
    for (const auto& fen : fens) {
        Board board = Board::fromFEN(fen);
        PieceColor side = board.getCurrentTurn();
        EXPECT_FALSE(service.isCheckmate(board, side) && service.isStalemate(board, side)) << fen;
    }
}

TEST_F(GameStateServiceTest, InsufficientMaterial) {
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/8/8 w - - 0 1"), GameStatus::DRAW_INSUFFICIENT_MATERIAL);
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/8/6N1 w - - 0 1"), GameStatus::DRAW_INSUFFICIENT_MATERIAL);
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/8/6b1 w - - 0 1"), GameStatus::DRAW_INSUFFICIENT_MATERIAL);

    // Bishops on the same square color
    EXPECT_EQ(statusOf("8/8/4k3/8/8/8/8/K1B1b3 w - - 0 1"), GameStatus::DRAW_INSUFFICIENT_MATERIAL);

    // Bishops on opposite colors, or mating material
    EXPECT_EQ(statusOf("8/8/4k3/8/8/8/8/K1B2b2 w - - 0 1"), GameStatus::IN_PROGRESS);
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/8/R7 w - - 0 1"), GameStatus::IN_PROGRESS);
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/4P3/8 w - - 0 1"), GameStatus::IN_PROGRESS);
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/8/5NN1 w - - 0 1"), GameStatus::IN_PROGRESS);
    EXPECT_EQ(statusOf("8/8/4k3/8/8/4K3/8/1N4n1 w - - 0 1"), GameStatus::IN_PROGRESS);
}

TEST_F(GameStateServiceTest, FiftyMoveRule) {
    Board board = Board::fromFEN("8/8/4k3/8/8/4K3/8/R7 w - - 99 80");
    EXPECT_FALSE(service.isDrawByFiftyMoveRule(board));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::IN_PROGRESS);

    play(board, {"a1a2"});
    EXPECT_TRUE(service.isDrawByFiftyMoveRule(board));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::DRAW_FIFTY_MOVE);
}

TEST_F(GameStateServiceTest, MateTakesPriorityOverFiftyMoveRule) {
    Board board = Board::fromFEN("6rk/6pp/8/8/8/8/8/R5K1 w - - 99 80");
    play(board, {"a1a8"});
    EXPECT_EQ(board.getHalfMoveClock(), 100);
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::DRAW_FIFTY_MOVE);

    Board mate = Board::fromFEN("6k1/5ppp/8/8/8/8/8/R5K1 w - - 99 80");
    play(mate, {"a1a8"});
    EXPECT_EQ(service.determineGameStatus(mate), GameStatus::CHECKMATE);
}

TEST_F(GameStateServiceTest, ThreefoldRepetition) {
    Board board;
    const std::vector<std::string> shuffle = {"g1f3", "g8f6", "f3g1", "f6g8"};
    play(board, shuffle);
    play(board, shuffle);
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::IN_PROGRESS);

    // Third arrival at the position after Nf3
    play(board, {"g1f3"});
    EXPECT_TRUE(service.isDrawByThreefoldRepetition(board));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::DRAW_REPETITION);
}

TEST_F(GameStateServiceTest, RepetitionComparesPlacementOnly) {
    // Same placement with a different side to move and no castling rights
    // still counts toward repetition
    Board board = Board::fromFEN("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR b - - 0 1");
    std::string placement = board.placement();
    board.setPositionHistory({placement, placement, placement});
    EXPECT_TRUE(service.isDrawByThreefoldRepetition(board));
    EXPECT_EQ(service.determineGameStatus(board), GameStatus::DRAW_REPETITION);
}

TEST_F(GameStateServiceTest, StatusIsIdempotent) {
    Board board;
    play(board, {"e2e4", "e7e5", "d1h5", "b8c6", "f1c4", "g8f6", "h5f7"});
    std::string before = board.toFEN();
    size_t historySize = board.getPositionHistory().size();

    GameStatus first = service.determineGameStatus(board);
    GameStatus second = service.determineGameStatus(board);
    EXPECT_EQ(first, second);
    EXPECT_EQ(board.toFEN(), before);
    EXPECT_EQ(board.getPositionHistory().size(), historySize);
}

TEST_F(GameStateServiceTest, MissingKingIsCorruptState) {
    Board board = Board::fromFEN("8/8/8/8/8/8/8/4K3 b - - 0 1");
    EXPECT_THROW(service.determineGameStatus(board), core::CorruptStateError);
}

TEST_F(GameStateServiceTest, StatusNames) {
    EXPECT_EQ(gameStatusToString(GameStatus::IN_PROGRESS), "IN_PROGRESS");
    EXPECT_EQ(gameStatusToString(GameStatus::DRAW_INSUFFICIENT_MATERIAL), "DRAW_INSUFFICIENT_MATERIAL");
    EXPECT_EQ(gameStatusToString(GameStatus::TIMEOUT), "TIMEOUT");

    EXPECT_FALSE(isTerminalStatus(GameStatus::WAITING));
    EXPECT_FALSE(isTerminalStatus(GameStatus::IN_PROGRESS));
    EXPECT_TRUE(isTerminalStatus(GameStatus::CHECKMATE));
    EXPECT_TRUE(isTerminalStatus(GameStatus::RESIGNATION));
    EXPECT_TRUE(isTerminalStatus(GameStatus::DRAW_AGREEMENT));
}

} // namespace chess
} // namespace igknight
