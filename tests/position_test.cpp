#include <gtest/gtest.h>

#include "tadpole/position.hpp"

using namespace Tadpole;

namespace {

const char* Kiwipete = "r3k2r/p1ppqpb1/bn2pnp1/3PN3/1p2P3/2N2Q1p/PPPBBPPP/R3K2R w KQkq - 0 1";

uint64_t perft(const Position& pos, int depth) {
    const MoveList moves = pos.legal_moves();
    if (depth == 1)
        return moves.size();

    uint64_t nodes = 0;
    for (const Move& m : moves)
        nodes += perft(pos.apply(m), depth - 1);
    return nodes;
}

bool contains(const MoveList& moves, const std::string& uci) {
    for (const Move& m : moves)
        if (m.uci() == uci)
            return true;
    return false;
}

}

TEST(PositionTest, PerftStartPosition) {
    const Position pos = Position::startpos();
    EXPECT_EQ(perft(pos, 1), 20u);
    EXPECT_EQ(perft(pos, 2), 400u);
    EXPECT_EQ(perft(pos, 3), 8902u);
}

TEST(PositionTest, PerftKiwipete) {
    const Position pos = Position::from_fen(Kiwipete);
    EXPECT_EQ(perft(pos, 1), 48u);
    EXPECT_EQ(perft(pos, 2), 2039u);
}

TEST(PositionTest, PerftPinsAndEnPassant) {
    const Position pos = Position::from_fen("8/2p5/3p4/KP5r/1R3p1k/8/4P1P1/8 w - - 0 1");
    EXPECT_EQ(perft(pos, 1), 14u);
    EXPECT_EQ(perft(pos, 2), 191u);
    EXPECT_EQ(perft(pos, 3), 2812u);
}

TEST(PositionTest, PerftPromotionsAndChecks) {
    const Position pos = Position::from_fen("r3k2r/Pppp1ppp/1b3nbN/nP6/BBP1P3/q4N2/Pp1P2PP/R2Q1RK1 w kq - 0 1");
    EXPECT_EQ(perft(pos, 1), 6u);
    EXPECT_EQ(perft(pos, 2), 264u);

    const Position other = Position::from_fen("rnbq1k1r/pp1Pbppp/2p5/8/2B5/8/PPP1NnPP/RNBQK2R w KQ - 1 8");
    EXPECT_EQ(perft(other, 1), 44u);
    EXPECT_EQ(perft(other, 2), 1486u);
}

TEST(PositionTest, FenRoundTrip) {
    EXPECT_EQ(Position::startpos().fen(), "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1");
    EXPECT_EQ(Position::from_fen(Kiwipete).fen(), Kiwipete);
}

TEST(PositionTest, MissingClocksDefault) {
    const Position pos = Position::from_fen("4k3/8/8/8/8/8/8/4K3 b - -");
    EXPECT_EQ(pos.halfmove_clock(), 0);
    EXPECT_EQ(pos.fullmove_number(), 1);
    EXPECT_EQ(pos.side_to_move(), BLACK);
}

TEST(PositionTest, MalformedFenThrows) {
    EXPECT_THROW(Position::from_fen(""), std::invalid_argument);
    EXPECT_THROW(Position::from_fen("8/8/8 w - - 0 1"), std::invalid_argument);
    EXPECT_THROW(Position::from_fen("8/8/8/8/8/8/8/8 w - - 0 1"), std::invalid_argument);
    EXPECT_THROW(Position::from_fen("4k3/8/8/8/8/8/8/4K3 x - - 0 1"), std::invalid_argument);
    EXPECT_THROW(Position::from_fen("4k3/8/8/8/8/8/8/4K2X w - - 0 1"), std::invalid_argument);
    EXPECT_THROW(Position::from_fen("4k3/8/8/8/8/8/8/4K3 w - - x 1"), std::invalid_argument);

    // Bytes outside ASCII, as in a UTF-8 encoded letter
    EXPECT_THROW(Position::from_fen("4k3/8/8/8/8/8/8/4K2\xC3 w - - 0 1"), std::invalid_argument);
    EXPECT_THROW(Position::from_fen("4k3/8/8/8/8/8/8/4K1\xC3\xA9 w - - 0 1"), std::invalid_argument);
}

TEST(PositionTest, DoublePushRecordsOnlyCapturableEnPassant) {
    const Position pos = Position::startpos().apply(Position::startpos().parse_move("e2e4"));
    EXPECT_EQ(pos.ep_square(), SQ_NONE);
    EXPECT_EQ(pos.fen(), "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");

    const Position before = Position::from_fen("rnbqkbnr/ppp1pppp/8/8/3p4/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1");
    const Position after = before.apply(before.parse_move("e2e4"));
    EXPECT_EQ(after.ep_square(), SQ_E3);
}

TEST(PositionTest, EnPassantCaptureRemovesPawn) {
    const Position pos = Position::from_fen("rnbqkbnr/ppp1p1pp/8/3pPp2/8/8/PPPP1PPP/RNBQKBNR w KQkq f6 0 3");
    const MoveList moves = pos.legal_moves();
    ASSERT_TRUE(contains(moves, "e5f6"));

    const Position next = pos.apply(pos.parse_move("e5f6"));
    EXPECT_FALSE(next.pieces(BLACK, PAWN) & square_bb(SQ_F5));
    EXPECT_TRUE(next.pieces(WHITE, PAWN) & square_bb(SQ_F6));
    EXPECT_EQ(next.halfmove_clock(), 0);
}

TEST(PositionTest, CastlingMovesRookAndClearsRights) {
    const Position pos = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
    const MoveList moves = pos.legal_moves();
    EXPECT_TRUE(contains(moves, "e1g1"));
    EXPECT_TRUE(contains(moves, "e1c1"));

    const Position next = pos.apply(pos.parse_move("e1g1"));
    EXPECT_EQ(next.piece_on(SQ_G1), KING);
    EXPECT_EQ(next.piece_on(SQ_F1), ROOK);
    EXPECT_EQ(next.piece_on(SQ_H1), NO_PIECE_TYPE);
    EXPECT_EQ(next.castling_rights(), BLACK_OO | BLACK_OOO);
}

TEST(PositionTest, NoCastlingThroughAttackedSquare) {
    const Position pos = Position::from_fen("4k3/8/8/8/8/8/5r2/R3K2R w KQ - 0 1");
    const MoveList moves = pos.legal_moves();
    EXPECT_FALSE(contains(moves, "e1g1"));
    EXPECT_TRUE(contains(moves, "e1c1"));
}

TEST(PositionTest, PromotionGeneratesFourPieces) {
    const Position pos = Position::from_fen("8/P7/8/8/8/8/8/k6K w - - 0 1");
    const MoveList moves = pos.legal_moves();
    EXPECT_TRUE(contains(moves, "a7a8q"));
    EXPECT_TRUE(contains(moves, "a7a8r"));
    EXPECT_TRUE(contains(moves, "a7a8b"));
    EXPECT_TRUE(contains(moves, "a7a8n"));
    EXPECT_FALSE(contains(moves, "a7a8"));

    const Position next = pos.apply(pos.parse_move("a7a8n"));
    EXPECT_EQ(next.piece_on(SQ_A8), KNIGHT);
}

TEST(PositionTest, TranspositionsCompareEqual) {
    Position a = Position::startpos();
    for (const char* m : { "g1f3", "g8f6", "b1c3" })
        a = a.apply(a.parse_move(m));

    Position b = Position::startpos();
    for (const char* m : { "b1c3", "g8f6", "g1f3" })
        b = b.apply(b.parse_move(m));

    EXPECT_EQ(a, b);
    EXPECT_EQ(a.key(), b.key());
    EXPECT_NE(a, Position::startpos());
}

TEST(PositionTest, KeyMatchesFreshlyParsedPosition) {
    Position pos = Position::from_fen(Kiwipete);
    for (const char* m : { "e1c1", "h3g2", "d5e6", "g2h1q" })
        pos = pos.apply(pos.parse_move(m));

    const Position parsed = Position::from_fen(pos.fen());
    EXPECT_EQ(pos, parsed);
    EXPECT_EQ(pos.key(), parsed.key());
}

TEST(PositionTest, NullMove) {
    const Position pos = Position::startpos();
    const std::optional<Position> passed = pos.null_move();
    ASSERT_TRUE(passed.has_value());
    EXPECT_EQ(passed->side_to_move(), BLACK);
    EXPECT_EQ(passed->occupied(), pos.occupied());

    const Position check = Position::from_fen("4k3/8/8/8/8/8/4r3/4K3 w - - 0 1");
    EXPECT_TRUE(check.in_check());
    EXPECT_FALSE(check.null_move().has_value());
}

TEST(PositionTest, Status) {
    EXPECT_EQ(Position::startpos().status(), GameStatus::Ongoing);

    const Position foolsMate = Position::from_fen("rnb1kbnr/pppp1ppp/8/4p3/6Pq/5P2/PPPPP2P/RNBQKBNR w KQkq - 1 3");
    EXPECT_EQ(foolsMate.status(), GameStatus::Won);

    const Position stalemate = Position::from_fen("k7/8/1Q6/8/8/8/8/7K b - - 0 1");
    EXPECT_EQ(stalemate.status(), GameStatus::Drawn);

    const Position bareKings = Position::from_fen("8/8/8/4k3/8/8/8/4K3 w - - 0 1");
    EXPECT_EQ(bareKings.status(), GameStatus::Drawn);

    const Position fiftyMoves = Position::from_fen("8/8/8/4k3/8/8/R7/4K3 w - - 100 80");
    EXPECT_EQ(fiftyMoves.status(), GameStatus::Drawn);
}

TEST(PositionTest, ParseMoveRejectsIllegal) {
    const Position pos = Position::startpos();
    EXPECT_EQ(pos.parse_move("e2e4").uci(), "e2e4");
    EXPECT_THROW(pos.parse_move("e2e5"), std::invalid_argument);
    EXPECT_THROW(pos.parse_move("junk"), std::invalid_argument);
}
