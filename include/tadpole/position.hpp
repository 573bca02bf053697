#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "tadpole/bitboard.hpp"

namespace Tadpole {

struct Move {
    Square from = SQ_NONE;
    Square to = SQ_NONE;
    PieceType promotion = NO_PIECE_TYPE;

    static constexpr Move none() { return Move{}; }
    bool is_none() const { return from == SQ_NONE; }

    // Long algebraic notation as used by UCI ("e2e4", "e7e8q", "0000")
    std::string uci() const;

    bool operator==(const Move& other) const {
        return from == other.from && to == other.to && promotion == other.promotion;
    }
    bool operator!=(const Move& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Move& m);

using MoveList = std::vector<Move>;

// Won means the side to move has been checkmated.
enum class GameStatus { Ongoing, Won, Drawn };

class Position {
private:
    Bitboard byType[PIECE_TYPE_NB];
    Bitboard byColor[COLOR_NB];
    Color sideToMove;
    uint8_t castling;
    Square epSquare;
    int halfmoveClock;
    int fullmoveNumber;

    // Zobrist key over placement, side, castling and en passant
    uint64_t zobrist;

public:
    // The standard starting position
    Position();

    static Position startpos();
    static Position from_fen(const std::string& fen);
    std::string fen() const;

    Color side_to_move() const { return sideToMove; }
    Bitboard pieces(Color c) const { return byColor[c]; }
    Bitboard pieces(PieceType pt) const { return byType[pt]; }
    Bitboard pieces(Color c, PieceType pt) const { return byType[pt] & byColor[c]; }
    Bitboard occupied() const { return byColor[WHITE] | byColor[BLACK]; }
    PieceType piece_on(Square s) const;
    uint8_t castling_rights() const { return castling; }
    Square ep_square() const { return epSquare; }
    int halfmove_clock() const { return halfmoveClock; }
    int fullmove_number() const { return fullmoveNumber; }
    uint64_t key() const { return zobrist; }

    bool in_check() const;
    // Fifty-move rule or bare kings with at most one minor piece
    bool is_draw() const;

    MoveList legal_moves() const;
    Position apply(const Move& m) const;
    std::optional<Position> null_move() const;
    GameStatus status() const;
    // Same, reusing the legal moves of this position
    GameStatus status(const MoveList& legal) const;

    // Finds the legal move written in UCI notation, throws std::invalid_argument
    Move parse_move(const std::string& uci) const;

    bool operator==(const Position& other) const;
    bool operator!=(const Position& other) const { return !(*this == other); }

private:
    struct EmptyBoard {};
    explicit Position(EmptyBoard);

    void put_piece(Color c, PieceType pt, Square s);
    void remove_piece(Color c, PieceType pt, Square s);
    void set_ep_if_capturable(Square s);
    Square king_square(Color c) const { return lsb(pieces(c, KING)); }
    bool attacked_by(Square s, Color attacker) const;

    // movegen.cpp
    void generate_pseudo_legal(MoveList& moves) const;
    void generate_castling(MoveList& moves) const;
};

std::ostream& operator<<(std::ostream& os, const Position& pos);

}
