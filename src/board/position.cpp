#include "tadpole/position.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace Tadpole {

namespace Zobrist {

uint64_t psq[COLOR_NB][PIECE_TYPE_NB][SQUARE_NB];
uint64_t castling[ANY_CASTLING + 1];
uint64_t enpassant[8];
uint64_t side;

// xorshift64* generator, fixed seed so keys are stable between runs
class PRNG {
    uint64_t s;
public:
    explicit PRNG(uint64_t seed) : s(seed) {}
    uint64_t rand() {
        s ^= s >> 12;
        s ^= s << 25;
        s ^= s >> 27;
        return s * 2685821657736338717ull;
    }
};

void init() {
    static std::once_flag flag;
    std::call_once(flag, [](){
        PRNG rng(1070372);
        for (int c = 0; c < COLOR_NB; ++c)
            for (int pt = 0; pt < PIECE_TYPE_NB; ++pt)
                for (int s = 0; s < SQUARE_NB; ++s)
                    psq[c][pt][s] = rng.rand();
        for (auto& k : castling)
            k = rng.rand();
        for (auto& k : enpassant)
            k = rng.rand();
        side = rng.rand();
    });
}

}

namespace {

const char* StartFEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";
const std::string PieceChars = "PNBRQK";

// Rights lost when a piece leaves or lands on the square
uint8_t castling_mask(Square s) {
    switch (s) {
        case SQ_E1: return WHITE_OO | WHITE_OOO;
        case SQ_H1: return WHITE_OO;
        case SQ_A1: return WHITE_OOO;
        case SQ_E8: return BLACK_OO | BLACK_OOO;
        case SQ_H8: return BLACK_OO;
        case SQ_A8: return BLACK_OOO;
        default:    return 0;
    }
}

int parse_counter(const std::string& token, const char* what) {
    if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos)
        throw std::invalid_argument(std::string("bad ") + what + " in FEN: " + token);
    return std::stoi(token);
}

}

std::string Move::uci() const {
    if (is_none())
        return "0000";
    std::string s = square_to_string(from) + square_to_string(to);
    if (promotion != NO_PIECE_TYPE)
        s += char(std::tolower(static_cast<unsigned char>(PieceChars[promotion])));
    return s;
}

std::ostream& operator<<(std::ostream& os, const Move& m) {
    return os << m.uci();
}

Position::Position(EmptyBoard) {
    init_bitboards();
    Zobrist::init();

    std::memset(byType, 0, sizeof(byType));
    std::memset(byColor, 0, sizeof(byColor));
    sideToMove = WHITE;
    castling = NO_CASTLING;
    epSquare = SQ_NONE;
    halfmoveClock = 0;
    fullmoveNumber = 1;
    zobrist = 0;
}

Position::Position() : Position(from_fen(StartFEN)) {}

Position Position::startpos() {
    return Position();
}

void Position::put_piece(Color c, PieceType pt, Square s) {
    const Bitboard bb = square_bb(s);
    byType[pt] |= bb;
    byColor[c] |= bb;
    zobrist ^= Zobrist::psq[c][pt][s];
}

void Position::remove_piece(Color c, PieceType pt, Square s) {
    const Bitboard bb = square_bb(s);
    byType[pt] &= ~bb;
    byColor[c] &= ~bb;
    zobrist ^= Zobrist::psq[c][pt][s];
}

PieceType Position::piece_on(Square s) const {
    const Bitboard bb = square_bb(s);
    for (PieceType pt = PAWN; pt <= KING; ++pt)
        if (byType[pt] & bb)
            return pt;
    return NO_PIECE_TYPE;
}

// The en passant square is only recorded when a pawn of the side to move
// can actually capture there, so equal positions always compare equal.
void Position::set_ep_if_capturable(Square s) {
    if (PawnAttacks[~sideToMove][s] & pieces(sideToMove, PAWN)) {
        epSquare = s;
        zobrist ^= Zobrist::enpassant[file_of(s)];
    }
}

Position Position::from_fen(const std::string& fen) {
    Position pos{EmptyBoard{}};
    std::istringstream iss(fen);
    std::string placement, side, rights, ep, halfmove, fullmove;

    if (!(iss >> placement >> side >> rights >> ep))
        throw std::invalid_argument("incomplete FEN: " + fen);
    iss >> halfmove >> fullmove;

    int rank = 7, file = 0;
    for (char ch : placement) {
        if (ch == '/') {
            if (file != 8 || rank == 0)
                throw std::invalid_argument("bad rank layout in FEN: " + fen);
            --rank;
            file = 0;
        } else if (ch >= '1' && ch <= '8') {
            file += ch - '0';
        } else {
            const unsigned char uc = static_cast<unsigned char>(ch);
            const size_t idx = PieceChars.find(char(std::toupper(uc)));
            if (idx == std::string::npos || file > 7)
                throw std::invalid_argument("bad piece placement in FEN: " + fen);
            pos.put_piece(std::isupper(uc) ? WHITE : BLACK, PieceType(idx), make_square(file, rank));
            ++file;
        }
        if (file > 8)
            throw std::invalid_argument("rank overflow in FEN: " + fen);
    }
    if (rank != 0 || file != 8)
        throw std::invalid_argument("bad rank layout in FEN: " + fen);

    if (popcount(pos.pieces(WHITE, KING)) != 1 || popcount(pos.pieces(BLACK, KING)) != 1)
        throw std::invalid_argument("each side needs exactly one king: " + fen);
    if (pos.pieces(PAWN) & (Rank1BB | Rank8BB))
        throw std::invalid_argument("pawn on a back rank: " + fen);

    if (side == "w")
        pos.sideToMove = WHITE;
    else if (side == "b")
        pos.sideToMove = BLACK;
    else
        throw std::invalid_argument("bad side to move in FEN: " + side);

    if (rights != "-") {
        for (char ch : rights) {
            switch (ch) {
                case 'K': pos.castling |= WHITE_OO;  break;
                case 'Q': pos.castling |= WHITE_OOO; break;
                case 'k': pos.castling |= BLACK_OO;  break;
                case 'q': pos.castling |= BLACK_OOO; break;
                default: throw std::invalid_argument("bad castling rights in FEN: " + rights);
            }
        }
    }
    // Drop rights whose king or rook is not at home
    const Bitboard wk = pos.pieces(WHITE, KING), bk = pos.pieces(BLACK, KING);
    const Bitboard wr = pos.pieces(WHITE, ROOK), br = pos.pieces(BLACK, ROOK);
    if (!(wk & square_bb(SQ_E1)) || !(wr & square_bb(SQ_H1))) pos.castling &= ~WHITE_OO;
    if (!(wk & square_bb(SQ_E1)) || !(wr & square_bb(SQ_A1))) pos.castling &= ~WHITE_OOO;
    if (!(bk & square_bb(SQ_E8)) || !(br & square_bb(SQ_H8))) pos.castling &= ~BLACK_OO;
    if (!(bk & square_bb(SQ_E8)) || !(br & square_bb(SQ_A8))) pos.castling &= ~BLACK_OOO;
    pos.zobrist ^= Zobrist::castling[pos.castling];

    if (ep != "-") {
        const Square s = square_from_string(ep);
        if (rank_of(s) != (pos.sideToMove == WHITE ? 5 : 2))
            throw std::invalid_argument("bad en passant square in FEN: " + ep);
        pos.set_ep_if_capturable(s);
    }

    if (!halfmove.empty())
        pos.halfmoveClock = parse_counter(halfmove, "halfmove clock");
    if (!fullmove.empty())
        pos.fullmoveNumber = std::max(1, parse_counter(fullmove, "fullmove number"));

    if (pos.sideToMove == BLACK)
        pos.zobrist ^= Zobrist::side;

    // The side that just moved cannot be left in check
    if (pos.attacked_by(pos.king_square(~pos.sideToMove), pos.sideToMove))
        throw std::invalid_argument("side not to move is in check: " + fen);

    return pos;
}

std::string Position::fen() const {
    std::ostringstream ss;

    for (int r = 7; r >= 0; --r) {
        int empty = 0;
        for (int f = 0; f < 8; ++f) {
            const Square s = make_square(f, r);
            const PieceType pt = piece_on(s);
            if (pt == NO_PIECE_TYPE) {
                ++empty;
                continue;
            }
            if (empty) {
                ss << empty;
                empty = 0;
            }
            const char ch = PieceChars[pt];
            ss << ((byColor[WHITE] & square_bb(s)) ? ch : char(std::tolower(static_cast<unsigned char>(ch))));
        }
        if (empty)
            ss << empty;
        if (r > 0)
            ss << '/';
    }

    ss << (sideToMove == WHITE ? " w " : " b ");

    if (castling == NO_CASTLING)
        ss << '-';
    else {
        if (castling & WHITE_OO)  ss << 'K';
        if (castling & WHITE_OOO) ss << 'Q';
        if (castling & BLACK_OO)  ss << 'k';
        if (castling & BLACK_OOO) ss << 'q';
    }

    ss << ' ' << (epSquare == SQ_NONE ? "-" : square_to_string(epSquare))
       << ' ' << halfmoveClock << ' ' << fullmoveNumber;

    return ss.str();
}

bool Position::attacked_by(Square s, Color attacker) const {
    const Bitboard occ = occupied();
    const Bitboard queens = pieces(attacker, QUEEN);

    return (PawnAttacks[~attacker][s] & pieces(attacker, PAWN))
        || (KnightAttacks[s] & pieces(attacker, KNIGHT))
        || (KingAttacks[s] & pieces(attacker, KING))
        || (bishop_attacks_bb(s, occ) & (pieces(attacker, BISHOP) | queens))
        || (rook_attacks_bb(s, occ) & (pieces(attacker, ROOK) | queens));
}

bool Position::in_check() const {
    return attacked_by(king_square(sideToMove), ~sideToMove);
}

bool Position::is_draw() const {
    if (halfmoveClock >= 100)
        return true;

    if (pieces(PAWN) | pieces(ROOK) | pieces(QUEEN))
        return false;

    return popcount(pieces(KNIGHT) | pieces(BISHOP)) <= 1;
}

Position Position::apply(const Move& m) const {
    Position next = *this;
    const Color us = sideToMove;
    const Color them = ~us;
    const PieceType pt = piece_on(m.from);
    const PieceType captured = (byColor[them] & square_bb(m.to)) ? piece_on(m.to) : NO_PIECE_TYPE;

    next.zobrist ^= Zobrist::castling[castling];
    if (epSquare != SQ_NONE)
        next.zobrist ^= Zobrist::enpassant[file_of(epSquare)];
    next.epSquare = SQ_NONE;
    ++next.halfmoveClock;

    if (captured != NO_PIECE_TYPE) {
        next.remove_piece(them, captured, m.to);
        next.halfmoveClock = 0;
    }

    next.remove_piece(us, pt, m.from);
    next.put_piece(us, m.promotion != NO_PIECE_TYPE ? m.promotion : pt, m.to);

    if (pt == PAWN) {
        next.halfmoveClock = 0;

        if (m.to == epSquare)
            next.remove_piece(them, PAWN, Square(us == WHITE ? m.to - 8 : m.to + 8));
    }
    else if (pt == KING && (m.to - m.from == 2 || m.from - m.to == 2)) {
        const bool kingSide = m.to > m.from;
        const Square rookFrom = Square(kingSide ? m.to + 1 : m.to - 2);
        const Square rookTo = Square(kingSide ? m.to - 1 : m.to + 1);
        next.remove_piece(us, ROOK, rookFrom);
        next.put_piece(us, ROOK, rookTo);
    }

    next.castling &= ~(castling_mask(m.from) | castling_mask(m.to));
    next.zobrist ^= Zobrist::castling[next.castling];

    next.sideToMove = them;
    next.zobrist ^= Zobrist::side;
    if (us == BLACK)
        ++next.fullmoveNumber;

    if (pt == PAWN && (m.to - m.from == 16 || m.from - m.to == 16))
        next.set_ep_if_capturable(Square((m.from + m.to) / 2));

    return next;
}

std::optional<Position> Position::null_move() const {
    if (in_check())
        return std::nullopt;

    Position next = *this;
    if (epSquare != SQ_NONE) {
        next.zobrist ^= Zobrist::enpassant[file_of(epSquare)];
        next.epSquare = SQ_NONE;
    }
    next.sideToMove = ~sideToMove;
    next.zobrist ^= Zobrist::side;
    ++next.halfmoveClock;
    if (sideToMove == BLACK)
        ++next.fullmoveNumber;
    return next;
}

MoveList Position::legal_moves() const {
    MoveList pseudo;
    pseudo.reserve(64);
    generate_pseudo_legal(pseudo);

    MoveList legal;
    legal.reserve(pseudo.size());
    for (const Move& m : pseudo) {
        const Position next = apply(m);
        if (!next.attacked_by(next.king_square(sideToMove), next.sideToMove))
            legal.push_back(m);
    }
    return legal;
}

GameStatus Position::status() const {
    return status(legal_moves());
}

GameStatus Position::status(const MoveList& legal) const {
    if (legal.empty())
        return in_check() ? GameStatus::Won : GameStatus::Drawn;
    return is_draw() ? GameStatus::Drawn : GameStatus::Ongoing;
}

Move Position::parse_move(const std::string& uci) const {
    for (const Move& m : legal_moves())
        if (m.uci() == uci)
            return m;
    throw std::invalid_argument("illegal move " + uci + " in " + fen());
}

bool Position::operator==(const Position& other) const {
    return zobrist == other.zobrist
        && sideToMove == other.sideToMove
        && castling == other.castling
        && epSquare == other.epSquare
        && std::memcmp(byType, other.byType, sizeof(byType)) == 0
        && std::memcmp(byColor, other.byColor, sizeof(byColor)) == 0;
}

std::ostream& operator<<(std::ostream& os, const Position& pos) {
    return os << pos.fen();
}

}
