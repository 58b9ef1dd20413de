#include "castellan/model/fen.hpp"

#include <array>

#include "castellan/model/position_error.hpp"

namespace castellan::model::fen {

namespace {

using core::Color;
using core::PieceType;
using core::Square;

inline char tolower_ascii(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c | 32) : c;
}
inline char toupper_ascii(char c) noexcept {
  return (c >= 'a' && c <= 'z') ? static_cast<char>(c & ~32) : c;
}

PieceType piece_from_char(char lo) noexcept {
  switch (lo) {
    case 'k':
      return PieceType::King;
    case 'q':
      return PieceType::Queen;
    case 'r':
      return PieceType::Rook;
    case 'b':
      return PieceType::Bishop;
    case 'n':
      return PieceType::Knight;
    case 'p':
      return PieceType::Pawn;
    default:
      return PieceType::None;
  }
}

char piece_to_char(bb::Piece p) noexcept {
  char ch;
  switch (p.type) {
    case PieceType::King:
      ch = 'k';
      break;
    case PieceType::Queen:
      ch = 'q';
      break;
    case PieceType::Rook:
      ch = 'r';
      break;
    case PieceType::Bishop:
      ch = 'b';
      break;
    case PieceType::Knight:
      ch = 'n';
      break;
    case PieceType::Pawn:
      ch = 'p';
      break;
    default:
      ch = '?';
      break;
  }
  return p.color == Color::White ? toupper_ascii(ch) : ch;
}

int parse_uint(std::string_view sv, const char* what) {
  if (sv.empty() || sv.size() > 6) throw InvalidPositionError(std::string("bad ") + what);
  int val = 0;
  for (char c : sv) {
    if (c < '0' || c > '9') throw InvalidPositionError(std::string("bad ") + what);
    val = val * 10 + (c - '0');
  }
  return val;
}

void parse_placement(std::string_view field, Board& board) {
  int rank = 7, file = 0;
  for (char ch : field) {
    if (ch == '/') {
      if (file != 8 || rank == 0) throw InvalidPositionError("malformed piece placement");
      file = 0;
      --rank;
      continue;
    }
    if (ch >= '1' && ch <= '8') {
      file += ch - '0';
      if (file > 8) throw InvalidPositionError("rank overflows in piece placement");
      continue;
    }
    const char lo = tolower_ascii(ch);
    const PieceType type = piece_from_char(lo);
    if (type == PieceType::None || file > 7)
      throw InvalidPositionError(std::string("unexpected '") + ch + "' in piece placement");
    const Color col = (ch == lo) ? Color::Black : Color::White;
    board.setPiece(bb::make_square(file, rank), bb::Piece{type, col});
    ++file;
  }
  if (rank != 0 || file != 8) throw InvalidPositionError("piece placement must have 8 ranks");
}

// Outermost own rook on the given side of the king, NO_FILE if none.
int outermost_rook(const Board& board, Color c, int kingFile, CastleSide s) noexcept {
  const int step = (s == CastleSide::KingSide) ? -1 : 1;
  int f = (s == CastleSide::KingSide) ? 7 : 0;
  for (; f != kingFile; f += step)
    if (board.getPiece(bb::make_square(f, bb::back_rank(c))) == bb::Piece{PieceType::Rook, c})
      return f;
  return NO_FILE;
}

CastlingRights parse_castling(std::string_view field, const Board& board) {
  CastlingRights cr;
  if (field == "-") return cr;
  if (field.empty()) throw InvalidPositionError("missing castling field");

  for (char ch : field) {
    const Color c = (ch == tolower_ascii(ch)) ? Color::Black : Color::White;
    const Square ksq = board.kingSquare(c);
    if (ksq == core::NO_SQUARE || bb::rank_of(ksq) != bb::back_rank(c))
      throw InvalidPositionError(std::string("castling right '") + ch +
                                 "' without a king on the back rank");
    const int kingFile = bb::file_of(ksq);

    const char lo = tolower_ascii(ch);
    int rookFile = NO_FILE;
    CastleSide side = CastleSide::None;
    if (lo == 'k' || lo == 'q') {
      side = (lo == 'k') ? CastleSide::KingSide : CastleSide::QueenSide;
      rookFile = outermost_rook(board, c, kingFile, side);
    } else if (lo >= 'a' && lo <= 'h') {
      rookFile = lo - 'a';
      if (rookFile == kingFile) throw InvalidPositionError("castling rook on the king's file");
      side = (rookFile > kingFile) ? CastleSide::KingSide : CastleSide::QueenSide;
    } else {
      throw InvalidPositionError(std::string("unexpected '") + ch + "' in castling field");
    }
    if (rookFile == NO_FILE)
      throw InvalidPositionError(std::string("castling right '") + ch + "' without a rook");
    if (cr.has(c, side)) throw InvalidPositionError("duplicate castling right");
    cr.grant(c, side, kingFile, rookFile);
  }
  return cr;
}

Square parse_ep_square(std::string_view sv) {
  if (sv == "-") return core::NO_SQUARE;
  const auto sq = parse_square(sv);
  if (!sq) throw InvalidPositionError("bad en passant square");
  return *sq;
}

}  // namespace

Position parse(std::string_view fen) {
  std::array<std::string_view, 6> fields{};
  std::size_t count = 0;
  std::string_view sv = fen;
  while (!sv.empty()) {
    const std::size_t start = sv.find_first_not_of(' ');
    if (start == std::string_view::npos) break;
    sv.remove_prefix(start);
    const std::size_t sp = sv.find(' ');
    if (count == fields.size()) throw InvalidPositionError("too many FEN fields");
    fields[count++] = sv.substr(0, sp);
    sv.remove_prefix(sp == std::string_view::npos ? sv.size() : sp);
  }
  if (count < 4) throw InvalidPositionError("FEN needs at least four fields");

  Board board;
  parse_placement(fields[0], board);

  Color stm;
  if (fields[1] == "w")
    stm = Color::White;
  else if (fields[1] == "b")
    stm = Color::Black;
  else
    throw InvalidPositionError("side to move must be 'w' or 'b'");

  GameState st;
  st.castling = parse_castling(fields[2], board);
  st.enPassantSquare = parse_ep_square(fields[3]);

  const int hm = count > 4 ? parse_uint(fields[4], "halfmove clock") : 0;
  if (hm > 0xFFFF) throw InvalidPositionError("halfmove clock out of range");
  int fm = count > 5 ? parse_uint(fields[5], "fullmove number") : 1;
  if (fm == 0) fm = 1;
  st.halfmoveClock = static_cast<std::uint16_t>(hm);
  st.moveId = MoveId::fromFullmove(static_cast<std::uint32_t>(fm), stm);

  return Position::fromParts(board, st);
}

std::string write(const Position& pos) {
  std::string fen;
  fen.reserve(100);
  const Board& board = pos.getBoard();

  for (int rank = 7; rank >= 0; --rank) {
    int empty = 0;
    for (int file = 0; file < 8; ++file) {
      const auto piece = board.getPiece(bb::make_square(file, rank));
      if (piece.has_value()) {
        if (empty) {
          fen.push_back(static_cast<char>('0' + empty));
          empty = 0;
        }
        fen.push_back(piece_to_char(*piece));
      } else {
        ++empty;
      }
    }
    if (empty) fen.push_back(static_cast<char>('0' + empty));
    if (rank) fen.push_back('/');
  }

  fen.push_back(' ');
  fen.push_back(pos.sideToMove() == Color::White ? 'w' : 'b');
  fen.push_back(' ');

  const CastlingRights& cr = pos.castlingRights();
  if (cr.any()) {
    for (auto c : {Color::White, Color::Black}) {
      for (auto s : {CastleSide::KingSide, CastleSide::QueenSide}) {
        if (!cr.has(c, s)) continue;
        const int rf = cr.rookFile(c, s);
        char ch;
        if (rf == outermost_rook(board, c, cr.kingFile(c), s))
          ch = (s == CastleSide::KingSide) ? 'k' : 'q';
        else
          ch = static_cast<char>('a' + rf);
        fen.push_back(c == Color::White ? toupper_ascii(ch) : ch);
      }
    }
  } else {
    fen.push_back('-');
  }
  fen.push_back(' ');

  fen.append(square_name(pos.enPassantSquare()));
  fen.push_back(' ');
  fen.append(std::to_string(pos.halfmoveClock()));
  fen.push_back(' ');
  fen.append(std::to_string(pos.fullmoveNumber()));
  return fen;
}

}  // namespace castellan::model::fen
