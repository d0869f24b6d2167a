#include <cassert>
#include <iostream>
#include <string>

#include "kibitz/model/analysis/san_notation.hpp"
#include "kibitz/model/chess_game.hpp"
#include "kibitz/model/fen.hpp"
#include "kibitz/model/uci_notation.hpp"

using namespace kibitz;

static std::string san(const std::string &fen, const std::string &uciMove)
{
  model::ChessGame game;
  const bool ok = game.setPosition(fen);
  assert(ok);
  core::Square from, to;
  core::PieceType promo;
  const bool parsed = model::uci::parseUciMove(uciMove, from, to, promo);
  assert(parsed);
  return model::notation::toSan(game.getPosition(), model::Move{from, to, promo});
}

static std::string resolve(const std::string &fen, const std::string &token)
{
  model::ChessGame game;
  const bool ok = game.setPosition(fen);
  assert(ok);
  model::Move mv;
  if (!model::notation::fromSan(game.getPosition(), token, mv))
    return "";
  return model::uci::moveToUci(mv);
}

int main()
{
  const std::string start = core::START_FEN;

  // ---- FEN ----

  {
    model::ChessGame game;
    assert(game.getFen() == start);
  }

  // en passant square only when a capture is actually possible
  {
    model::ChessGame game;
    assert(game.doMoveUCI("e2e4"));
    assert(game.getFen() == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");
    assert(game.doMoveUCI("a7a6"));
    assert(game.doMoveUCI("e4e5"));
    assert(game.doMoveUCI("d7d5"));
    assert(game.getFen() == "rnbqkbnr/1pp1pppp/p7/3pP3/8/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 3");
  }

  // castling rights need their king and rook at home
  {
    model::Position pos;
    assert(model::fen::parse("4k3/8/8/8/8/8/4P3/4K3 w KQkq - 0 1", pos));
    assert(pos.getState().castlingRights == 0);
    assert(model::fen::write(pos) == "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");

    assert(model::fen::parse("r3k3/8/8/8/8/8/8/4K2R w KQkq - 0 1", pos));
    assert(model::fen::write(pos) == "r3k3/8/8/8/8/8/8/4K2R w Kq - 0 1");

    // king off e1 voids both white rights
    assert(model::fen::parse("r3k2r/8/8/8/8/8/8/R2K3R w KQkq - 0 1", pos));
    assert(model::fen::write(pos) == "r3k2r/8/8/8/8/8/8/R2K3R w kq - 0 1");

    model::ChessGame game;
    assert(game.setPosition("4k3/8/8/8/8/8/8/R3K3 w KQ - 0 1"));
    assert(!game.doMoveUCI("e1g1"));
    assert(game.doMoveUCI("e1c1"));
  }

  // clocks are optional
  {
    model::Position pos;
    assert(model::fen::parse("4k3/8/8/8/8/8/8/4K3 w - -", pos));
    assert(pos.getState().halfmoveClock == 0);
    assert(pos.getState().fullmoveNumber == 1);
    assert(model::fen::write(pos) == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
  }

  {
    std::string err;
    assert(!model::fen::isValid("", &err));
    assert(!model::fen::isValid("not a fen", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP w KQkq - 0 1", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR x KQkq - 0 1", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/9/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNZ w KQkq - 0 1", &err));
    assert(!model::fen::isValid("8/8/8/8/8/8/8/8 w - - 0 1", &err));
    assert(!model::fen::isValid("4k3/8/8/8/8/8/8/3KK3 w - - 0 1", &err));
    assert(!model::fen::isValid("P3k3/8/8/8/8/8/8/4K3 w - - 0 1", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KX - 0 1", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq e4 0 1", &err));
    assert(!model::fen::isValid("rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - x 1", &err));
    // black king attacked with white to move
    assert(!model::fen::isValid("4k3/8/8/8/8/8/4R3/4K3 w - - 0 1", &err));
    assert(!err.empty());
  }

  // ---- SAN generation ----

  assert(san(start, "e2e4") == "e4");
  assert(san(start, "g1f3") == "Nf3");
  assert(san(start, "e2e5") == "");

  // file, then rank disambiguation
  assert(san("1k6/8/8/8/8/8/4K3/R6R w - - 0 1", "a1d1") == "Rad1");
  assert(san("1k6/8/8/8/8/8/4K3/R6R w - - 0 1", "h1d1") == "Rhd1");
  assert(san("1k6/8/8/R7/8/8/4K3/R7 w - - 0 1", "a1a3") == "R1a3");
  assert(san("1k6/8/8/R7/8/8/4K3/R7 w - - 0 1", "a5a3") == "R5a3");

  assert(san("rnbqkbnr/ppp1pppp/8/3p4/4P3/8/PPPP1PPP/RNBQKBNR w KQkq d6 0 2", "e4d5") == "exd5");
  assert(san("1k6/4P3/8/8/8/8/8/4K3 w - - 0 1", "e7e8q") == "e8=Q+");
  assert(san("rnbqkbnr/pppp1ppp/8/4p3/6P1/5P2/PPPPP2P/RNBQKBNR b KQkq - 0 2", "d8h4") == "Qh4#");
  assert(san("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "e1g1") == "O-O");
  assert(san("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "e1c1") == "O-O-O");

  // ---- SAN parsing ----

  assert(resolve(start, "Nf3") == "g1f3");
  assert(resolve(start, "e4!?") == "e2e4");
  assert(resolve(start, "e2e4") == "e2e4");
  assert(resolve(start, "Ngf3") == "g1f3");
  assert(resolve(start, "Ng1f3") == "g1f3");
  assert(resolve(start, "e5") == "");
  assert(resolve(start, "Qh5") == "");
  assert(resolve(start, "O-O") == "");
  assert(resolve("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "0-0") == "e1g1");
  assert(resolve("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1", "O-O-O+") == "e1c1");
  assert(resolve("1k6/4P3/8/8/8/8/8/4K3 w - - 0 1", "e8=Q+") == "e7e8q");
  assert(resolve("1k6/4P3/8/8/8/8/8/4K3 w - - 0 1", "e8N") == "e7e8n");
  assert(resolve("1k6/4P3/8/8/8/8/8/4K3 w - - 0 1", "e8") == "");
  // ambiguous without a disambiguator
  assert(resolve("1k6/8/8/8/8/8/4K3/R6R w - - 0 1", "Rd1") == "");
  assert(resolve("1k6/8/8/8/8/8/4K3/R6R w - - 0 1", "Rhd1") == "h1d1");

  std::cout << "fen_san_test passed\n";
  return 0;
}
