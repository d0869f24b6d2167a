#include <cassert>
#include <iostream>
#include <optional>
#include <string>

#include "kibitz/model/analysis/pgn_reader.hpp"
#include "kibitz/model/analysis/replayer.hpp"

using namespace kibitz;
using model::analysis::DecodeStatus;

static bool parses(const std::string &pgn)
{
  model::analysis::GameRecord rec;
  std::string err;
  const bool ok = model::analysis::parsePgnToRecord(pgn, rec, &err);
  if (!ok)
    assert(!err.empty());
  return ok;
}

int main()
{
  // Tags, comments, variations, NAGs and the result
  {
    const std::string pgn = "[Event \"Club \\\"Open\\\"\"]\n"
                            "[Site \"?\"]\n"
                            "[Result \"1-0\"]\n"
                            "\n"
                            "1. e4 {best by test} e5 (1... c5 2. Nf3) 2. Nf3 $1 Nc6 ; main line\n"
                            "3. Bb5 a6!? 1-0\n";
    model::analysis::GameRecord rec;
    std::string err;
    assert(model::analysis::parsePgnToRecord(pgn, rec, &err));
    assert(rec.tags.at("Event") == "Club \"Open\"");
    assert(rec.tags.at("Site") == "?");
    assert(rec.result == "1-0");
    assert(rec.moves.size() == 6);
    assert(rec.moves[0].token == "e4");
    assert(rec.moves[2].token == "Nf3");
    assert(rec.moves[4].token == "Bb5");
    assert(rec.moves[5].token == "a6!?");
  }

  // Glued move numbers, black continuation dots, coordinate moves, no result
  {
    model::analysis::GameRecord rec;
    assert(model::analysis::parsePgnToRecord("1.e4 e5 2.Nf3 2...Nc6 3.f1c4", rec));
    assert(rec.moves.size() == 5);
    assert(rec.moves[3].token == "Nc6");
    assert(rec.moves[4].token == "f1c4");
    assert(rec.result == "*");
  }

  // Result tag fills in a missing termination marker; a lone result is a valid game
  {
    model::analysis::GameRecord rec;
    assert(model::analysis::parsePgnToRecord("[Result \"0-1\"]\n\n1. f3 e5", rec));
    assert(rec.result == "0-1");
    assert(model::analysis::parsePgnToRecord("*", rec));
    assert(rec.moves.empty());
  }

  // Syntax only: an impossible coordinate move still decodes
  {
    model::analysis::GameRecord rec;
    assert(model::analysis::parsePgnToRecord("e2e4 e7e5 g1g9", rec));
    assert(rec.moves.size() == 3);
    assert(rec.moves[2].token == "g1g9");
  }

  // Malformed records
  assert(!parses(""));
  assert(!parses("  \n\t "));
  assert(!parses("1. e4 \xff\xfe e5"));
  assert(!parses("[Event \"never closed"));
  assert(!parses("[Event \"x\""));
  assert(!parses("[Event x]\n1. e4"));
  assert(!parses("1. e4 {unclosed comment"));
  assert(!parses("1. e4 (1. d4 d5"));
  assert(!parses("1. e4 ) e5"));
  assert(!parses("1. e4 } e5"));
  assert(!parses("hello world"));
  assert(!parses("1. e4 $ e5"));
  assert(!parses("[Event \"Only tags\"]\n"));

  // Start position resolution
  {
    const std::string tagged = "[FEN \"4k3/8/8/8/8/8/4P3/4K3 w - - 0 1\"]\n\n1. e4 *";
    model::analysis::GameRecord rec;
    std::string err;

    assert(model::analysis::decodeGame("1. e4", std::nullopt, rec, &err) == DecodeStatus::Ok);
    assert(rec.startFen == core::START_FEN);

    assert(model::analysis::decodeGame(tagged, std::nullopt, rec, &err) == DecodeStatus::Ok);
    assert(rec.startFen == "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");

    const std::string fenOverride = "4k3/8/8/8/8/8/3P4/4K3 w - - 0 1";
    assert(model::analysis::decodeGame(tagged, fenOverride, rec, &err) == DecodeStatus::Ok);
    assert(rec.startFen == fenOverride);

    // blank override falls back to the tag
    assert(model::analysis::decodeGame(tagged, std::string("  "), rec, &err) == DecodeStatus::Ok);
    assert(rec.startFen == "4k3/8/8/8/8/8/4P3/4K3 w - - 0 1");

    assert(model::analysis::decodeGame("1. e4", std::string("garbage"), rec, &err) ==
           DecodeStatus::InvalidStartPosition);
    assert(err.find("invalid start position") == 0);

    assert(model::analysis::decodeGame("[FEN \"8/8/8/8/8/8/8/8 w - - 0 1\"]\n1. e4", std::nullopt,
                                       rec, &err) == DecodeStatus::InvalidStartPosition);
    assert(model::analysis::decodeGame("", std::nullopt, rec, &err) == DecodeStatus::InvalidRecord);
  }

  // ---- Replay ----

  {
    model::analysis::PositionReplayer rp;
    assert(rp.reset(core::START_FEN));

    model::analysis::ReplayedPly ply;
    model::analysis::IllegalMoveInfo bad;

    assert(rp.apply({"e4"}, ply, bad));
    assert(ply.ply == 1);
    assert(ply.uci == "e2e4");
    assert(ply.san == "e4");
    assert(ply.fenAfter == "rnbqkbnr/pppppppp/8/8/4P3/8/PPPP1PPP/RNBQKBNR b KQkq - 0 1");

    // coordinate token gets SAN
    assert(rp.apply({"e7e5"}, ply, bad));
    assert(ply.ply == 2);
    assert(ply.san == "e5");

    const std::string before = rp.fen();
    assert(!rp.apply({"g1g9"}, ply, bad));
    assert(bad.ply == 3);
    assert(bad.uci == "g1g9");
    assert(bad.fenBefore == before);
    assert(rp.pliesApplied() == 2);
    assert(rp.fen() == before);

    // a SAN token that names nothing is reported verbatim
    assert(!rp.apply({"Qxf7#"}, ply, bad));
    assert(bad.uci == "Qxf7#");

    // a coordinate token loses only its suffix
    assert(!rp.apply({"e2e5+"}, ply, bad));
    assert(bad.uci == "e2e5");

    assert(rp.apply({"Nf3"}, ply, bad));
    assert(ply.ply == 3);
    assert(ply.uci == "g1f3");
  }

  // En passant and promotion through replay
  {
    model::analysis::PositionReplayer rp;
    assert(rp.reset(core::START_FEN));
    model::analysis::ReplayedPly ply;
    model::analysis::IllegalMoveInfo bad;
    for (const char *t : {"e4", "a6", "e5", "d5"})
      assert(rp.apply({t}, ply, bad));
    assert(rp.apply({"exd6"}, ply, bad));
    assert(ply.uci == "e5d6");
    assert(ply.san == "exd6");
    assert(ply.fenAfter == "rnbqkbnr/1pp1pppp/p2P4/8/8/8/PPPP1PPP/RNBQKBNR b KQkq - 0 3");

    assert(rp.reset("1k6/4P3/8/8/8/8/8/4K3 w - - 0 1"));
    assert(rp.apply({"e8=Q+"}, ply, bad));
    assert(ply.ply == 1);
    assert(ply.uci == "e7e8q");
    assert(ply.san == "e8=Q+");
  }

  std::cout << "pgn_replay_test passed\n";
  return 0;
}
