#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "fake_engines.hpp"
#include "kibitz/analysis/analyze_request.hpp"
#include "kibitz/analysis/key_moments.hpp"
#include "kibitz/analysis/ply_analyzer.hpp"
#include "kibitz/analysis/result_envelope.hpp"
#include "kibitz/engine/score.hpp"
#include "kibitz/engine/uci/uci_info.hpp"
#include "kibitz/model/analysis/replayer.hpp"

using namespace kibitz;
using json = nlohmann::json;

static engine::EngineLine line(int multipv, std::vector<std::string> pv, std::optional<int> cp)
{
  engine::EngineLine l;
  l.multipv = multipv;
  l.pv = std::move(pv);
  l.evalCp = cp;
  return l;
}

static analysis::PlyRecord plyWithEval(int ply, std::optional<int> cp)
{
  analysis::PlyRecord p;
  p.ply = ply;
  p.playedSan = "m" + std::to_string(ply);
  p.evalCp = cp;
  return p;
}

int main()
{
  // ---- Score normalisation ----
  {
    using engine::UciScore;
    const auto W = core::Color::White;
    const auto B = core::Color::Black;
    static_assert(engine::normalizeScore(UciScore{false, 35}, core::Color::White) == 35);

    assert(engine::normalizeScore({false, 35}, B) == -35);
    assert(engine::normalizeScore({false, -120}, B) == 120);
    assert(engine::normalizeScore({true, 3}, W) == core::MATE_SENTINEL_CP);
    assert(engine::normalizeScore({true, -2}, W) == -core::MATE_SENTINEL_CP);
    assert(engine::normalizeScore({true, 2}, B) == -100000);
    assert(engine::normalizeScore({true, -2}, B) == 100000);
    // mate 0: the side to move is already mated
    assert(engine::normalizeScore({true, 0}, W) == -100000);
    assert(engine::normalizeScore({true, 0}, B) == 100000);
  }

  // ---- UCI info lines ----
  {
    engine::uci::UciInfo info;
    assert(engine::uci::parseInfoLine(
        "info depth 5 seldepth 7 multipv 2 score mate -3 nodes 1200 nps 9 pv d2d4 d7d5", info));
    assert(info.depth && *info.depth == 5);
    assert(info.multipv == 2);
    assert(info.score && info.score->mate && info.score->value == -3);
    assert(info.hasPv);
    assert((info.pv == std::vector<std::string>{"d2d4", "d7d5"}));

    assert(engine::uci::parseInfoLine("info depth 3 score cp 15 lowerbound pv e2e4", info));
    assert(info.bound);
    assert(info.multipv == 1);
    assert(!info.score->mate && info.score->value == 15);

    assert(engine::uci::parseInfoLine("info depth 9 currmove e2e4 currmovenumber 1", info));
    assert(!info.score && !info.hasPv);
    assert(!engine::uci::parseInfoLine("info string NNUE evaluation enabled", info));
    assert(!engine::uci::parseInfoLine("readyok", info));

    std::string best;
    assert(engine::uci::parseBestmoveLine("bestmove e2e4 ponder e7e5", best));
    assert(best == "e2e4");
    assert(engine::uci::parseBestmoveLine("bestmove (none)", best));
    assert(best.empty());
    assert(!engine::uci::parseBestmoveLine("info depth 1", best));
  }

  // ---- Ply analyzer ----

  assert(analysis::clampLineCount(0) == 1);
  assert(analysis::clampLineCount(-4) == 1);
  assert(analysis::clampLineCount(2) == 2);
  assert(analysis::clampLineCount(7) == 3);

  {
    analysis::AnalyzeRequest req;
    auto lim = analysis::limitsFor(req);
    assert(lim.depth && *lim.depth == 12);
    assert(lim.movetimeMs && *lim.movetimeMs == 50);

    req.depth = 0;
    req.timeBudgetSeconds = 0.0;
    lim = analysis::limitsFor(req);
    assert(!lim.depth && !lim.movetimeMs);

    req.timeBudgetSeconds = 0.0001;
    lim = analysis::limitsFor(req);
    assert(lim.movetimeMs && *lim.movetimeMs == 1);
  }

  // Lines are filtered, de-duplicated and ordered by rank
  {
    model::analysis::PositionReplayer rp;
    assert(rp.reset(core::START_FEN));
    model::analysis::ReplayedPly ply;
    model::analysis::IllegalMoveInfo bad;
    assert(rp.apply({"e4"}, ply, bad));

    test::CannedEngine eng({line(2, {"c7c5", "g1f3"}, -30), line(1, {"e7e5"}, 25),
                            line(3, {}, 0), line(1, {"d7d5"}, 99), line(3, {"e2e4"}, 5)});
    analysis::PlyAnalyzer analyzer(eng, engine::SearchLimits{8, 20}, 7);
    assert(analyzer.lineCount() == 3);

    const auto rec = analyzer.analyze(ply, rp.game());
    assert(eng.calls.size() == 1);
    assert(eng.calls[0].fen == ply.fenAfter);
    assert(eng.calls[0].lineCount == 3);
    assert(*eng.calls[0].limits.depth == 8);
    assert(*eng.calls[0].limits.movetimeMs == 20);

    assert(rec.ply == 1);
    assert(rec.playedUci == "e2e4");
    assert(rec.playedSan == "e4");
    assert(rec.pvs.size() == 2);
    assert(rec.pvs[0].rank == 1 && rec.pvs[0].uci == "e7e5" && rec.pvs[0].san == "e5");
    assert(rec.pvs[0].evalCp == 25);
    assert(rec.pvs[1].rank == 2 && rec.pvs[1].uci == "c7c5" && rec.pvs[1].san == "c5");
    assert(rec.evalCp && *rec.evalCp == 25);
  }

  // No principal line means no evaluation for the ply
  {
    model::analysis::PositionReplayer rp;
    assert(rp.reset(core::START_FEN));
    model::analysis::ReplayedPly ply;
    model::analysis::IllegalMoveInfo bad;
    assert(rp.apply({"d4"}, ply, bad));

    test::CannedEngine eng({line(2, {"g8f6"}, 10), line(1, {}, 40)});
    analysis::PlyAnalyzer analyzer(eng, {}, 2);
    const auto rec = analyzer.analyze(ply, rp.game());
    assert(rec.pvs.size() == 1);
    assert(rec.pvs[0].rank == 2);
    assert(rec.pvs[0].san == "Nf6");
    assert(!rec.evalCp);
  }

  // Checkmate and stalemate are not sent to the engine
  {
    model::analysis::PositionReplayer rp;
    assert(rp.reset("rnbqkbnr/pppp1ppp/8/4p3/6P1/5P2/PPPPP2P/RNBQKBNR b KQkq - 0 2"));
    model::analysis::ReplayedPly ply;
    model::analysis::IllegalMoveInfo bad;
    assert(rp.apply({"Qh4#"}, ply, bad));

    test::CannedEngine eng({line(1, {"a2a3"}, 0)});
    analysis::PlyAnalyzer analyzer(eng, {}, 2);
    auto rec = analyzer.analyze(ply, rp.game());
    assert(eng.calls.empty());
    assert(analyzer.engineCalls() == 0);
    assert(rec.playedSan == "Qh4#");
    assert(rec.pvs.empty());
    assert(!rec.evalCp);

    assert(rp.reset("7k/8/4Q3/6K1/8/8/8/8 w - - 0 1"));
    assert(rp.apply({"Qf7"}, ply, bad));
    rec = analyzer.analyze(ply, rp.game());
    assert(eng.calls.empty());
    assert(rec.pvs.empty());
  }

  // ---- Key moments ----
  {
    std::vector<analysis::PlyRecord> plies = {
        plyWithEval(1, 10),   plyWithEval(2, 30),  plyWithEval(3, -200),
        plyWithEval(4, -180), plyWithEval(5, {}),  plyWithEval(6, 500),
        plyWithEval(7, 480),  plyWithEval(8, 2000), plyWithEval(9, 1990)};
    const auto km = analysis::selectKeyMoments(plies);
    assert(km.size() == core::KEY_MOMENT_LIMIT);
    assert(km[0].ply == 8 && km[0].swing == 1520 && km[0].evalCp == 2000);
    assert(km[1].ply == 3 && km[1].swing == 230);
    // equal swings stay in ply order
    assert(km[2].ply == 2 && km[2].swing == 20);
    assert(km[3].ply == 4 && km[3].swing == 20);
    assert(km[4].ply == 7 && km[4].swing == 20);
    assert(km[0].playedSan == "m8");

    assert(analysis::selectKeyMoments({}).empty());
    assert(analysis::selectKeyMoments({plyWithEval(1, 500)}).empty());
    assert(analysis::selectKeyMoments(plies, 2).size() == 2);

    // mate swing
    const auto mate = analysis::selectKeyMoments({plyWithEval(1, 50), plyWithEval(2, -100000)});
    assert(mate.size() == 1 && mate[0].swing == 100050);
  }

  // ---- Envelope JSON ----
  {
    analysis::PlyRecord p;
    p.ply = 1;
    p.playedUci = "e2e4";
    p.playedSan = "e4";
    p.fenAfter = "fen";
    p.evalCp = 31;
    p.pvs.push_back({1, "e7e5", "e5", 31});
    p.pvs.push_back({2, "c7c5", "c5", std::nullopt});

    const json ok = analysis::makeSuccess({p}, {});
    assert(ok["status"] == "ok");
    assert(ok["legal"] == true);
    assert(ok["error"].is_null());
    assert(ok["key_moments"].is_array() && ok["key_moments"].empty());
    const json &pj = ok["per_ply"][0];
    assert(pj["ply"] == 1);
    assert(pj["played_uci"] == "e2e4");
    assert(pj["played_san"] == "e4");
    assert(pj["fen_after"] == "fen");
    assert(pj["eval_cp"] == 31);
    assert(pj["pvs"][0]["rank"] == 1);
    assert(pj["pvs"][0]["uci"] == "e7e5");
    assert(pj["pvs"][0]["san"] == "e5");
    assert(pj["pvs"][1]["eval_cp"].is_null());

    analysis::PlyRecord blank;
    blank.ply = 2;
    const json noEval = blank;
    assert(noEval["eval_cp"].is_null());
    assert(noEval["pvs"].is_array());

    const json km = analysis::KeyMoment{3, "Nf3", -40, 120};
    assert(km == json({{"ply", 3}, {"played_san", "Nf3"}, {"eval_cp", -40}, {"swing", 120}}));

    const json illegal = analysis::makeIllegalMove({3, "g1g9", "fenB"}, {p}, {});
    assert(illegal["status"] == "error");
    assert(illegal["legal"] == false);
    assert(illegal["per_ply"].size() == 1);
    assert(illegal["error"]["code"] == "ILLEGAL_MOVE");
    const json &fim = illegal["error"]["details"]["first_illegal_move"];
    assert(fim["ply"] == 3 && fim["uci"] == "g1g9" && fim["fen_before"] == "fenB");

    const json internal = analysis::makeInternalError("boom", {"analysis", 4}, {}, {});
    assert(internal["error"]["code"] == "INTERNAL_ERROR");
    assert(internal["error"]["message"] == "boom");
    assert(internal["error"]["details"]["stage"] == "analysis");
    assert(internal["error"]["details"]["completed_plies"] == 4);

    analysis::AnalysisError bad;
    bad.code = analysis::ErrorCode::InvalidPgn;
    bad.message = "Could not parse PGN";
    const json pgn = analysis::makeFailure(bad);
    assert(pgn["legal"] == false);
    assert(pgn["error"]["code"] == "INVALID_PGN");
    assert(pgn["error"]["details"] == json::object());
    assert(pgn["per_ply"].empty());

    assert(std::string(analysis::errorCodeName(analysis::ErrorCode::InvalidFen)) == "INVALID_FEN");
  }

  // ---- Request parsing ----
  {
    analysis::AnalyzeRequest req;
    std::string err;

    assert(analysis::parseAnalyzeRequest(json{{"record", "1. e4"}}, req, &err));
    assert(req.record == "1. e4");
    assert(!req.initialPosition);
    assert(req.depth == 12 && req.lineCount == 2 && req.timeBudgetSeconds == 0.05);

    assert(analysis::parseAnalyzeRequest(
        json{{"pgn", "1. d4"}, {"initial_fen", "4k3/8/8/8/8/8/8/4K3 w - - 0 1"},
             {"multipv", 3}, {"time_sec", 1.5}, {"depth", 20}},
        req, &err));
    assert(req.record == "1. d4");
    assert(req.initialPosition == "4k3/8/8/8/8/8/8/4K3 w - - 0 1");
    assert(req.lineCount == 3 && req.depth == 20 && req.timeBudgetSeconds == 1.5);

    // canonical names win over aliases, integers are fine for the time budget
    assert(analysis::parseAnalyzeRequest(
        json{{"record", "a"}, {"pgn", "b"}, {"time_budget_seconds", 2}, {"initial_position", nullptr}},
        req, &err));
    assert(req.record == "a");
    assert(req.timeBudgetSeconds == 2.0);
    assert(!req.initialPosition);

    assert(!analysis::parseAnalyzeRequest(json::array(), req, &err));
    assert(!analysis::parseAnalyzeRequest(json{{"depth", 3}}, req, &err));
    assert(err.find("record") != std::string::npos);
    assert(!analysis::parseAnalyzeRequest(json{{"record", 5}}, req, &err));
    assert(!analysis::parseAnalyzeRequest(json{{"record", "x"}, {"depth", "deep"}}, req, &err));
    assert(!analysis::parseAnalyzeRequest(json{{"record", "x"}, {"multipv", 1.5}}, req, &err));
    assert(!analysis::parseAnalyzeRequest(json{{"record", "x"}, {"time_sec", "fast"}}, req, &err));
  }

  std::cout << "analysis_test passed\n";
  return 0;
}
