#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace kibitz::model::analysis
{

  // One mainline move as written in the record. Resolution against a position
  // happens during replay, so that an illegal move is reported at its own ply.
  struct RecordedMove
  {
    std::string token; // SAN ("Nf3", "exd5", "O-O") or coordinate ("g1f3")
  };

  struct GameRecord
  {
    std::unordered_map<std::string, std::string> tags;
    std::string startFen;           // resolved start position
    std::vector<RecordedMove> moves; // mainline, ply order
    std::string result{"*"};        // "1-0", "0-1", "1/2-1/2", "*"
  };

} // namespace kibitz::model::analysis
