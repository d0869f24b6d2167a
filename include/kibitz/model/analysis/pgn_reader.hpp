#pragma once
#include <optional>
#include <string>
#include <string_view>

#include "kibitz/model/analysis/game_record.hpp"

namespace kibitz::model::analysis
{
  enum class DecodeStatus
  {
    Ok,
    InvalidRecord,       // text is not a well-formed game
    InvalidStartPosition // override (or FEN tag) is not a playable position
  };

  // Syntax only: tags, mainline tokens and the result. Move legality is not checked.
  bool parsePgnToRecord(std::string_view pgn, GameRecord &out, std::string *err = nullptr);

  // parsePgnToRecord() plus start-position resolution: explicit override, then the
  // FEN tag, then the standard initial position.
  DecodeStatus decodeGame(std::string_view pgn, const std::optional<std::string> &startOverride,
                          GameRecord &out, std::string *err = nullptr);
}
