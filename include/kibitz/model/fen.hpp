#pragma once

#include <string>
#include <string_view>

#include "position.hpp"

namespace kibitz::model::fen {

// Loads a FEN into `out`. The halfmove and fullmove fields are optional.
// Rejects anything that is not a playable position: wrong rank/file counts,
// unknown piece letters, king count other than one per side, pawns on the
// first or last rank, bad side/castling/en-passant fields, non-numeric
// clocks, or the side not to move standing in check.
bool parse(std::string_view fen, Position& out, std::string* err = nullptr);

bool isValid(std::string_view fen, std::string* err = nullptr);

// En passant is written only when a legal en-passant capture exists.
std::string write(const Position& pos);

}  // namespace kibitz::model::fen
