#include "kibitz/analysis/analyze_request.hpp"

#include <initializer_list>

namespace kibitz::analysis
{
  namespace
  {
    const nlohmann::json *findField(const nlohmann::json &j, std::initializer_list<const char *> names)
    {
      for (const char *n : names)
      {
        auto it = j.find(n);
        if (it != j.end() && !it->is_null())
          return &*it;
      }
      return nullptr;
    }

    bool fail(std::string *err, const std::string &msg)
    {
      if (err)
        *err = msg;
      return false;
    }
  } // namespace

  bool parseAnalyzeRequest(const nlohmann::json &j, AnalyzeRequest &out, std::string *err)
  {
    if (!j.is_object())
      return fail(err, "request must be a JSON object");

    AnalyzeRequest req;

    const auto *record = findField(j, {"record", "pgn"});
    if (!record)
      return fail(err, "missing field: record");
    if (!record->is_string())
      return fail(err, "field 'record' must be a string");
    req.record = record->get<std::string>();

    if (const auto *fen = findField(j, {"initial_position", "initial_fen"}))
    {
      if (!fen->is_string())
        return fail(err, "field 'initial_position' must be a string");
      req.initialPosition = fen->get<std::string>();
    }

    if (const auto *depth = findField(j, {"depth"}))
    {
      if (!depth->is_number_integer())
        return fail(err, "field 'depth' must be an integer");
      req.depth = depth->get<int>();
    }

    if (const auto *lines = findField(j, {"line_count", "multipv"}))
    {
      if (!lines->is_number_integer())
        return fail(err, "field 'line_count' must be an integer");
      req.lineCount = lines->get<int>();
    }

    if (const auto *t = findField(j, {"time_budget_seconds", "time_sec"}))
    {
      if (!t->is_number())
        return fail(err, "field 'time_budget_seconds' must be a number");
      req.timeBudgetSeconds = t->get<double>();
    }

    out = std::move(req);
    return true;
  }

} // namespace kibitz::analysis
