#pragma once
#include <string>
#include <variant>
#include <vector>

namespace kibitz::engine::uci
{

  // An option as advertised by the engine during the "uci" handshake.
  struct UciOption
  {
    enum class Type
    {
      Check,
      Spin,
      Combo,
      String,
      Button
    };
    std::string name;
    Type type{Type::String};
    std::string defaultStr;
    int defaultInt{0};
    bool defaultBool{false};
    int min{0}, max{0};
    std::vector<std::string> vars; // combo options
  };

  using UciValue = std::variant<bool, int, std::string>;

  inline const UciOption *findOption(const std::vector<UciOption> &opts, const std::string &name)
  {
    for (const auto &o : opts)
    {
      if (o.name.size() != name.size())
        continue;
      // UCI option names are case-insensitive
      bool same = true;
      for (std::size_t i = 0; i < name.size() && same; ++i)
        same = (o.name[i] | 32) == (name[i] | 32);
      if (same)
        return &o;
    }
    return nullptr;
  }

} // namespace kibitz::engine::uci
