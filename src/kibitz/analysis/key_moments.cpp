#include "kibitz/analysis/key_moments.hpp"

#include <algorithm>
#include <cstdlib>

namespace kibitz::analysis
{

  std::vector<KeyMoment> selectKeyMoments(const std::vector<PlyRecord> &plies, std::size_t limit)
  {
    std::vector<KeyMoment> moments;
    for (std::size_t i = 1; i < plies.size(); ++i)
    {
      const auto &prev = plies[i - 1];
      const auto &cur = plies[i];
      if (!prev.evalCp || !cur.evalCp)
        continue;

      KeyMoment km;
      km.ply = cur.ply;
      km.playedSan = cur.playedSan;
      km.evalCp = *cur.evalCp;
      km.swing = std::abs(*cur.evalCp - *prev.evalCp);
      moments.push_back(std::move(km));
    }

    std::stable_sort(moments.begin(), moments.end(),
                     [](const KeyMoment &a, const KeyMoment &b) { return a.swing > b.swing; });
    if (moments.size() > limit)
      moments.resize(limit);
    return moments;
  }

} // namespace kibitz::analysis
