// **********************************************************************
// dmcache/include/CacheStorage.hpp
// **********************************************************************
/*
Direct-mapped line array: one tag/valid/dirty triple and WORDS_PER_LINE words
per index. Only CacheCtrl mutates it; everyone else gets a const reference.
*/

#pragma once
#include <cstdint>
#include <vector>
#include "CacheGeometry.hpp"

// Copy of one line (what evict_prepare hands back)
struct CacheLine {
  uint32_t tag   = 0;
  bool     valid = false;
  bool     dirty = false;
  std::vector<uint32_t> words;
};

class CacheStorage {
public:
  explicit CacheStorage(const CacheGeometry& geom);

  uint32_t read_word(uint32_t index, uint32_t word_idx) const;
  void     write_word(uint32_t index, uint32_t word_idx, uint32_t value);
  CacheLine evict_prepare(uint32_t index) const;        // snapshot, does not mutate
  void     install_line(uint32_t index, uint32_t tag, const std::vector<uint32_t>& words); // valid, clean
  void     mark_dirty(uint32_t index);
  void     clear_dirty(uint32_t index);
  void     invalidate_all();                            // power-on state

  // status helpers
  uint32_t tag(uint32_t index)   const { return meta_.at(index).tag; }
  bool     valid(uint32_t index) const { return meta_.at(index).valid; }
  bool     dirty(uint32_t index) const { return meta_.at(index).dirty; }
  uint32_t num_lines()           const { return (uint32_t)meta_.size(); }
  uint32_t words_per_line()      const { return wpl_; }

private:
  struct Meta { uint32_t tag = 0; bool valid = false; bool dirty = false; };
  std::vector<Meta>     meta_;  // one per line
  std::vector<uint32_t> words_; // flat arena, line i at [i*wpl_, (i+1)*wpl_)
  uint32_t wpl_;
  uint32_t word_mask_;

  size_t slot(uint32_t index, uint32_t word_idx) const;
};

namespace dmcache {
// Hit detector: valid && tag match, no side effects
inline bool is_hit(const CacheStorage& s, uint32_t index, uint32_t tag) {
  return s.valid(index) && s.tag(index) == tag;
}
} // namespace dmcache
