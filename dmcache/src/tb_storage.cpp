// **********************************************************************
// dmcache/src/tb_storage.cpp
// **********************************************************************
/*
Testbench for the line array and the hit detector, no FSM involved.
*/

#include "CacheStorage.hpp"
#include <cascade/Cascade.hpp>

#include <cstdio>
#include <vector>

namespace {
bool same_line(const CacheLine& a, const CacheLine& b) {
  return a.tag == b.tag && a.valid == b.valid && a.dirty == b.dirty && a.words == b.words;
}
} // namespace

int main() {
  const CacheGeometry g(32, 4, 16, 64);   // 4 lines x 4 words
  CacheStorage s(g);
  using dmcache::is_hit;

  // === 1) Cold: nothing valid, nothing hits ===
  assert_always(s.num_lines() == 4 && s.words_per_line() == 4, "4 lines of 4 words");
  for (uint32_t i = 0; i < s.num_lines(); ++i) {
    assert_always(!s.valid(i) && !s.dirty(i), "cold line invalid and clean");
    assert_always(!is_hit(s, i, 0), "tag 0 must not hit an invalid line");
  }

  // === 2) install_line: valid, clean, tag and words replaced ===
  const std::vector<uint32_t> words = {0x11u, 0x22u, 0x33u, 0x44u};
  s.install_line(2, 0xabcu, words);
  assert_always(s.valid(2) && !s.dirty(2) && s.tag(2) == 0xabcu, "installed line valid, clean, tagged");
  assert_always(is_hit(s, 2, 0xabcu), "installed line hits its tag");
  assert_always(!is_hit(s, 2, 0xabdu), "installed line misses another tag");
  assert_always(!is_hit(s, 1, 0xabcu), "other index misses");
  for (uint32_t w = 0; w < 4; ++w) assert_always(s.read_word(2, w) == words[w], "installed words readable");

  // === 3) evict_prepare is a snapshot, not a mutation ===
  const CacheLine before = s.evict_prepare(2);
  assert_always(before.valid && !before.dirty && before.tag == 0xabcu && before.words == words, "snapshot contents");
  (void)s.evict_prepare(2);
  assert_always(same_line(before, s.evict_prepare(2)), "evict_prepare leaves the line alone");

  // === 4) write_word + dirty tracking ===
  s.write_word(2, 1, 0xdeadbeefu);
  s.mark_dirty(2);
  assert_always(s.read_word(2, 1) == 0xdeadbeefu && s.dirty(2) && s.valid(2), "word written, line dirty");
  const CacheLine victim = s.evict_prepare(2);
  assert_always(victim.dirty && victim.words[1] == 0xdeadbeefu, "snapshot sees dirty data");
  s.clear_dirty(2);
  assert_always(!s.dirty(2) && s.valid(2) && s.read_word(2, 1) == 0xdeadbeefu, "clear_dirty keeps data");

  // === 5) Reinstall replaces everything, clean again ===
  s.mark_dirty(2);
  s.install_line(2, 0x1u, std::vector<uint32_t>{1u, 2u, 3u, 4u});
  assert_always(!s.dirty(2) && s.tag(2) == 0x1u && s.read_word(2, 1) == 2u, "reinstall replaces tag and words");
  assert_always(!is_hit(s, 2, 0xabcu) && is_hit(s, 2, 0x1u), "old tag gone");

  // === 6) Word width masking ===
  const CacheGeometry g8(16, 1, 4, 8);    // 2 lines x 4 one-byte words
  CacheStorage b(g8);
  b.install_line(1, 3u, std::vector<uint32_t>{0x1ffu, 0x2u, 0x3u, 0x4u});
  assert_always(b.read_word(1, 0) == 0xffu, "install masks to the word width");
  b.write_word(1, 3, 0x12345678u);
  assert_always(b.read_word(1, 3) == 0x78u, "write masks to the word width");

  // === 7) invalidate_all ===
  s.mark_dirty(2);
  s.invalidate_all();
  for (uint32_t i = 0; i < s.num_lines(); ++i)
    assert_always(!s.valid(i) && !s.dirty(i), "invalidate_all clears every line");
  assert_always(!is_hit(s, 2, 0x1u), "nothing hits after invalidate_all");

  printf("tb_storage: PASS\n");
  return 0;
}
