// **********************************************************************
// dmcache/src/tb_geometry.cpp
// **********************************************************************
/*
Testbench for address decomposition and geometry validation.
*/

#include "CacheGeometry.hpp"
#include <cascade/Cascade.hpp>

#include <cstdio>

int main() {
  // === 1) 4 KiB / 64 B / 4 B, 32-bit addresses ===
  const CacheGeometry g(32, 4, 64, 4096);
  assert_always(g.num_lines() == 64,      "4K/64: 64 lines");
  assert_always(g.words_per_line() == 16, "4K/64: 16 words per line");
  assert_always(g.offset_bits() == 6,     "4K/64: 6 offset bits");
  assert_always(g.index_bits() == 6,      "4K/64: 6 index bits");
  assert_always(g.tag_bits() == 20,       "4K/64: 20 tag bits");
  assert_always(g.word_sel_bits() == 4,   "4K/64: 4 word-select bits");

  AddrFields f = g.decompose(0x00000000u);
  assert_always(f.tag == 0 && f.index == 0 && f.offset == 0 && f.word == 0, "address 0 decomposes to zeros");

  // 0x1000 shares index 0 with 0x0 but carries tag 1
  f = g.decompose(0x00001000u);
  assert_always(f.tag == 1 && f.index == 0 && f.offset == 0, "0x1000: tag 1, index 0");

  f = g.decompose(0x12345678u);
  assert_always(f.offset == 0x38u,        "0x12345678: offset bits 5:0");
  assert_always(f.index == 0x19u,         "0x12345678: index bits 11:6");
  assert_always(f.tag == 0x12345u,        "0x12345678: tag bits 31:12");
  assert_always(f.word == 0xeu,           "0x12345678: word 14");

  f = g.decompose(0xffffffffu);
  assert_always(f.tag == 0xfffffu && f.index == 63 && f.offset == 63 && f.word == 15, "all-ones address");

  // byte offsets inside a word select the same word
  assert_always(g.decompose(0x44u).word == 1 && g.decompose(0x47u).word == 1, "bytes of word 1");

  // line_address / word_address undo the split
  assert_always(g.line_address(0x12345u, 0x19u) == 0x12345640u, "line base of 0x12345678");
  assert_always(g.word_address(0x12345640u, 14) == 0x12345678u, "word 14 of that line");
  assert_always(g.line_address(1, 0) == 0x1000u, "line base of tag 1 index 0");

  // === 2) Narrow address: bits above ADDR_WIDTH are dropped ===
  const CacheGeometry n(16, 2, 16, 256);
  assert_always(n.num_lines() == 16 && n.words_per_line() == 8, "256/16/2: 16 lines of 8 words");
  assert_always(n.tag_bits() == 8 && n.index_bits() == 4 && n.offset_bits() == 4, "16-bit split 8/4/4");
  assert_always(n.word_mask() == 0xffffu, "2-byte words");
  f = n.decompose(0xabcd1234u);
  assert_always(f.tag == 0x12u && f.index == 0x3u && f.offset == 0x4u && f.word == 2, "upper address bits ignored");
  assert_always(n.word_address(n.line_address(0xffu, 0xfu), 7) == 0xfffeu, "last word of the address space");

  // === 3) Whole address is index + offset: no tag bits ===
  const CacheGeometry t(12, 4, 64, 4096);
  assert_always(t.tag_bits() == 0, "tagless geometry");
  assert_always(t.decompose(0xfffu).tag == 0 && t.decompose(0xfffu).index == 63, "tagless decompose");

  // === 4) One word per line, one line ===
  const CacheGeometry tiny(8, 4, 4, 4);
  assert_always(tiny.num_lines() == 1 && tiny.words_per_line() == 1, "single line, single word");
  assert_always(tiny.index_bits() == 0 && tiny.offset_bits() == 2 && tiny.tag_bits() == 6, "8-bit split 6/0/2");

  // === 5) Rejected configurations ===
  assert_always(CacheGeometry::check(32, 4, 64, 4096).empty(), "legal geometry accepted");
  assert_always(!CacheGeometry::check(32, 4, 48, 4096).empty(), "line size not a power of two");
  assert_always(!CacheGeometry::check(32, 4, 64, 3000).empty(), "cache size not a power of two");
  assert_always(!CacheGeometry::check(32, 3, 64, 4096).empty(), "3-byte words");
  assert_always(!CacheGeometry::check(32, 8, 64, 4096).empty(), "8-byte words wider than the data bus");
  assert_always(!CacheGeometry::check(32, 4, 2, 4096).empty(),  "line smaller than a word");
  assert_always(!CacheGeometry::check(32, 4, 128, 64).empty(),  "cache smaller than a line");
  assert_always(!CacheGeometry::check(10, 4, 64, 4096).empty(), "index + offset wider than the address");
  assert_always(!CacheGeometry::check(0, 4, 64, 4096).empty(),  "zero address width");
  assert_always(!CacheGeometry::check(33, 4, 64, 4096).empty(), "address wider than 32 bits");

  // === 6) Backing memory ===
  assert_always(g.check_memory(65536).empty(), "64 KiB memory behind a 4 KiB cache");
  assert_always(g.check_memory(64).empty(), "one line of memory is enough");
  assert_always(!g.check_memory(0).empty(), "no memory");
  assert_always(!g.check_memory(2).empty(), "memory smaller than a word");
  assert_always(!g.check_memory(32).empty(), "memory smaller than a line");
  assert_always(!g.check_memory(100).empty(), "partial last line");
  assert_always(n.check_memory(65536).empty() && !n.check_memory(131072).empty(), "memory beyond a 16-bit address space");

  assert_always(dmcache::is_pow2(1) && dmcache::is_pow2(4096) && !dmcache::is_pow2(0) && !dmcache::is_pow2(96), "is_pow2");
  assert_always(dmcache::log2u(1) == 0 && dmcache::log2u(64) == 6, "log2u");

  printf("tb_geometry: PASS\n");
  return 0;
}
