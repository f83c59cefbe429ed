#include "line_chunker/chunk_arena.hpp"
#include <iostream>
#include <string>

int main(){
  lc::ChunkArena a(4);
  a.append("hello");
  a.append(" world");
  if (a.view() != "hello world") { std::cerr << "[FAIL] append/view\n"; return 1; }
  if (a.capacity() < 11) { std::cerr << "[FAIL] capacity did not grow\n"; return 1; }

  a.consume(6);
  if (a.view() != "world" || a.used() != 5) { std::cerr << "[FAIL] consume\n"; return 1; }
  if (a.view(1, 3) != "orl" || a.view(3, 100) != "ld") { std::cerr << "[FAIL] sub view\n"; return 1; }
  if (a.high_water() != 11) { std::cerr << "[FAIL] high water " << a.high_water() << "\n"; return 1; }

  const std::size_t cap = a.capacity();
  a.reset();
  if (!a.empty() || a.capacity() != cap) { std::cerr << "[FAIL] reset keeps capacity\n"; return 1; }
  a.append("again");
  if (a.view() != "again") { std::cerr << "[FAIL] append after reset\n"; return 1; }
  a.consume(0);
  if (a.used() != 5) { std::cerr << "[FAIL] consume(0)\n"; return 1; }

  a.reset_and_shrink(0);
  if (!a.empty() || a.capacity() != 0) { std::cerr << "[FAIL] reset_and_shrink\n"; return 1; }

  std::cout << "[PASS] chunk arena\n";
  return 0;
}
