#pragma once

namespace gambit::engine::uci
{
  // Values sent during the handshake plus the per-request think budget.
  struct EngineOptions
  {
    int skillLevel = 10; // Stockfish "Skill Level", 0..20
    int threads = 4;
    int hashMb = 128;
    int movetimeMs = 2000;
  };
} // namespace gambit::engine::uci
