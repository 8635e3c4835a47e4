#pragma once

#include "gambit/app/options.hpp"

namespace gambit::app
{

  class App
  {
  public:
    explicit App(Options opts);
    // Exit status: 0 on a normal quit, 1 when the game cannot be set up.
    int run();

  private:
    Options m_opts;
  };

} // namespace gambit::app
