#include <iostream>
#include <stdexcept>
#include <utility>

#include "gambit/app/app.hpp"
#include "gambit/app/options.hpp"

int main(int argc, char **argv)
{
  gambit::app::Options opts;
  try
  {
    opts = gambit::app::parseArgs(argc, argv);
  }
  catch (const std::invalid_argument &e)
  {
    std::cerr << e.what() << "\n";
    gambit::app::printUsage(std::cerr);
    return 1;
  }

  if (opts.help)
  {
    gambit::app::printUsage(std::cout);
    return 0;
  }

  gambit::app::App app(std::move(opts));
  return app.run();
}
