#include "application.hpp"

#include <iostream>
#include <span>

int main(int argc, char* argv[]) {
  auto count = static_cast<std::size_t>(argc > 1 ? argc - 1 : 0);
  std::span<char const* const> args{argv + 1, count};

  return weasel::execute(argc > 0 ? argv[0] : "weasel", args, std::cout);
}
