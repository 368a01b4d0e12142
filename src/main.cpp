#include "Game.hpp"
#include "Random.hpp"
#include <iostream>

int main() {
    MersenneSource rng;
    return playSession(rng, std::cin, std::cout, std::cerr);
}
