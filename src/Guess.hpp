#pragma once
#include <string>

enum class GuessResult : int { TooSmall = 0, TooBig = 1, Correct = 2 };

enum class GuessError : int {
    None = 0,
    Empty,       // blank line
    NotANumber,  // anything but an optionally signed base-10 integer
    Overflow     // digits only, but out of range for long long
};

namespace Guess {
    // Trim surrounding whitespace and parse a base-10 integer into `out`.
    // `out` is left untouched unless GuessError::None is returned.
    GuessError parse(const std::string& line, long long& out);

    GuessResult compare(long long guess, long long secret);

    // Line shown to the player for a rejected guess.
    const char* describe(GuessError err);
}
