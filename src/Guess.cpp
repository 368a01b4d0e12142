#include "Guess.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>

static std::string trim(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) ++b;
    while (e > b && std::isspace((unsigned char)s[e-1])) --e;
    return s.substr(b, e - b);
}

GuessError Guess::parse(const std::string& line, long long& out) {
    std::string t = trim(line);
    if (t.empty()) return GuessError::Empty;

    // strtoll would also accept leading blanks and hex prefixes, so check the shape first
    size_t i = (t[0] == '+' || t[0] == '-') ? 1 : 0;
    if (i == t.size()) return GuessError::NotANumber;
    for (size_t j = i; j < t.size(); ++j) {
        if (!std::isdigit((unsigned char)t[j])) return GuessError::NotANumber;
    }

    errno = 0;
    long long v = std::strtoll(t.c_str(), nullptr, 10);
    if (errno == ERANGE) return GuessError::Overflow;
    out = v;
    return GuessError::None;
}

GuessResult Guess::compare(long long guess, long long secret) {
    if (guess < secret) return GuessResult::TooSmall;
    if (guess > secret) return GuessResult::TooBig;
    return GuessResult::Correct;
}

const char* Guess::describe(GuessError err) {
    switch (err) {
    case GuessError::None:       return "";
    case GuessError::Empty:
    case GuessError::NotANumber: return "Please type a number!";
    case GuessError::Overflow:   return "Please type a smaller number!";
    }
    return "Please type a number!";
}
