#pragma once
#include "Guess.hpp"
#include "Random.hpp"
#include <iosfwd>
#include <stdexcept>
#include <string>

enum class GameState : int { Prompting = 0, AwaitingInput, Evaluating, Won, Closed };

// Thrown when the output stream fails; nothing more can be shown to the player.
struct OutputError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct GuessCount {
    unsigned long long count = 0;
    void increment() { count++; }
    unsigned long long value() const { return count; }
};

// Requires low <= high.
struct GameConfig {
    int low = 1;     // smallest possible secret
    int high = 100;  // largest possible secret
};

class Game {
public:
    // Streams and random source are borrowed and must outlive the game.
    Game(RandomSource& rng, std::istream& in, std::ostream& out, const GameConfig& cfg = GameConfig{});

    // lifecycle
    void initialize();
    GameState step();
    GameState run();

    // input
    bool promptAndRead(std::string& line);

    // expose
    const GameConfig& config() const { return m_cfg; }
    int secret() const { return m_secret; }
    unsigned long long guessCount() const { return m_guesses.value(); }
    GameState state() const { return m_state; }
    bool finished() const { return m_state == GameState::Won || m_state == GameState::Closed; }

private:
    void say(const std::string& line);

private:
    GameConfig m_cfg{};
    RandomSource& m_rng;
    std::istream& m_in;
    std::ostream& m_out;

    int m_secret = 0;
    GuessCount m_guesses;
    GameState m_state = GameState::Prompting;
};

// Plays one session on the given streams and returns the process exit status:
// 0 on a win, 1 when input closes first, 2 when the output stream fails.
int playSession(RandomSource& rng, std::istream& in, std::ostream& out, std::ostream& err);
