#include "Game.hpp"
#include <istream>
#include <ostream>

Game::Game(RandomSource& rng, std::istream& in, std::ostream& out, const GameConfig& cfg)
    : m_cfg(cfg), m_rng(rng), m_in(in), m_out(out) {
    initialize();
}

void Game::initialize() {
    m_secret = m_rng.uniformInt(m_cfg.low, m_cfg.high);
    m_guesses = GuessCount{};
    m_state = GameState::Prompting;
    say("Guess the number");
}

void Game::say(const std::string& line) {
    m_out << line << '\n';
    m_out.flush();
    if (!m_out) throw OutputError("failed to write to output stream");
}

bool Game::promptAndRead(std::string& line) {
    say("Please input your guess:");
    m_state = GameState::AwaitingInput;
    if (!std::getline(m_in, line)) return false;
    m_state = GameState::Evaluating;
    return true;
}

GameState Game::step() {
    if (finished()) return m_state;

    std::string line;
    if (!promptAndRead(line)) {
        m_state = GameState::Closed;
        return m_state;
    }

    long long guess = 0;
    GuessError err = Guess::parse(line, guess);
    if (err != GuessError::None) {
        say(Guess::describe(err));
        m_state = GameState::Prompting;
        return m_state;
    }

    m_guesses.increment();
    switch (Guess::compare(guess, m_secret)) {
    case GuessResult::TooSmall:
        say("Too small");
        m_state = GameState::Prompting;
        break;
    case GuessResult::TooBig:
        say("Too big");
        m_state = GameState::Prompting;
        break;
    case GuessResult::Correct:
        say("You win, in " + std::to_string(m_guesses.value()) + " guesses!");
        m_state = GameState::Won;
        break;
    }
    return m_state;
}

GameState Game::run() {
    while (!finished()) step();
    return m_state;
}

int playSession(RandomSource& rng, std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        Game game(rng, in, out);

        if (game.run() == GameState::Won) return 0;

        err << "No answer: input closed before the number was guessed." << std::endl;
        return 1;
    } catch (const OutputError& e) {
        err << "error: " << e.what() << std::endl;
        return 2;
    }
}
