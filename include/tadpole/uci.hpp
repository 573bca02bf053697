#pragma once
#include <iostream>
#include <string>
#include <thread>

#include "tadpole/engine.hpp"
#include "tadpole/options.hpp"
#include "tadpole/position.hpp"

namespace Tadpole {

namespace UCI {

// "startpos [moves ...]" or "fen <fen> [moves ...]". Throws
// std::invalid_argument on a bad FEN or an illegal move.
Position parse_position(std::istream& is);

// "go" arguments. Only depth limits the search, clock arguments are read
// and dropped.
Go parse_go(std::istream& is);

// "setoption name <name> [value <value>]"
SetOption parse_setoption(std::istream& is);

}

class UCIHandler {
private:
    EngineConfig options;
    Position pos;
    Engine engine;
    std::thread printer;

    void identify() const;
    void set_option(std::istream& is);
    void print_replies();
    void shutdown();

public:
    UCIHandler();
    ~UCIHandler();

    UCIHandler(const UCIHandler&) = delete;
    UCIHandler& operator=(const UCIHandler&) = delete;

    // Reads commands until "quit" or end of input
    void loop(std::istream& in = std::cin);
};

}
