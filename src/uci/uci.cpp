#include "tadpole/uci.hpp"
#include "tadpole/evaluate.hpp"
#include "tadpole/misc.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace Tadpole {

namespace UCI {

namespace {

// Joins the words in [first, last) with single spaces
std::string join(std::vector<std::string>::const_iterator first,
                 std::vector<std::string>::const_iterator last) {
    std::string text;
    for (; first != last; ++first)
        text += (text.empty() ? "" : " ") + *first;
    return text;
}

std::vector<std::string> words_of(std::istream& is) {
    return {std::istream_iterator<std::string>(is), std::istream_iterator<std::string>()};
}

}

Position parse_position(std::istream& is) {
    const std::vector<std::string> words = words_of(is);
    const auto movesAt = std::find(words.begin(), words.end(), "moves");

    Position pos;
    if (!words.empty() && words.front() == "startpos")
        pos = Position::startpos();
    else if (!words.empty() && words.front() == "fen")
        pos = Position::from_fen(join(words.begin() + 1, movesAt));
    else
        throw std::invalid_argument("position expects startpos or fen, got '"
                                    + join(words.begin(), movesAt) + "'");

    if (movesAt != words.end())
        for (auto it = movesAt + 1; it != words.end(); ++it)
            pos = pos.apply(pos.parse_move(*it));

    return pos;
}

Go parse_go(std::istream& is) {
    Go cmd;
    std::string token;

    while (is >> token) {
        if (token == "depth") {
            int depth = 0;
            if (!(is >> depth) || depth < 1)
                throw std::invalid_argument("go depth expects a positive integer");
            cmd.depth = depth;
        }
        else if (token == "wtime" || token == "btime" || token == "winc" || token == "binc"
                 || token == "movestogo" || token == "nodes" || token == "mate" || token == "movetime") {
            long ignored = 0;
            is >> ignored;
        }
    }
    return cmd;
}

// setoption name <words> [value <words>], names may contain spaces
SetOption parse_setoption(std::istream& is) {
    const std::vector<std::string> words = words_of(is);
    const auto nameAt = std::find(words.begin(), words.end(), "name");
    const auto valueAt = std::find(words.begin(), words.end(), "value");

    SetOption cmd;
    if (nameAt != words.end() && nameAt < valueAt)
        cmd.name = join(nameAt + 1, valueAt);
    if (valueAt != words.end())
        cmd.value = join(valueAt + 1, words.end());
    return cmd;
}

}

UCIHandler::UCIHandler() : engine(options) {
    printer = std::thread([this]() {
        print_replies();
    });
}

UCIHandler::~UCIHandler() {
    shutdown();
}

void UCIHandler::shutdown() {
    engine.send(Quit{});
    engine.join();
    if (printer.joinable())
        printer.join();
}

void UCIHandler::loop(std::istream& in) {
    std::string line;
    std::string token;

    while (std::getline(in, line)) {
        std::istringstream iss(line);
        token.clear();
        iss >> token;
        Log::debug(">> ", line);

        try {
            if (token == "uci") {
                identify();
            } else if (token == "isready") {
                engine.send(ReadyCheck{});
            } else if (token == "ucinewgame") {
                engine.send(NewGame{});
            } else if (token == "position") {
                pos = UCI::parse_position(iss);
                engine.send(SetPosition{pos});
            } else if (token == "go") {
                engine.send(UCI::parse_go(iss));
            } else if (token == "stop") {
                engine.send(Stop{});
            } else if (token == "quit") {
                break;
            } else if (token == "setoption") {
                set_option(iss);
            } else if (token == "d") {
                sync_cout << pos.fen() << sync_endl;
            } else if (token == "eval") {
                sync_cout << "info string static eval " << evaluate(pos) << sync_endl;
            } else if (!token.empty()) {
                sync_cout << "info string Unknown command: " << line << sync_endl;
            }
        } catch (const std::logic_error& e) {
            Log::error(e.what());
            sync_cout << "info string " << e.what() << sync_endl;
        } catch (const std::runtime_error& e) {
            Log::error(e.what());
            sync_cout << "info string " << e.what() << sync_endl;
        }
    }

    shutdown();
}

void UCIHandler::identify() const {
    const EngineConfig defaults;
    sync_cout << "id name " << engine_info(true) << "\n"
              << "option name Hash type spin default " << defaults.hashMB << " min 1 max 4096\n"
              << "option name Threads type spin default " << defaults.threads << " min 1 max 256\n"
              << "option name Depth type spin default " << defaults.maxDepth << " min 1 max 32\n"
              << "option name AspirationWindow type spin default " << defaults.aspirationDelta
              << " min 1 max 10000\n"
              << "option name Debug Log File type string default <empty>\n"
              << "uciok" << sync_endl;
}

void UCIHandler::set_option(std::istream& is) {
    const SetOption cmd = UCI::parse_setoption(is);

    if (cmd.name == "Debug Log File") {
        if (cmd.value.empty() || cmd.value == "<empty>") {
            Log::stop();
        } else {
            Log::start(cmd.value);
            Log::info(engine_info(), " logging to ", cmd.value);
        }
        return;
    }

    // Validate here so the user sees the error, the engine applies it
    if (!Tadpole::set_option(options, cmd.name, cmd.value)) {
        sync_cout << "info string No such option: " << cmd.name << sync_endl;
        return;
    }
    engine.send(cmd);
}

void UCIHandler::print_replies() {
    while (std::optional<EngineReply> reply = engine.receive()) {
        if (std::holds_alternative<ReadyMessage>(*reply)) {
            sync_cout << "readyok" << sync_endl;
        }
        else if (const auto* info = std::get_if<SearchInfo>(&*reply)) {
            sync_cout << "info depth " << info->depth << " score cp " << info->score
                      << " pv " << info->move << sync_endl;
        }
        else if (const auto* best = std::get_if<BestMove>(&*reply)) {
            Log::debug("<< bestmove ", best->move, " score ", best->score);
            sync_cout << "bestmove " << best->move << sync_endl;
        }
    }
}

}
