#pragma once
#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <variant>

#include "tadpole/channel.hpp"
#include "tadpole/options.hpp"
#include "tadpole/position.hpp"
#include "tadpole/search.hpp"
#include "tadpole/thread.hpp"
#include "tadpole/transposition.hpp"

namespace Tadpole {

// Commands understood by the engine
struct SetPosition { Position position; };
struct Go { std::optional<int> depth; };
struct Stop {};
struct NewGame {};
struct ReadyCheck {};
struct SetOption { std::string name; std::string value; };
struct Quit {};

using EngineMessage = std::variant<SetPosition, Go, Stop, NewGame, ReadyCheck, SetOption, Quit>;

// Replies. Every Go is answered by exactly one BestMove, SearchInfo
// reports each completed depth before it.
struct ReadyMessage {};
struct SearchInfo { int depth; int score; Move move; };
struct BestMove { Move move; int score; };

using EngineReply = std::variant<ReadyMessage, SearchInfo, BestMove>;

// Single-threaded actor owning the position, the cache and the search
// threads. All of its state is touched only from the actor thread; the
// outside world talks to it through send() and receive().
class Engine {
private:
    struct SearchState {
        Position position;
        std::shared_ptr<TranspositionTable> tt;
    };

    EngineConfig config;
    SearchState state;
    std::unique_ptr<ThreadPool> pool;

    Channel<EngineMessage> inbox;
    Channel<EngineReply> outbox;
    std::thread actor;

    void run();
    // Returns false when the actor loop has to end
    bool handle(EngineMessage& msg);
    bool go(const Go& cmd);
    void set_option(const SetOption& cmd);

public:
    explicit Engine(const EngineConfig& cfg = EngineConfig{});
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    void send(EngineMessage msg);

    // nullopt once the engine has quit and every reply was consumed
    std::optional<EngineReply> receive();

    template<typename Rep, typename Period>
    std::optional<EngineReply> receive_for(const std::chrono::duration<Rep, Period>& timeout) {
        return outbox.pop_for(timeout);
    }

    // Waits for the actor thread to finish after a Quit
    void join();
};

}
