#include "tadpole/engine.hpp"
#include "tadpole/evaluate.hpp"
#include "tadpole/misc.hpp"
#include <future>
#include <stdexcept>

namespace Tadpole {

namespace {

// How long the actor waits for a message while a search is running
constexpr std::chrono::milliseconds PollInterval(1);

std::shared_ptr<TranspositionTable> make_table(size_t hashMB) {
    return std::make_shared<TranspositionTable>(TranspositionTable::capacity_for_mb(hashMB));
}

}

Engine::Engine(const EngineConfig& cfg)
    : config(cfg),
      state{Position::startpos(), make_table(cfg.hashMB)},
      pool(std::make_unique<ThreadPool>(cfg.threads)) {
    actor = std::thread([this]() {
        run();
    });
}

Engine::~Engine() {
    // Dropped when the engine has already quit
    inbox.push(Quit{});
    join();
}

void Engine::join() {
    if (actor.joinable())
        actor.join();
}

void Engine::send(EngineMessage msg) {
    if (!inbox.push(std::move(msg)))
        Log::debug("Engine has quit, message dropped");
}

std::optional<EngineReply> Engine::receive() {
    return outbox.pop();
}

void Engine::run() {
    Log::debug("Engine started, ", pool->size(), " threads, ", state.tt->capacity(), " cache entries");

    // A closed inbox ends the loop like a Quit
    while (std::optional<EngineMessage> msg = inbox.pop()) {
        if (!handle(*msg))
            break;
    }

    inbox.close();
    outbox.close();
    Log::debug("Engine stopped");
}

bool Engine::handle(EngineMessage& msg) {
    if (auto* setup = std::get_if<SetPosition>(&msg)) {
        state.position = std::move(setup->position);
        Log::debug("Setup board state ", state.position.fen());
    }
    else if (auto* search = std::get_if<Go>(&msg))
        return go(*search);

    else if (std::holds_alternative<Stop>(msg))
        Log::debug("Stop without a running search, ignored");

    else if (std::holds_alternative<NewGame>(msg)) {
        state.tt = make_table(config.hashMB);
        Log::debug("New game, cache discarded");
    }
    else if (std::holds_alternative<ReadyCheck>(msg))
        outbox.push(ReadyMessage{});

    else if (auto* option = std::get_if<SetOption>(&msg))
        set_option(*option);

    else if (std::holds_alternative<Quit>(msg))
        return false;

    return true;
}

void Engine::set_option(const SetOption& cmd) {
    EngineConfig updated = config;

    try {
        if (!Tadpole::set_option(updated, cmd.name, cmd.value)) {
            Log::error("Unknown option ", cmd.name);
            return;
        }
    } catch (const std::logic_error& e) {
        Log::error("Rejected option ", cmd.name, ": ", e.what());
        return;
    }

    if (updated.hashMB != config.hashMB)
        state.tt = make_table(updated.hashMB);

    if (updated.threads != config.threads)
        pool->resize(updated.threads);

    config = updated;
    Log::debug("Option ", cmd.name, " set to ", cmd.value);
}

bool Engine::go(const Go& cmd) {
    Search::Limits limits;
    limits.maxDepth = cmd.depth.value_or(config.maxDepth);
    limits.aspirationDelta = config.aspirationDelta;

    state.tt->age();
    state.tt->reset_stats();

    // Fresh signal for every search, set at most once
    auto stop = std::make_shared<std::atomic<bool>>(false);
    const Position root = state.position;
    const std::shared_ptr<TranspositionTable> tt = state.tt;
    ThreadPool& workers = *pool;

    Log::debug("Starting search to depth ", limits.maxDepth, " from ", root.fen());

    std::future<std::optional<Search::Outcome>> worker =
        std::async(std::launch::async, [this, root, tt, stop, limits, &workers]() {
            return Search::search(root, *tt, workers, limits, *stop,
                                  [this](const Search::Outcome& o) {
                                      outbox.push(SearchInfo{o.depth, o.score, o.move});
                                  });
        });

    bool keepRunning = true;
    std::deque<EngineMessage> deferred;

    while (worker.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        std::optional<EngineMessage> msg = inbox.pop_for(PollInterval);

        if (!msg) {
            if (inbox.is_closed()) {
                stop->store(true);
                keepRunning = false;
                break;
            }
            continue;
        }

        if (std::holds_alternative<Stop>(*msg)) {
            Log::debug("Stop received, cancelling search");
            stop->store(true);
        }
        else if (std::holds_alternative<ReadyCheck>(*msg))
            outbox.push(ReadyMessage{});

        else if (std::holds_alternative<Quit>(*msg)) {
            stop->store(true);
            keepRunning = false;
        }
        else
            // Position, option and new game changes wait for the reply
            deferred.push_back(std::move(*msg));
    }

    BestMove reply{Move::none(), 0};
    try {
        if (const std::optional<Search::Outcome> result = worker.get())
            reply = BestMove{result->move, result->score};
        else
            reply = BestMove{Move::none(), evaluate(root)};
    } catch (const std::exception& e) {
        Log::error("Search failed: ", e.what());
        const MoveList moves = root.legal_moves();
        reply = BestMove{moves.empty() ? Move::none() : moves.front(), evaluate(root)};
    }

    Log::debug("Search finished: ", reply.move, " score ", reply.score,
               ", cache hits ", tt->hits(), "/", tt->probes());
    outbox.push(reply);

    while (keepRunning && !deferred.empty()) {
        keepRunning = handle(deferred.front());
        deferred.pop_front();
    }
    return keepRunning;
}

}
