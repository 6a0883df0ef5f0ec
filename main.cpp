// -----------------------------------------------------------------------------
// vclock_server: single executable entry point.
//
// Usage:
//   vclock_server [config.json] [--demo]
//
// Server mode (default):
//   1) Load EngineConfig (defaults if no file is given).
//   2) Create the ClockEngine and subscribe console loggers to its bus.
//   3) start(): binds the REP command socket and the PUB telemetry socket.
//   4) Wait for Ctrl-C; the simulation driver talks to us over ZeroMQ.
//   5) stop() and exit.
//
// Demo mode (--demo):
//   Runs a short scripted three-tick run in process (server disabled) and
//   prints the resulting timeline. Running it twice prints the same lines.
//
// Thread layout (server mode):
//   main thread     → waits on the shutdown flag
//   server thread   → ClockServer REP/PUB loop, calls ClockEngine
// -----------------------------------------------------------------------------

#include "vclock/config/engine_config.hpp"
#include "vclock/domain/action_type.hpp"
#include "vclock/engine/clock_engine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. Only an atomic store happens inside
// the handler; main() polls the flag and does the actual shutdown.
// -----------------------------------------------------------------------------
static std::atomic<bool> g_shutdown_requested{false};

static void sigint_handler(int /*signum*/) { g_shutdown_requested.store(true); }

// -----------------------------------------------------------------------------
// subscribeConsoleLoggers
// -----------------------------------------------------------------------------
// One line per clock event on stdout. Callbacks run on whichever thread
// mutated the clock (the server thread in server mode).
// -----------------------------------------------------------------------------
static void subscribeConsoleLoggers(vclock::ClockEngine& engine) {
  engine.eventBus().subscribe<vclock::TickAdvancedEvent>(
      [](const vclock::TickAdvancedEvent& e) {
        std::cout << "[Clock] tick " << e.previous_tick << " -> "
                  << e.current_tick << " range=[" << e.range.start << ", "
                  << e.range.end << "] starts " << e.range_start_iso << "\n";
      });

  engine.eventBus().subscribe<vclock::TimestampIssuedEvent>(
      [](const vclock::TimestampIssuedEvent& e) {
        std::cout << "[Clock] actor=" << e.actor_id << " hint="
                  << (e.action_hint.empty() ? "-" : e.action_hint)
                  << " t=" << e.result.timestamp << " (" << e.iso << ")";
        if (e.parent_timestamp.has_value()) {
          std::cout << " after " << *e.parent_timestamp;
        }
        if (e.result.outcome != vclock::SynthesisOutcome::Drawn) {
          std::cout << " ["
                    << vclock::synthesisOutcomeToString(e.result.outcome)
                    << "]";
        }
        std::cout << "\n";
      });

  engine.eventBus().subscribe<vclock::ClockResetEvent>(
      [](const vclock::ClockResetEvent& e) {
        std::cout << "[Clock] reset from tick " << e.previous_tick
                  << " (seed=" << e.seed << ")\n";
      });
}

// -----------------------------------------------------------------------------
// runDemo
// -----------------------------------------------------------------------------
// Three agents over three ticks: posts, comments on those posts, likes on
// the comments. Every reply is stamped with its parent's timestamp, so the
// printed timeline is causally ordered inside each thread of replies.
// -----------------------------------------------------------------------------
static void runDemo(vclock::ClockEngine& engine) {
  using vclock::domain::ActionType;
  using vclock::domain::actionTypeToString;

  const std::vector<std::int64_t> agents{1, 2, 3};

  for (int step = 0; step < 3; ++step) {
    for (std::size_t i = 0; i < agents.size(); ++i) {
      const std::int64_t author = agents[i];
      const std::int64_t commenter = agents[(i + 1) % agents.size()];
      const std::int64_t liker = agents[(i + 2) % agents.size()];

      const auto post =
          engine.stamp(author, std::nullopt,
                       actionTypeToString(ActionType::CreatePost));
      const auto comment =
          engine.stamp(commenter, post.timestamp,
                       actionTypeToString(ActionType::CreateComment));
      engine.stamp(liker, comment.timestamp,
                   actionTypeToString(ActionType::LikeComment));
    }
    engine.advance();
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  bool demo = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--demo") {
      demo = true;
    } else {
      config_path = arg;
    }
  }

  // ---------------------------------------------------------------------------
  // 1) Configuration
  // ---------------------------------------------------------------------------
  vclock::EngineConfig config;
  try {
    if (!config_path.empty()) {
      config = vclock::loadEngineConfig(config_path);
      std::cout << "[main] Loaded config from " << config_path << "\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] Invalid configuration: " << e.what() << "\n";
    return 1;
  }

  if (demo) {
    config.cmd_endpoint.clear();
    config.pub_endpoint.clear();
  }

  // ---------------------------------------------------------------------------
  // 2) Engine + loggers
  // ---------------------------------------------------------------------------
  vclock::ClockEngine engine(config);
  subscribeConsoleLoggers(engine);

  if (demo) {
    engine.start();
    runDemo(engine);
    engine.stop();
    return 0;
  }

  // ---------------------------------------------------------------------------
  // 3) Serve until Ctrl-C
  // ---------------------------------------------------------------------------
  try {
    engine.start();
  } catch (const std::exception& e) {
    std::cerr << "[main] Failed to start server: " << e.what() << "\n";
    return 1;
  }

  std::signal(SIGINT, sigint_handler);
  std::cout << "[main] Serving clock commands on " << config.cmd_endpoint
            << ", telemetry on " << config.pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (!g_shutdown_requested.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] SIGINT received. Shutting down...\n";
  engine.stop();
  return 0;
}
