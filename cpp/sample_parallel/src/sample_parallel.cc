#include <unistd.h>

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "dsscpp/dsscpp.hpp"

namespace {

constexpr char kDefaultScript[] = "cpp/data/IEEE13Nodeckt.dss";
constexpr int kDefaultSteps = 90;
constexpr double kMultMin = 0.5;
constexpr double kMultMax = 1.2;
constexpr int kStepsPerDay = 96;  // 15 minute resolution
constexpr char kLossesRegister[] = "Zone Losses kWh";

struct CommandLineOptions {
  std::string script = kDefaultScript;
  unsigned threads = 0;  // 0: hardware concurrency
  int steps = kDefaultSteps;
};

CommandLineOptions ParseOptions(int argc, char *argv[]) {
  CommandLineOptions opts;
  int opt = 0;
  while ((opt = getopt(argc, argv, "f:t:n:h")) != -1) {
    switch (opt) {
      case 'f':
        opts.script = optarg;
        break;
      case 't':
        opts.threads = static_cast<unsigned>(std::atoi(optarg));
        break;
      case 'n':
        opts.steps = std::atoi(optarg);
        break;
      case 'h':
      default:
        std::printf("Usage: %s [-f script.dss] [-t threads] [-n steps]\n",
                    argv[0]);
        std::exit(opt == 'h' ? 0 : -1);
    }
  }
  if (opts.steps <= 0) opts.steps = kDefaultSteps;
  return opts;
}

// Work queue shared by the workers; each input is handed out once.
class InputQueue {
 public:
  explicit InputQueue(const std::vector<double> &inputs)
      : pending_(inputs.begin(), inputs.end()) {}

  bool Pop(double *value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.empty()) return false;
    *value = pending_.front();
    pending_.pop_front();
    return true;
  }

 private:
  std::mutex mutex_;
  std::deque<double> pending_;
};

struct ScenarioResult {
  double load_mult = 0.0;
  double losses_kwh = NAN;
};

class ResultSink {
 public:
  void Push(const ScenarioResult &r) {
    std::lock_guard<std::mutex> lock(mutex_);
    results_.push_back(r);
  }
  std::vector<ScenarioResult> Take() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScenarioResult> out;
    out.swap(results_);
    return out;
  }

 private:
  std::mutex mutex_;
  std::vector<ScenarioResult> results_;
};

// Daily sweep at one load multiplier; losses are NAN when any step
// fails to converge.
dsscpp::Result<double> SolveScenario(dsscpp::ICircuit &circuit,
                                     double load_mult) {
  typedef dsscpp::Result<double> R;
  dsscpp::ISolution sol = circuit.Solution();
  dsscpp::IMeters meters = circuit.Meters();

  // Snapshot first to reset most of the solution state.
  dsscpp::Result<void> st = sol.SetMode(dsscpp::SolveModes::kSnapShot);
  if (st) st = sol.SetControlMode(dsscpp::ControlModes::kOff);
  if (st) st = sol.SetDblHour(0.0);
  if (st) st = sol.SetLoadMult(1.0);
  if (st) st = sol.Solve();
  if (!st) return R::ErrorFrom(st);

  st = sol.SetMode(dsscpp::SolveModes::kDaily);
  if (st) st = sol.SetStepsizeMin(15.0);
  if (st) st = sol.SetNumber(1);
  if (st) st = sol.SetLoadMult(load_mult);
  if (st) st = meters.ResetAll();
  if (!st) return R::ErrorFrom(st);

  bool all_converged = true;
  for (int i = 0; i < kStepsPerDay; ++i) {
    st = sol.Solve();
    if (!st) return R::ErrorFrom(st);
    dsscpp::Result<bool> conv = sol.Converged();
    if (!conv) return R::ErrorFrom(conv);
    if (!conv.Value()) all_converged = false;
  }
  if (!all_converged) return R::Ok(NAN);

  dsscpp::Result<int32_t> first = meters.First();
  if (!first) return R::ErrorFrom(first);
  dsscpp::Result<std::vector<std::string>> names = meters.RegisterNames();
  if (!names) return R::ErrorFrom(names);
  dsscpp::Result<std::vector<double>> totals = meters.Totals();
  if (!totals) return R::ErrorFrom(totals);

  // The register position varies across engine versions; look it up.
  for (size_t i = 0; i < names->size() && i < totals->size(); ++i) {
    if (names.Value()[i] == kLossesRegister) {
      return R::Ok(totals.Value()[i]);
    }
  }
  return R::Error(dsscpp::ErrorCode::kMarshalError, [] {
    return std::string("register '") + kLossesRegister + "' not reported";
  });
}

void Worker(dsscpp::Context *ctx, const std::string &redirect,
            InputQueue *inputs, ResultSink *sink) {
  dsscpp::IDss dss(*ctx);
  dsscpp::Result<void> st = dss.Command(redirect);
  if (!st) {
    std::fprintf(stderr, "worker redirect failed (#%d): %s\n",
                 st.EngineCode(), st.Message().c_str());
    return;
  }
  dsscpp::ICircuit circuit = dss.ActiveCircuit();
  double load_mult = 0.0;
  while (inputs->Pop(&load_mult)) {
    dsscpp::Result<double> r = SolveScenario(circuit, load_mult);
    if (!r) {
      std::fprintf(stderr, "scenario %.4f failed (#%d): %s\n", load_mult,
                   r.EngineCode(), r.Message().c_str());
      continue;
    }
    ScenarioResult out;
    out.load_mult = load_mult;
    out.losses_kwh = r.Value();
    sink->Push(out);
  }
}

int RunParallel(dsscpp::IDss &dss, const std::string &redirect,
                unsigned num_threads, int steps) {
  std::vector<double> mults;
  const double step = (kMultMax - kMultMin) / steps;
  for (int i = 0; i < steps; ++i) mults.push_back(kMultMin + i * step);
  InputQueue inputs(mults);
  ResultSink sink;

  // Contexts are created up front so a failure aborts before any thread.
  std::vector<dsscpp::Context> contexts;
  for (unsigned t = 0; t < num_threads; ++t) {
    dsscpp::Result<dsscpp::Context> r = dss.NewContext();
    if (!r) {
      std::fprintf(stderr, "NewContext failed: %s\n", r.Message().c_str());
      return -1;
    }
    contexts.push_back(r.MoveValue());
  }

  std::printf("Starting %u thread(s)...\n", num_threads);
  const auto start = std::chrono::steady_clock::now();
  std::vector<std::thread> workers;
  for (unsigned t = 0; t < num_threads; ++t) {
    workers.push_back(
        std::thread(Worker, &contexts[t], redirect, &inputs, &sink));
  }
  std::printf("Waiting...\n");
  for (size_t t = 0; t < workers.size(); ++t) workers[t].join();
  const double elapsed =
      std::chrono::duration<double>(std::chrono::steady_clock::now() - start)
          .count();
  std::printf("Total time for %u thread(s): %.2f s\n", num_threads, elapsed);

  std::vector<ScenarioResult> results = sink.Take();
  if (results.size() != mults.size()) {
    std::fprintf(stderr, "%zu of %zu scenarios failed\n",
                 mults.size() - results.size(), mults.size());
    return -1;
  }
  double avg = 0.0;
  for (size_t i = 0; i < results.size(); ++i) avg += results[i].losses_kwh;
  avg /= static_cast<double>(results.size());
  std::printf("Average losses using %u thread(s): %.3f kWh\n", num_threads,
              avg);
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  const CommandLineOptions options = ParseOptions(argc, argv);
  const std::string redirect = "redirect \"" + options.script + "\"";

  auto created = dsscpp::Context::Create();
  if (!created) {
    std::fprintf(stderr, "Context setup failed: %s\n",
                 created.Message().c_str());
    return -1;
  }
  dsscpp::Context ctx = created.MoveValue();
  dsscpp::IDss dss(ctx);

  // The working directory is process-wide; no engine may change it while
  // several run in parallel. Child contexts inherit this setting.
  dsscpp::Result<void> st = dss.SetAllowChangeDir(false);
  if (!st) {
    std::fprintf(stderr, "SetAllowChangeDir failed: %s\n",
                 st.Message().c_str());
    return -1;
  }

  // Try the script once before starting any thread.
  st = dss.Command(redirect);
  if (!st) {
    std::fprintf(stderr, "could not run %s (#%d): %s\n",
                 options.script.c_str(), st.EngineCode(),
                 st.Message().c_str());
    return -1;
  }
  st = dss.ClearAll();
  if (!st) {
    std::fprintf(stderr, "ClearAll failed: %s\n", st.Message().c_str());
    return -1;
  }

  unsigned max_threads = std::thread::hardware_concurrency();
  if (max_threads == 0) max_threads = 1;
  if (options.threads > 0) {
    return RunParallel(dss, redirect, options.threads, options.steps);
  }
  int ret = RunParallel(dss, redirect, 1, options.steps);
  if (ret == 0 && max_threads > 1) {
    ret = RunParallel(dss, redirect, max_threads, options.steps);
  }
  return ret;
}
