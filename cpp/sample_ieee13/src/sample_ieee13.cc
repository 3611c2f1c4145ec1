#include <stdint.h>
#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "dsscpp/dsscpp.hpp"

namespace {

constexpr char kDefaultScript[] = "cpp/data/IEEE13Nodeckt.dss";

struct CommandLineOptions {
  std::string script = kDefaultScript;
  bool use_prime = false;
};

CommandLineOptions ParseOptions(int argc, char *argv[]) {
  CommandLineOptions opts;
  int opt = 0;
  while ((opt = getopt(argc, argv, "f:ph")) != -1) {
    switch (opt) {
      case 'f':
        opts.script = optarg;
        break;
      case 'p':
        opts.use_prime = true;
        break;
      case 'h':
      default:
        std::printf("Usage: %s [-f script.dss] [-p]\n", argv[0]);
        std::printf("  -f  circuit script (default %s)\n", kDefaultScript);
        std::printf("  -p  run on the prime engine instance\n");
        std::exit(opt == 'h' ? 0 : -1);
    }
  }
  return opts;
}

int Report(dsscpp::IDss &dss) {
  dsscpp::ICircuit circuit = dss.ActiveCircuit();

  auto name = circuit.Name();
  auto buses = circuit.NumBuses();
  auto nodes = circuit.NumNodes();
  if (!name || !buses || !nodes) {
    std::fprintf(stderr, "circuit query failed\n");
    return -1;
  }
  std::printf("Circuit: %s (%d buses, %d nodes)\n", name->c_str(),
              buses.Value(), nodes.Value());

  auto conv = circuit.Solution().Converged();
  auto iters = circuit.Solution().Iterations();
  if (conv && iters) {
    std::printf("Converged: %s after %d iteration(s)\n",
                conv.Value() ? "yes" : "no", iters.Value());
  }

  auto node_names = circuit.AllNodeNames();
  if (!node_names) {
    std::fprintf(stderr, "AllNodeNames failed (#%d): %s\n",
                 node_names.EngineCode(), node_names.Message().c_str());
    return -1;
  }
  auto pu = circuit.AllBusVmagPu();
  if (!pu) {
    std::fprintf(stderr, "AllBusVmagPu failed (#%d): %s\n", pu.EngineCode(),
                 pu.Message().c_str());
    return -1;
  }
  for (size_t i = 0; i < node_names->size() && i < pu->size(); ++i) {
    std::printf("  %-12s %8.5f pu\n", node_names.Value()[i].c_str(),
                pu.Value()[i]);
  }

  auto losses = circuit.Losses();
  auto power = circuit.TotalPower();
  if (losses && power) {
    std::printf("Total power: %.3f kW, %.3f kvar\n", power->real(),
                power->imag());
    std::printf("Losses:      %.3f kW, %.3f kvar\n", losses->real() / 1000.0,
                losses->imag() / 1000.0);
  }
  return 0;
}

}  // namespace

int main(int argc, char *argv[]) {
  const CommandLineOptions options = ParseOptions(argc, argv);

  auto created = options.use_prime ? dsscpp::Context::Prime()
                                   : dsscpp::Context::Create();
  if (!created) {
    std::fprintf(stderr, "Context setup failed: %s\n",
                 created.Message().c_str());
    return -1;
  }
  dsscpp::Context ctx = created.MoveValue();
  ctx.Dump();

  dsscpp::IDss dss(ctx);
  auto version = dss.Version();
  if (version) {
    std::printf("%s\n", version->c_str());
  }

  auto st = dss.Command("redirect \"" + options.script + "\"");
  if (!st) {
    std::fprintf(stderr, "redirect %s failed (#%d): %s\n",
                 options.script.c_str(), st.EngineCode(),
                 st.Message().c_str());
    return -1;
  }
  st = dss.ActiveCircuit().Solution().Solve();
  if (!st) {
    std::fprintf(stderr, "Solve failed (#%d): %s\n", st.EngineCode(),
                 st.Message().c_str());
    return -1;
  }

  int ret = Report(dss);
  if (options.use_prime) {
    // The prime instance outlives this wrapper; leave it empty.
    st = dss.ClearAll();
    if (!st) {
      std::fprintf(stderr, "ClearAll failed: %s\n", st.Message().c_str());
    }
  }
  return ret;
}
