#include <unistd.h>

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include "dsscpp/dsscpp.hpp"

namespace {

constexpr char kDefaultClass[] = "storage";

struct CommandLineOptions {
  std::string element_class = kDefaultClass;
};

CommandLineOptions ParseOptions(int argc, char *argv[]) {
  CommandLineOptions opts;
  int opt = 0;
  while ((opt = getopt(argc, argv, "c:h")) != -1) {
    switch (opt) {
      case 'c':
        opts.element_class = optarg;
        break;
      case 'h':
      default:
        std::printf("Usage: %s [-c element_class]\n", argv[0]);
        std::exit(opt == 'h' ? 0 : -1);
    }
  }
  return opts;
}

dsscpp::Result<std::vector<std::string>> ListProperties(
    dsscpp::IDss &dss, const std::string &element_class) {
  typedef dsscpp::Result<std::vector<std::string>> NamesResult;
  const std::string element =
      element_class + ".we_need_this_for_the_properties";

  dsscpp::Result<void> st =
      dss.CommandBlock("new circuit.test\nnew " + element + "\n");
  if (!st) return NamesResult::ErrorFrom(st);

  dsscpp::ICircuit circuit = dss.ActiveCircuit();
  dsscpp::Result<int32_t> idx = circuit.SetActiveElement(element);
  if (!idx) return NamesResult::ErrorFrom(idx);
  if (idx.Value() < 0) {
    return NamesResult::Error(dsscpp::ErrorCode::kInvalidArgument,
                              [element] { return element + " not found"; });
  }
  return circuit.ActiveCktElement().AllPropertyNames();
}

}  // namespace

int main(int argc, char *argv[]) {
  const CommandLineOptions options = ParseOptions(argc, argv);

  auto created = dsscpp::Context::Create();
  if (!created) {
    std::fprintf(stderr, "Context setup failed: %s\n",
                 created.Message().c_str());
    return -1;
  }
  dsscpp::Context ctx = created.MoveValue();
  dsscpp::IDss dss(ctx);

  auto names = ListProperties(dss, options.element_class);
  if (!names) {
    std::fprintf(stderr, "[%s] (#%d) %s\n",
                 dsscpp::ErrorCodeToString(names.Code()), names.EngineCode(),
                 names.Message().c_str());
    return -1;
  }
  for (size_t i = 0; i < names->size(); ++i) {
    std::printf("PropIdx:%zu, PropName:%s\n", i + 1,
                names.Value()[i].c_str());
  }
  std::printf("%zu properties\n", names->size());
  return 0;
}
