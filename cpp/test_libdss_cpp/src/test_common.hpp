// Helpers shared by the dsscpp test cases.
#pragma once

#include <string>

#include "dsscpp/dsscpp.hpp"

#ifndef DSSCPP_TEST_DATA_DIR
#error "DSSCPP_TEST_DATA_DIR must point at cpp/data"
#endif

namespace dsscpp_test {

inline std::string Ieee13ScriptPath() {
  return std::string(DSSCPP_TEST_DATA_DIR) + "/IEEE13Nodeckt.dss";
}

// Build the IEEE 13 node feeder in the context bound to dss (not solved).
inline dsscpp::Result<void> LoadIeee13(dsscpp::IDss& dss) {
  return dss.Command("redirect \"" + Ieee13ScriptPath() + "\"");
}

// Options for contexts driven from worker threads: the working directory
// is process-wide, so no context may change it.
inline dsscpp::ContextOptions ThreadSafeOptions() {
  dsscpp::ContextOptions o;
  o.allow_change_dir = false;
  return o;
}

}  // namespace dsscpp_test
