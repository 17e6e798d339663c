#define CATCH_CONFIG_RUNNER
#include <iostream>
#include <cstdlib>
#include <catch2/catch.hpp>

#include "spotycli_tracing.hpp"

int main(int argc, char *argv[]) {
  // Tests run silent unless SPOTYCLI_TEST_TRACE names a level (e.g. DEBUG)
  auto& tracer = spotycli::SpotycliTracer::Instance();
  tracer.SetEnabled(false);
  if (const char* level = std::getenv("SPOTYCLI_TEST_TRACE")) {
    tracer.SetLevel(spotycli::StringToTraceLevel(level));
    tracer.SetOutputMode("console");
    tracer.SetEnabled(true);
  }

  std::cout << std::endl << "**** SPOTYCLI Unit Tests ****" << std::endl << std::endl;

  return Catch::Session().run(argc, argv);
}
