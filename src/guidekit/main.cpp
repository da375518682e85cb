#include "guidekit/cli/router.hpp"

int main(int argc, char** argv) {
  return guidekit::cli::Dispatch(argc, argv);
}
