#include "camsnitch/cli/router.hpp"

int main(int argc, char** argv) {
  return camsnitch::cli::Dispatch(argc, argv);
}
