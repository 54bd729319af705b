#include "rsa/cli/router.hpp"

int main(int argc, char** argv) {
  return rsa::cli::Dispatch(argc, argv);
}
