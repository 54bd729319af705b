#ifndef RSA_TESTS_COMMON_CLI_DISPATCH_HPP_
#define RSA_TESTS_COMMON_CLI_DISPATCH_HPP_

#include "rsa/cli/router.hpp"

#include <string>
#include <vector>

namespace rsa::tests::common {

inline int DispatchArgs(const std::vector<std::string>& argv_storage) {
  std::vector<char*> argv;
  argv.reserve(argv_storage.size());
  for (const auto& arg : argv_storage) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  return rsa::cli::Dispatch(static_cast<int>(argv.size()), argv.data());
}

} // namespace rsa::tests::common

#endif // RSA_TESTS_COMMON_CLI_DISPATCH_HPP_
