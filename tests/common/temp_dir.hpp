#ifndef RSA_TESTS_COMMON_TEMP_DIR_HPP_
#define RSA_TESTS_COMMON_TEMP_DIR_HPP_

#include "assertions.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace rsa::tests::common {

// Fresh directory under the system temp root, removed on scope exit.
class ScopedTempDir {
public:
  explicit ScopedTempDir(std::string_view prefix) {
    static std::atomic<unsigned> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "-" + std::to_string(stamp) + "-" +
             std::to_string(counter.fetch_add(1U)));

    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec) {
      Fail("failed to create temp dir " + path_.string() + ": " + ec.message());
    }
  }

  ~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      std::cerr << "warning: leaving temp dir " << path_.string() << ": " << ec.message() << '\n';
    }
  }

  ScopedTempDir(const ScopedTempDir&) = delete;
  ScopedTempDir& operator=(const ScopedTempDir&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

private:
  std::filesystem::path path_;
};

} // namespace rsa::tests::common

#endif // RSA_TESTS_COMMON_TEMP_DIR_HPP_
