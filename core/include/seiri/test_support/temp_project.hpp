// seiri/test_support/temp_project.hpp - on-disk scratch projects for tests
//
// A TempProject owns a fresh directory under the system temp dir and removes
// it on destruction. Files are written relative to that directory.
//
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace seiri::test_support
{

class TempProject
{
public:
  explicit TempProject(std::string_view prefix = "seiri_test")
  {
    static std::atomic<unsigned> counter{0};
    const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
    root_ = std::filesystem::temp_directory_path() /
            (std::string(prefix) + "_" + std::to_string(now) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(root_);
  }

  ~TempProject()
  {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  TempProject(const TempProject &) = delete;
  TempProject & operator=(const TempProject &) = delete;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }

  [[nodiscard]] std::filesystem::path path(std::string_view relative) const
  {
    return root_ / std::filesystem::path(std::string(relative));
  }

  /// Write `content` to `relative`, creating parent directories
  std::filesystem::path write(std::string_view relative, std::string_view content) const
  {
    const auto p = path(relative);
    std::filesystem::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) {
      throw std::runtime_error("failed to open file for writing: " + p.string());
    }
    out << content;
    return p;
  }

  [[nodiscard]] std::string read(std::string_view relative) const
  {
    std::ifstream in(path(relative), std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

private:
  std::filesystem::path root_;
};

}  // namespace seiri::test_support
