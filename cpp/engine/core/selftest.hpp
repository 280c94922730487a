#pragma once
/*
================================================================================
Core: Self-test harness
FILE: cpp/engine/core/selftest.hpp

Purpose:
  - Framework-free helpers shared by the *_selftest executables.
  - No Catch2/GoogleTest: each selftest is a tiny main() that returns non-zero
    on failure so CTest (or a shell loop) can gate on it.

Usage:
    arbor::selftest::Report r{"section_load"};
    r.expect_true(x > 0, "x positive");
    r.expect_near(a, b, 1e-6, "a ~ b");
    return r.finish();
================================================================================
*/

#include <algorithm>
#include <cmath>
#include <exception>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arbor::selftest {

// Relative/absolute closeness.
inline bool near(double a, double b, double rel = 1e-9, double abs = 1e-12) noexcept {
  if (a == b) return true;  // covers matching infinities
  const double da = std::fabs(a - b);
  if (da <= abs) return true;
  const double sc = std::max({std::fabs(a), std::fabs(b), abs});
  return da / sc <= rel;
}

class Report final {
 public:
  explicit Report(std::string suite) : suite_(std::move(suite)) {}

  bool ok() const noexcept { return failures_.empty(); }
  const std::vector<std::string>& failures() const noexcept { return failures_; }

  void pass(std::string_view msg) {
    ++passed_;
    std::cerr << "[ OK ] " << suite_ << ": " << msg << "\n";
  }

  void fail(std::string_view msg) {
    failures_.emplace_back(msg);
    std::cerr << "[FAIL] " << suite_ << ": " << msg << "\n";
  }

  void expect_true(bool v, std::string_view msg) {
    if (v) pass(msg);
    else fail(msg);
  }

  void expect_near(double got, double want, double rel, std::string_view msg) {
    if (near(got, want, rel, 1e-12)) {
      pass(msg);
    } else {
      fail(msg);
      std::cerr << "  got:  " << got << "\n";
      std::cerr << "  want: " << want << "\n";
    }
  }

  // Runs one named case; an escaping exception is a failure, not a crash.
  void run(std::string_view name, const std::function<void(Report&)>& body) {
    try {
      body(*this);
    } catch (const std::exception& e) {
      fail(std::string(name) + ": threw: " + e.what());
    }
  }

  template <typename Ex>
  void expect_throws(const std::function<void()>& fn, std::string_view msg) {
    try {
      fn();
    } catch (const Ex&) {
      pass(msg);
      return;
    } catch (const std::exception& e) {
      fail(std::string(msg) + " (wrong exception: " + e.what() + ")");
      return;
    }
    fail(std::string(msg) + " (no exception)");
  }

  int finish() const {
    std::cerr << "---- " << suite_ << ": " << passed_ << " passed, "
              << failures_.size() << " failed\n";
    return ok() ? 0 : 1;
  }

 private:
  std::string suite_;
  std::vector<std::string> failures_;
  int passed_ = 0;
};

}  // namespace arbor::selftest
