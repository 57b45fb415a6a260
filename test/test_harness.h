#pragma once
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

//A test case fills in why and returns false on failure
typedef std::function<bool(std::string* why)> TestCase;

//Runs named cases in order, prints a result block per case and a summary
//line. finish() is the process exit code.
class TestRun {
public:
  explicit TestRun(const std::string& suite) : suite(suite), total(0), passed(0), failed(0) {}

  void run(const std::string& name, const TestCase& test) {
    total++;
    std::string why;
    bool ok = false;
    try {
      ok = test(&why);
    } catch (const std::exception& e) {
      why = std::string("unexpected exception: ") + e.what();
      ok = false;
    }

    std::cout << "[#" << total << " " << suite << "] " << name << "\n";
    if (ok) {
      passed++;
      std::cout << "RESULT: PASSED\n\n";
    } else {
      failed++;
      std::cout << "RESULT: FAILED (" << why << ")\n\n";
    }
  }

  int finish() const {
    std::cout << "SUMMARY: total=" << total << " passed=" << passed << " failed=" << failed << "\n";
    return failed == 0 ? 0 : 1;
  }

private:
  std::string suite;
  size_t total;
  size_t passed;
  size_t failed;
};

template <typename T>
static std::string Describe(const T& value) {
  std::ostringstream oss;
  oss << value;
  return oss.str();
}

template <typename T>
static std::string Describe(const std::vector<T>& values) {
  std::ostringstream oss;
  oss << "[";
  for (size_t i = 0; i < values.size(); i++) {
    if (i > 0) oss << ", ";
    oss << Describe(values[i]);
  }
  oss << "]";
  return oss.str();
}

template <typename T>
static bool CheckEqual(const T& expected, const T& actual, const std::string& what, std::string* why) {
  if (expected == actual) {
    return true;
  }
  if (why) {
    *why = what + ": expected " + Describe(expected) + ", got " + Describe(actual);
  }
  return false;
}

static inline bool CheckTrue(bool condition, const std::string& what, std::string* why) {
  if (!condition && why) {
    *why = what;
  }
  return condition;
}

//True when body throws E. Any other exception is a failure.
template <typename E>
static bool Throws(const std::function<void()>& body, const std::string& what, std::string* why) {
  try {
    body();
  } catch (const E&) {
    return true;
  } catch (const std::exception& e) {
    if (why) {
      *why = what + ": wrong exception: " + e.what();
    }
    return false;
  }
  if (why) {
    *why = what + ": nothing thrown";
  }
  return false;
}
