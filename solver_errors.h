#pragma once
#include <stdexcept>
#include <string>

//Base class for everything the solvers throw
class SolverError : public std::runtime_error {
public:
  explicit SolverError(const std::string& what) : std::runtime_error(what) {}
};

//A public method received an argument of the wrong shape or value.
//The message names the parameter and the constraint it broke.
class InvalidParameters : public SolverError {
public:
  InvalidParameters(const std::string& parameter, const std::string& reason)
    : SolverError("invalid value for '" + parameter + "' parameter. " + reason),
      param(parameter) {}

  const std::string& parameter() const { return param; }

private:
  std::string param;
};

//A word list or other outside resource could not be read
class ExternalResource : public SolverError {
public:
  explicit ExternalResource(const std::string& what) : SolverError(what) {}
};

//A solve step has no defined result for its input
class SolvingExecution : public SolverError {
public:
  explicit SolvingExecution(const std::string& what) : SolverError(what) {}
};
