#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace tsim {

// Root of everything the core reports instead of aborting.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed flag values, missing required flags, bad edit rows.
class ConfigError : public Error {
public:
  using Error::Error;
};

// Missing or corrupt map, scenario or savestate.
class LoadError : public Error {
public:
  LoadError(std::string path, const std::string& reason)
    : Error("couldn't load " + path + ": " + reason), path_(std::move(path)) {}
  const std::string& path() const { return path_; }
private:
  std::string path_;
};

// A save that did not complete. Never treat the state as persisted.
class PersistenceError : public Error {
public:
  PersistenceError(std::string path, const std::string& reason)
    : Error("couldn't save " + path + ": " + reason), path_(std::move(path)) {}
  const std::string& path() const { return path_; }
private:
  std::string path_;
};

// Challenge/goal combinations that can't be scored, missing baselines.
class ChallengeError : public Error {
public:
  using Error::Error;
};

} // namespace tsim
