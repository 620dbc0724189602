#pragma once

#include <stdexcept>
#include <string>

// Base for every failure raised while turning a recording into a table.
class ActivityError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// No samples, or no events to segment against.
class EmptyInputError : public ActivityError {
public:
  using ActivityError::ActivityError;
};

// Malformed, non-monotonic or conflicting timestamps.
class DataIntegrityError : public ActivityError {
public:
  using ActivityError::ActivityError;
};

// Input combinations the pipeline refuses to guess about.
class NotSupportedError : public ActivityError {
public:
  using ActivityError::ActivityError;
};

// A field carries a unit tag that has no known conversion.
class UnitAmbiguityError : public ActivityError {
public:
  using ActivityError::ActivityError;
};

// The bytes handed to a decoder are not a valid file of that format.
class DecodeError : public ActivityError {
public:
  using ActivityError::ActivityError;
};
