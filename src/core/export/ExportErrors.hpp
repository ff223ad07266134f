#pragma once
#include <stdexcept>
#include <string>

namespace skya {

// Rejected request parameters (bad format, bad date range, missing owner).
class ValidationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Not enough free space under the export root for the estimated bundle.
class InsufficientSpaceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// An export is already queued or running for the same owner.
class ConflictError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

class NotFoundError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// The job or record belongs to another owner.
class ForbiddenError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace skya
