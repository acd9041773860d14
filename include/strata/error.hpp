#pragma once
#include <stdexcept>
#include <string>

namespace strata {

// Base class for every error raised by the strata library.
class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Digest absent from the object graph or payload store.
class UnknownObjectError : public Error {
public:
  explicit UnknownObjectError(const std::string &what) : Error("unknown object: " + what) {}
};

// Tag name, tag version or alias absent.
class UnknownReferenceError : public Error {
public:
  explicit UnknownReferenceError(const std::string &what)
      : Error("unknown reference: " + what) {}
};

// Digest prefix matches more than one stored object.
class AmbiguousReferenceError : public Error {
public:
  explicit AmbiguousReferenceError(const std::string &what)
      : Error("ambiguous reference: " + what) {}
};

// Malformed tag spec, digest string or env spec.
class InvalidReferenceError : public Error {
public:
  explicit InvalidReferenceError(const std::string &what)
      : Error("invalid reference: " + what) {}
};

class UnsupportedFileTypeError : public Error {
public:
  explicit UnsupportedFileTypeError(const std::string &path)
      : Error("unsupported file type: " + path) {}
};

class NothingToCommitError : public Error {
public:
  NothingToCommitError() : Error("nothing to commit: runtime has no local changes") {}
};

class NoRuntimeError : public Error {
public:
  explicit NoRuntimeError(const std::string &what) : Error("no runtime: " + what) {}
};

class RuntimeExistsError : public Error {
public:
  explicit RuntimeExistsError(const std::string &name) : Error("runtime exists: " + name) {}
};

// Corrupted or truncated binary encoding.
class DecodeError : public Error {
public:
  explicit DecodeError(const std::string &what) : Error("decode: " + what) {}
};

// Overlay mount or unmount failure; never retried.
class MountError : public Error {
public:
  explicit MountError(const std::string &what) : Error("mount: " + what) {}
};

} // namespace strata
