#ifndef PODFS_FILE_ERROR_HPP
#define PODFS_FILE_ERROR_HPP

#include <stdexcept>
#include <string>
#include "services/service_error.hpp"

namespace podfs {
namespace file {

class FileError : public std::runtime_error {
public:
  explicit FileError(const std::string& message) 
    : std::runtime_error(message) {}
};

// ---- CALLER INPUT, RAISED BEFORE ANY REMOTE CALL ----
class ValidationError : public FileError {
public:
  explicit ValidationError(const std::string& message) 
    : FileError("Validation error: " + message) {}
};

class InvalidPath : public ValidationError {
public:
  explicit InvalidPath(const std::string& path) 
    : ValidationError("Invalid path: '" + path + "'") {}
};

class InvalidPodName : public ValidationError {
public:
  explicit InvalidPodName(const std::string& name) 
    : ValidationError("Invalid pod name: '" + name + "'") {}
};

class InvalidReference : public ValidationError {
public:
  explicit InvalidReference(const std::string& reference) 
    : ValidationError("Invalid encrypted reference: '" + reference + "'") {}
};

class InvalidBlockSize : public ValidationError {
public:
  InvalidBlockSize() 
    : ValidationError("Block size must be a positive integer") {}
};

// ---- IDENTITY RESOLUTION ----
using NotAuthenticated = services::NotAuthenticated;
using PodNotFound = services::PodNotFound;

// ---- EXPECTED REMOTE DATA MISSING ----
class NotFound : public FileError {
public:
  explicit NotFound(const std::string& path) 
    : FileError("Not found: " + path) {}
};

// A manifest or block address could not be dereferenced
class IncompleteBlocks : public FileError {
public:
  explicit IncompleteBlocks(const std::string& message) 
    : FileError("Incomplete blocks: " + message) {}
};

// ---- CODEC LEVEL DECODE FAILURES ----
class DecodeError : public FileError {
public:
  explicit DecodeError(const std::string& message) 
    : FileError(message) {}
};

// Document is not syntactically valid
class FormatError : public DecodeError {
public:
  explicit FormatError(const std::string& message) 
    : DecodeError("Format error: " + message) {}
};

// Required field missing or of the wrong type
class SchemaError : public DecodeError {
public:
  explicit SchemaError(const std::string& message) 
    : DecodeError("Schema error: " + message) {}
};

// Recognized document with an unsupported schema version
class VersionError : public FileError {
public:
  explicit VersionError(const std::string& version) 
    : FileError("Unsupported metadata version: " + version) {}
};

// ---- STRUCTURAL FAILURES OF FETCHED DATA ----
class CorruptManifest : public FileError {
public:
  explicit CorruptManifest(const std::string& message) 
    : FileError("Corrupt manifest: " + message) {}
};

class CorruptMetadata : public FileError {
public:
  explicit CorruptMetadata(const std::string& message) 
    : FileError("Corrupt metadata: " + message) {}
};

class CorruptShareInfo : public FileError {
public:
  explicit CorruptShareInfo(const std::string& message) 
    : FileError("Corrupt share info: " + message) {}
};

class OperationCancelled : public FileError {
public:
  explicit OperationCancelled(const std::string& operation) 
    : FileError("Operation cancelled: " + operation) {}
};

} // namespace file
} // namespace podfs

#endif // PODFS_FILE_ERROR_HPP
