#pragma once
#include <stdexcept>
#include <string>

// Base of all token-layer failures. Transport errors (HTTP, JSON-RPC) keep
// surfacing as plain std::runtime_error.
class TokenError : public std::runtime_error {
public:
  explicit TokenError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed decimal amount or hex input
class ParseError : public TokenError {
public:
  explicit ParseError(const std::string& what) : TokenError("parse error: " + what) {}
};

// Capability not available on the current runtime target
class UnsupportedOperation : public TokenError {
public:
  explicit UnsupportedOperation(const std::string& what) : TokenError("unsupported operation: " + what) {}
};

// Recomputed typed-data hash does not match the signature being submitted
class SignatureMismatch : public TokenError {
public:
  explicit SignatureMismatch(const std::string& what) : TokenError("signature mismatch: " + what) {}
};

// Currency metadata could not be read. Only thrown inside the claim condition
// resolver, which degrades to an empty currency.
class MetadataUnavailable : public TokenError {
public:
  explicit MetadataUnavailable(const std::string& what) : TokenError("metadata unavailable: " + what) {}
};

// Write submission failed; carries the collaborator's message verbatim
class TransactionFailed : public TokenError {
public:
  explicit TransactionFailed(const std::string& what) : TokenError("transaction failed: " + what) {}
};
