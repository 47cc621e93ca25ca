#pragma once

#include <stdexcept>
#include <string>

namespace saft {

// Root of every error raised by the ingestion engine.
class SaftError : public std::runtime_error {
public:
	explicit SaftError(const std::string &message) : std::runtime_error(message) {
	}
};

// Unreadable or non-conforming container. Fatal, no fallback is attempted.
class SourceFormatError : public SaftError {
public:
	explicit SourceFormatError(const std::string &message) : SaftError(message) {
	}
};

// Failure inside the streaming path. Converted into a failed StreamingAttempt and
// answered by the fallback parser; never surfaces from Ingest().
class StreamingTraversalError : public SaftError {
public:
	explicit StreamingTraversalError(const std::string &message) : SaftError(message) {
	}
};

// Failure inside the fallback path. Nothing else can recover from it.
class FallbackParsingError : public SaftError {
public:
	explicit FallbackParsingError(const std::string &message) : SaftError(message) {
	}
};

// Numeric text that cannot be read as an exact decimal.
class AmountFormatError : public SaftError {
public:
	explicit AmountFormatError(const std::string &message) : SaftError(message) {
	}
};

} // namespace saft
