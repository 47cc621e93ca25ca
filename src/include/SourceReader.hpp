#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace saft {

// Sequential byte stream over an input document. Close() is idempotent and is also run
// by the destructor, so the underlying file is released even when the stream is
// abandoned half-way (cancellation, fallback).
class ByteSource {
public:
	virtual ~ByteSource() = default;

	// Read up to n bytes into buf. Returns 0 at end of stream.
	virtual size_t Read(char *buf, size_t n) = 0;
	virtual void Close() = 0;

	// File name, or "archive.zip:member.xml" for archive members.
	[[nodiscard]] virtual const std::string &Name() const = 0;
};

enum class ContainerKind { RAW, ZIP, GZIP };

class SourceReader {
public:
	// Open path as a raw document, a gzip stream or a zip archive holding an .xml member.
	// Container detection is by magic bytes. Throws SourceFormatError.
	static std::unique_ptr<ByteSource> Open(const std::string &path);

	static ContainerKind Detect(const std::string &path);
};

} // namespace saft
