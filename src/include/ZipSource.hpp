#pragma once

#include "SourceReader.hpp"

#include <memory>
#include <string>

namespace saft {

// Open the first .xml member (case-insensitive, archive order) of a zip archive as a stream.
// The member is inflated while it is read and its CRC is checked once the last byte has
// been delivered. Throws SourceFormatError when the archive cannot be read or holds no
// .xml member.
std::unique_ptr<ByteSource> OpenZipMember(const std::string &path);

} // namespace saft
