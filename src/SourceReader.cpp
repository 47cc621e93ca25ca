#include "SourceReader.hpp"
#include "SaftErrors.hpp"
#include "ZipSource.hpp"

#include <cstdio>
#include <cstring>
#include <vector>
#include <zlib.h>

namespace saft {

namespace {

constexpr uint32_t ZIP_LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t ZIP_END_OF_CENTRAL_DIR_SIG = 0x06054b50;
constexpr uint32_t ZIP_SPANNED_SIG = 0x08074b50;
constexpr size_t INFLATE_CHUNK = 65536;

uint32_t ReadLE32(const unsigned char *p) {
	return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) | (static_cast<uint32_t>(p[2]) << 16) |
	       (static_cast<uint32_t>(p[3]) << 24);
}

// Owns the FILE handle shared by all source kinds.
class FileHandle {
public:
	explicit FileHandle(const std::string &path) {
		file_ = std::fopen(path.c_str(), "rb");
		if (!file_) {
			throw SourceFormatError("SourceReader: cannot open file: " + path);
		}
	}

	~FileHandle() {
		Close();
	}

	FileHandle(const FileHandle &) = delete;
	FileHandle &operator=(const FileHandle &) = delete;

	FILE *Get() const {
		return file_;
	}

	void Close() {
		if (file_) {
			std::fclose(file_);
			file_ = nullptr;
		}
	}

private:
	FILE *file_ = nullptr;
};

class RawFileSource : public ByteSource {
public:
	explicit RawFileSource(const std::string &path) : file_(path), name_(path) {
	}

	size_t Read(char *buf, size_t n) override {
		if (!file_.Get()) {
			return 0;
		}
		size_t got = std::fread(buf, 1, n, file_.Get());
		if (got == 0 && std::ferror(file_.Get())) {
			throw SourceFormatError("SourceReader: read error in " + name_);
		}
		return got;
	}

	void Close() override {
		file_.Close();
	}

	const std::string &Name() const override {
		return name_;
	}

private:
	FileHandle file_;
	std::string name_;
};

// Inflates a gzip stream on the fly, continuing across concatenated members.
class GzipSource : public ByteSource {
public:
	GzipSource(std::unique_ptr<FileHandle> file, std::string name)
	    : file_(std::move(file)), name_(std::move(name)), input_(INFLATE_CHUNK) {
		std::memset(&strm_, 0, sizeof(strm_));
		if (inflateInit2(&strm_, 16 + MAX_WBITS) != Z_OK) {
			throw SourceFormatError("SourceReader: inflateInit failed for " + name_);
		}
		initialized_ = true;
	}

	~GzipSource() override {
		Close();
	}

	size_t Read(char *buf, size_t n) override {
		if (!file_ || finished_ || n == 0) {
			return 0;
		}
		strm_.next_out = reinterpret_cast<Bytef *>(buf);
		strm_.avail_out = static_cast<uInt>(n);

		while (strm_.avail_out == n && !finished_) {
			if (strm_.avail_in == 0) {
				Refill();
			}
			bool input_exhausted = strm_.avail_in == 0;
			int ret = inflate(&strm_, Z_NO_FLUSH);
			if (ret == Z_STREAM_END) {
				if (HasMoreMembers()) {
					inflateReset(&strm_);
					continue;
				}
				finished_ = true;
			} else if (ret == Z_BUF_ERROR && input_exhausted) {
				throw SourceFormatError("SourceReader: truncated compressed stream in " + name_);
			} else if (ret != Z_OK && ret != Z_BUF_ERROR) {
				throw SourceFormatError("SourceReader: corrupt compressed data in " + name_ + ": " +
				                        (strm_.msg ? strm_.msg : "inflate error"));
			}
		}
		return n - strm_.avail_out;
	}

	void Close() override {
		if (initialized_) {
			inflateEnd(&strm_);
			initialized_ = false;
		}
		file_.reset();
	}

	const std::string &Name() const override {
		return name_;
	}

private:
	void Refill() {
		size_t got = std::fread(input_.data(), 1, input_.size(), file_->Get());
		strm_.next_in = input_.data();
		strm_.avail_in = static_cast<uInt>(got);
	}

	bool HasMoreMembers() {
		if (strm_.avail_in > 0) {
			return true;
		}
		Refill();
		return strm_.avail_in > 0;
	}

	std::unique_ptr<FileHandle> file_;
	std::string name_;
	std::vector<unsigned char> input_;
	z_stream strm_;
	bool initialized_ = false;
	bool finished_ = false;
};

} // namespace

ContainerKind SourceReader::Detect(const std::string &path) {
	FileHandle file(path);
	unsigned char magic[4] = {0, 0, 0, 0};
	size_t got = std::fread(magic, 1, sizeof(magic), file.Get());
	if (got >= 4) {
		// an archive with no members starts directly with its end-of-central-directory record
		uint32_t sig = ReadLE32(magic);
		if (sig == ZIP_LOCAL_HEADER_SIG || sig == ZIP_END_OF_CENTRAL_DIR_SIG || sig == ZIP_SPANNED_SIG) {
			return ContainerKind::ZIP;
		}
	}
	if (got >= 2 && magic[0] == 0x1f && magic[1] == 0x8b) {
		return ContainerKind::GZIP;
	}
	return ContainerKind::RAW;
}

std::unique_ptr<ByteSource> SourceReader::Open(const std::string &path) {
	switch (Detect(path)) {
	case ContainerKind::ZIP:
		return OpenZipMember(path);
	case ContainerKind::GZIP:
		return std::make_unique<GzipSource>(std::make_unique<FileHandle>(path), path);
	case ContainerKind::RAW:
	default:
		return std::make_unique<RawFileSource>(path);
	}
}

} // namespace saft
