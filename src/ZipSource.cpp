#include "ZipSource.hpp"
#include "SaftErrors.hpp"
#include "SaftLogging.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>
#include <miniz.h>

namespace saft {

namespace {

bool EndsWithXml(const std::string &name) {
	if (name.size() < 4) {
		return false;
	}
	std::string tail = name.substr(name.size() - 4);
	std::transform(tail.begin(), tail.end(), tail.begin(), [](unsigned char c) { return std::tolower(c); });
	return tail == ".xml";
}

std::string ZipError(mz_zip_archive &zip) {
	return mz_zip_get_error_string(mz_zip_get_last_error(&zip));
}

// Streams one member through miniz's iterative extractor. The archive reader and the
// iterator are released on Close(), on the destructor and on every error path.
class ZipMemberSource : public ByteSource {
public:
	ZipMemberSource(const std::string &path, std::string name, mz_uint index, mz_uint64 size)
	    : name_(std::move(name)), size_(size) {
		std::memset(&zip_, 0, sizeof(zip_));
		if (!mz_zip_reader_init_file(&zip_, path.c_str(), 0)) {
			throw SourceFormatError("SourceReader: cannot read zip archive " + path + ": " + ZipError(zip_));
		}
		open_ = true;
		iter_ = mz_zip_reader_extract_iter_new(&zip_, index, 0);
		if (!iter_) {
			std::string detail = ZipError(zip_);
			Close();
			throw SourceFormatError("SourceReader: cannot open zip member " + name_ + ": " + detail);
		}
	}

	~ZipMemberSource() override {
		Close();
	}

	size_t Read(char *buf, size_t n) override {
		if (!iter_ || n == 0) {
			return 0;
		}
		size_t got = mz_zip_reader_extract_iter_read(iter_, buf, n);
		delivered_ += got;
		if (delivered_ >= size_ || got == 0) {
			Finish();
		}
		return got;
	}

	void Close() override {
		if (iter_) {
			mz_zip_reader_extract_iter_free(iter_);
			iter_ = nullptr;
		}
		if (open_) {
			mz_zip_reader_end(&zip_);
			open_ = false;
		}
	}

	const std::string &Name() const override {
		return name_;
	}

private:
	// Freeing the iterator is where miniz verifies the size and CRC of the member.
	void Finish() {
		bool ok = mz_zip_reader_extract_iter_free(iter_);
		iter_ = nullptr;
		if (ok) {
			return;
		}
		std::string detail = ZipError(zip_);
		bool complete = delivered_ == size_;
		Close();
		if (complete) {
			throw SourceFormatError("SourceReader: CRC mismatch in zip member " + name_);
		}
		throw SourceFormatError("SourceReader: corrupt zip member " + name_ + ": " + detail);
	}

	std::string name_;
	mz_uint64 size_;
	mz_uint64 delivered_ = 0;
	mz_zip_archive zip_;
	mz_zip_reader_extract_iter_state *iter_ = nullptr;
	bool open_ = false;
};

} // namespace

std::unique_ptr<ByteSource> OpenZipMember(const std::string &path) {
	mz_zip_archive zip;
	std::memset(&zip, 0, sizeof(zip));
	if (!mz_zip_reader_init_file(&zip, path.c_str(), 0)) {
		throw SourceFormatError("SourceReader: cannot read zip archive " + path + ": " + ZipError(zip));
	}

	struct ZipReaderCleanup {
		mz_zip_archive *zip_ptr;
		~ZipReaderCleanup() {
			mz_zip_reader_end(zip_ptr);
		}
	} cleanup_guard {&zip};

	mz_uint num_files = mz_zip_reader_get_num_files(&zip);
	bool found = false;
	mz_zip_archive_file_stat chosen {};
	size_t eligible = 0;
	for (mz_uint i = 0; i < num_files; i++) {
		mz_zip_archive_file_stat file_stat;
		if (!mz_zip_reader_file_stat(&zip, i, &file_stat) || mz_zip_reader_is_file_a_directory(&zip, i)) {
			continue;
		}
		if (!EndsWithXml(file_stat.m_filename)) {
			continue;
		}
		eligible++;
		if (!found) {
			chosen = file_stat;
			found = true;
		}
	}

	if (!found) {
		throw SourceFormatError("SourceReader: no .xml member found in zip archive " + path + " (" +
		                        std::to_string(num_files) + " entries checked)");
	}
	if (eligible > 1) {
		Logger()->debug("{}: {} xml members, reading '{}'", path, eligible, chosen.m_filename);
	}
	if (chosen.m_is_encrypted) {
		throw SourceFormatError("SourceReader: encrypted zip member '" + std::string(chosen.m_filename) + "' in " +
		                        path);
	}
	if (!chosen.m_is_supported) {
		throw SourceFormatError("SourceReader: unsupported zip member '" + std::string(chosen.m_filename) + "' in " +
		                        path);
	}

	return std::make_unique<ZipMemberSource>(path, path + ":" + chosen.m_filename, chosen.m_file_index,
	                                         chosen.m_uncomp_size);
}

} // namespace saft
