#include "appxmanifest/archive/ZipReader.hpp"
#include "appxmanifest/core/Constants.hpp"
#include "appxmanifest/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <algorithm>
#include <array>
#include <limits>

namespace appxmanifest {
namespace archive {

namespace {

// minizip读取阶段的错误归类：数据损坏视为格式错误，其余视为I/O错误
ZipError classifyReadError(int32_t err) {
    switch (err) {
        case MZ_DATA_ERROR:
        case MZ_CRC_ERROR:
        case MZ_FORMAT_ERROR:
        case MZ_SUPPORT_ERROR:
            return ZipError::BadFormat;
        default:
            return ZipError::IoFail;
    }
}

} // namespace

// 构造/析构

ZipReader::ZipReader(const core::Path& path)
    : filepath_(path), filename_(path.string()) {
}

ZipReader::ZipReader(std::vector<uint8_t> buffer, std::string name)
    : filename_(std::move(name)), buffer_(std::move(buffer)), memory_backed_(true) {
}

ZipReader::~ZipReader() {
    cleanup();
}

// 打开/关闭

ZipError ZipReader::open() {
    cleanup();  // 清理之前的状态
    return initializeReader();
}

ZipError ZipReader::close() {
    ZipError result = ZipError::Ok;

    if (entry_open_) {
        result = closeEntry();
    }

    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        ARCHIVE_DEBUG("Zip archive closed: {}", filename_);
    }

    is_open_ = false;
    entries_.clear();
    entry_index_.clear();

    return result;
}

// 条目查询

const ZipReader::EntryInfo* ZipReader::findEntry(std::string_view internal_path) const {
    auto it = entry_index_.find(std::string(internal_path));
    return it != entry_index_.end() ? &entries_[it->second] : nullptr;
}

// 流式读取

ZipError ZipReader::openEntry(std::string_view internal_path) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    if (entry_open_) {
        ARCHIVE_ERROR("Another entry is already open in {}", filename_);
        return ZipError::InvalidParameter;
    }

    std::string path_str(internal_path);
    last_native_error_ = mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0);
    if (last_native_error_ != MZ_OK) {
        ARCHIVE_ERROR("File {} not found in zip archive {}", internal_path, filename_);
        return ZipError::FileNotFound;
    }

    last_native_error_ = mz_zip_reader_entry_open(unzip_handle_);
    if (last_native_error_ != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {}, error: {}", internal_path, last_native_error_);
        return classifyReadError(last_native_error_);
    }

    entry_open_ = true;
    APPXMANIFEST_LOG_ZIP_ENTRY_DEBUG("Opened entry {} in {}", internal_path, filename_);
    return ZipError::Ok;
}

ZipError ZipReader::readEntry(void* buffer, size_t size, size_t& bytes_read) {
    bytes_read = 0;

    if (!entry_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("No entry is open for reading in {}", filename_);
        return ZipError::NotOpen;
    }

    if (!buffer || size == 0) {
        return ZipError::InvalidParameter;
    }

    int32_t chunk = static_cast<int32_t>(std::min<size_t>(size, std::numeric_limits<int32_t>::max()));
    int32_t read = mz_zip_reader_entry_read(unzip_handle_, buffer, chunk);
    if (read < 0) {
        last_native_error_ = read;
        ARCHIVE_ERROR("Failed to read entry data from {}, error: {}", filename_, read);
        return classifyReadError(read);
    }

    bytes_read = static_cast<size_t>(read);
    return ZipError::Ok;
}

ZipError ZipReader::closeEntry() {
    if (!entry_open_ || !unzip_handle_) {
        return ZipError::Ok;
    }

    entry_open_ = false;
    last_native_error_ = mz_zip_reader_entry_close(unzip_handle_);
    if (last_native_error_ != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry in {}, error: {}", filename_, last_native_error_);
        return classifyReadError(last_native_error_);
    }
    return ZipError::Ok;
}

// 整条目提取

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data,
                                uint64_t max_size) {
    if (!is_open_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    const EntryInfo* info = findEntry(internal_path);
    if (!info) {
        ARCHIVE_ERROR("File {} not found in zip archive {}", internal_path, filename_);
        return ZipError::FileNotFound;
    }

    if (info->uncompressed_size > max_size) {
        ARCHIVE_ERROR("Entry {} is too large ({} bytes, limit {} bytes)",
                      internal_path, info->uncompressed_size, max_size);
        return ZipError::TooLarge;
    }

    ZipError result = openEntry(internal_path);
    if (result != ZipError::Ok) {
        return result;
    }

    std::vector<uint8_t> content;
    content.reserve(static_cast<size_t>(info->uncompressed_size));

    // 使用固定大小的缓冲区进行分块读取
    std::array<uint8_t, core::Constants::kIOBufferSize> buffer;
    size_t bytes_read = 0;
    do {
        result = readEntry(buffer.data(), buffer.size(), bytes_read);
        if (result != ZipError::Ok) {
            closeEntry();
            return result;
        }
        if (content.size() + bytes_read > max_size) {
            ARCHIVE_ERROR("Entry {} exceeds the size limit of {} bytes", internal_path, max_size);
            closeEntry();
            return ZipError::TooLarge;
        }
        content.insert(content.end(), buffer.data(), buffer.data() + bytes_read);
    } while (bytes_read > 0);

    result = closeEntry();
    if (result != ZipError::Ok) {
        return result;
    }

    data.swap(content);
    ARCHIVE_DEBUG("Extracted file {} from zip, size: {} bytes", internal_path, data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content,
                                uint64_t max_size) {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data, max_size);
    if (result != ZipError::Ok) {
        return result;
    }

    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

// 内部辅助方法

ZipError ZipReader::initializeReader() {
    if (memory_backed_) {
        if (buffer_.empty()) {
            ARCHIVE_ERROR("Empty buffer is not a zip archive: {}", filename_);
            return ZipError::BadFormat;
        }
        if (buffer_.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
            ARCHIVE_ERROR("Buffer {} is too large to open in memory ({} bytes)", filename_, buffer_.size());
            return ZipError::TooLarge;
        }
    }

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return ZipError::InternalError;
    }

    if (memory_backed_) {
        // copy=0: minizip直接引用buffer_，buffer_在读取器析构前不会被修改
        last_native_error_ = mz_zip_reader_open_buffer(unzip_handle_, buffer_.data(),
                                                       static_cast<int32_t>(buffer_.size()), 0);
    } else {
        last_native_error_ = mz_zip_reader_open_file(unzip_handle_, filepath_.c_str());
    }

    if (last_native_error_ != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip archive for reading: {}, error: {}", filename_, last_native_error_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        // 找不到中央目录签名时minizip返回MZ_EXIST_ERROR，同样视为格式错误
        return last_native_error_ == MZ_OPEN_ERROR ? ZipError::IoFail : ZipError::BadFormat;
    }

    is_open_ = true;

    ZipError result = buildEntryCache();
    if (result != ZipError::Ok) {
        cleanup();
        return result;
    }

    ARCHIVE_DEBUG("Zip archive opened for reading: {} ({} entries, {})",
                  filename_, entries_.size(), memory_backed_ ? "memory" : "file");
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        if (entry_open_) {
            mz_zip_reader_entry_close(unzip_handle_);
        }
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }

    is_open_ = false;
    entry_open_ = false;
    entries_.clear();
    entry_index_.clear();
}

ZipError ZipReader::buildEntryCache() {
    entries_.clear();
    entry_index_.clear();

    int32_t err = mz_zip_reader_goto_first_entry(unzip_handle_);
    if (err == MZ_END_OF_LIST) {
        return ZipError::Ok;  // 空归档
    }

    while (err == MZ_OK) {
        mz_zip_file* file_info = nullptr;
        err = mz_zip_reader_entry_get_info(unzip_handle_, &file_info);
        if (err != MZ_OK || !file_info) {
            break;
        }

        if (file_info->filename && file_info->filename[0] != '\0') {
            EntryInfo info;
            info.path = file_info->filename;
            info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
            info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
            info.crc32 = file_info->crc;
            info.compression_method = file_info->compression_method;
            info.modified_date = file_info->modified_date;
            info.is_directory = (info.path.back() == '/' || info.path.back() == '\\');

            APPXMANIFEST_LOG_ZIP_ENTRY_DEBUG("Entry {}: {} bytes", info.path, info.uncompressed_size);

            // 重复条目名只保留第一个的索引
            entry_index_.emplace(info.path, entries_.size());
            entries_.push_back(std::move(info));
        }

        err = mz_zip_reader_goto_next_entry(unzip_handle_);
    }

    if (err != MZ_END_OF_LIST) {
        last_native_error_ = err;
        ARCHIVE_ERROR("Corrupt central directory in {}, error: {}", filename_, err);
        return ZipError::BadFormat;
    }

    ARCHIVE_DEBUG("Built entry cache with {} entries", entries_.size());
    return ZipError::Ok;
}

}} // namespace appxmanifest::archive
