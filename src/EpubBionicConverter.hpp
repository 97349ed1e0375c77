#pragma once

#include "../bionic/HtmlBionicInjector.hpp"
#include "../bionic/ImageMime.hpp"

// minizip-ng
#include <minizip-ng/mz.h>
#include <minizip-ng/mz_zip.h>
#include <minizip-ng/mz_zip_rw.h>
#include <minizip-ng/mz_strm.h>
#include <minizip-ng/mz_strm_mem.h>

#include <QByteArray>
#include <QDebug>
#include <QString>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

// EPUB -> bionic EPUB, entirely in memory. Every (X)HTML content document is
// rewritten through HtmlBionicInjector; every other entry is copied as is.
class EpubBionicConverter {
public:
    struct Result {
        bool success;
        std::string message;
    };

    struct BytesResult {
        bool success;
        std::string message;
        std::vector<uint8_t> outputBytes; // valid if success==true
    };

    // File IO wrapper: Read file -> ConvertBytes(core) -> Write file
    static Result Convert(const std::string &inputPath,
                          const std::string &outputPath,
                          const double ratio) {
        std::ifstream in(inputPath, std::ios::binary);
        if (!in) return {false, "❌ Cannot open input file."};

        const std::vector<uint8_t> inputBytes{
            std::istreambuf_iterator<char>(in),
            std::istreambuf_iterator<char>()
        };

        auto [success, message, outputBytes] = ConvertBytes(inputBytes, ratio);
        if (!success) return {false, message};

        std::ofstream out(outputPath, std::ios::binary);
        if (!out) return {false, "❌ Cannot open output file for writing."};

        out.write(reinterpret_cast<const char *>(outputBytes.data()),
                  static_cast<std::streamsize>(outputBytes.size()));
        if (!out) return {false, "❌ Failed writing output file."};

        return {true, message};
    }

    static BytesResult ConvertBytes(const std::vector<uint8_t> &inputZipBytes, const double ratio) {
        if (inputZipBytes.empty())
            return {false, "❌ Input EPUB buffer is empty.", {}};

        std::ostringstream debug;

        std::vector<Entry> entries;
        if (std::string error; !ReadEntries(inputZipBytes, entries, debug, error))
            return {false, error, {}};

        if (entries.empty())
            return {false, "❌ EPUB has no readable entries.", {}};

        // ---- Rewrite content documents ----
        const bionic::HtmlBionicInjector injector(ratio);
        int convertedCount = 0;
        int targetCount = 0;

        for (Entry &e: entries) {
            if (e.isDir || !IsContentDocument(e.name))
                continue;
            ++targetCount;

            const QByteArray markup(reinterpret_cast<const char *>(e.data.data()),
                                    static_cast<qsizetype>(e.data.size()));

            QString parseError;
            const std::optional<QByteArray> rewritten = injector.Apply(markup, &parseError);
            if (!rewritten) {
                // Leave the entry untouched; the reader still gets the chapter.
                qWarning() << "EPUB: cannot parse" << QString::fromStdString(e.name) << ":" << parseError;
                debug << "skipped unparsable " << e.name << ": " << parseError.toStdString() << "\n";
                continue;
            }

            e.data.assign(rewritten->cbegin(), rewritten->cend());
            ++convertedCount;
        }

        if (targetCount == 0)
            return {false, "❌ No XHTML content documents found in EPUB.", {}};

        std::vector<uint8_t> outBytes;
        if (std::string error; !WriteEntries(entries, outBytes, debug, error))
            return {false, error, {}};

        std::string msg = "✅ Successfully converted " + std::to_string(convertedCount) + " of " +
                          std::to_string(targetCount) + " document(s).";
        if (!debug.str().empty())
            msg += "\n" + debug.str();

        return {true, msg, std::move(outBytes)};
    }

    // Minimal gate (even though we don't extract to disk)
    static bool IsSafeZipEntryName(const std::string &name) {
        if (name.empty()) return false;
        if (name.front() == '/' || name.front() == '\\') return false;
        if (name.find('\0') != std::string::npos) return false;
        if (name.find('\\') != std::string::npos) return false;
        if (name == ".." || name.rfind("../", 0) == 0) return false;
        if (name.find("/../") != std::string::npos) return false;
        if (endsWith(name, "/..")) return false;
        return true;
    }

    static bool IsContentDocument(const std::string &name) {
        const std::string lower = toLowerCopy(name);
        return endsWith(lower, ".xhtml") || endsWith(lower, ".html") || endsWith(lower, ".htm");
    }

private:
    struct Entry {
        std::string name;
        bool isDir = false;
        std::vector<uint8_t> data;
    };

    static inline std::string toLowerCopy(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    static inline bool endsWith(const std::string &s, const std::string &suf) {
        return s.size() >= suf.size() &&
               s.compare(s.size() - suf.size(), suf.size(), suf) == 0;
    }

    static bool isMimeName(const std::string &nm) {
        return nm == "mimetype" || nm == "./mimetype";
    }

    // Already-compressed rasters gain nothing from deflate.
    static bool shouldStore(const Entry &e) {
        return bionic::IsCompressedRaster(bionic::DetectImageMime(e.data.data(), e.data.size(), e.name));
    }

    static bool ReadEntries(const std::vector<uint8_t> &zipBytes,
                            std::vector<Entry> &entries,
                            std::ostringstream &debug,
                            std::string &error) {
        void *inStream = mz_stream_mem_create();
        if (!inStream) {
            error = "❌ minizip: failed to create memory stream (input).";
            return false;
        }

        mz_stream_mem_set_buffer(inStream,
                                 const_cast<uint8_t *>(zipBytes.data()),
                                 static_cast<int32_t>(zipBytes.size()));

        if (int32_t rc_s_open = mz_stream_open(inStream, nullptr, MZ_OPEN_MODE_READ); rc_s_open != MZ_OK) {
            mz_stream_mem_delete(&inStream);
            error = "❌ minizip: stream_open(READ) failed rc=" + std::to_string(rc_s_open);
            return false;
        }
        mz_stream_seek(inStream, 0, MZ_SEEK_SET);

        void *reader = mz_zip_reader_create();
        if (!reader) {
            mz_stream_close(inStream);
            mz_stream_mem_delete(&inStream);
            error = "❌ minizip: failed to create zip reader.";
            return false;
        }

        auto cleanup = [&]() {
            mz_zip_reader_delete(&reader);
            mz_stream_close(inStream);
            mz_stream_mem_delete(&inStream);
        };

        if (int32_t rc_r_open = mz_zip_reader_open(reader, inStream); rc_r_open != MZ_OK) {
            cleanup();
            error = "❌ Failed to open EPUB archive from memory rc=" + std::to_string(rc_r_open);
            return false;
        }

        if (int32_t rc_goto = mz_zip_reader_goto_first_entry(reader); rc_goto != MZ_OK) {
            mz_zip_reader_close(reader);
            cleanup();
            error = "❌ EPUB has no readable entries (rc=" + std::to_string(rc_goto) + ")";
            return false;
        }

        do {
            mz_zip_file *file_info = nullptr;
            mz_zip_reader_entry_get_info(reader, &file_info);
            if (!file_info || !file_info->filename)
                continue;

            Entry e;
            e.name = file_info->filename;

            if (!IsSafeZipEntryName(e.name)) {
                qWarning() << "EPUB: unsafe entry name dropped:" << QString::fromStdString(e.name);
                debug << "dropped unsafe entry " << e.name << "\n";
                continue;
            }

            e.isDir = (mz_zip_reader_entry_is_dir(reader) == MZ_OK) ||
                      (!e.name.empty() && e.name.back() == '/');

            if (e.isDir) {
                entries.push_back(std::move(e));
                continue;
            }

            const auto usize64 = file_info->uncompressed_size;

            if (constexpr int64_t MAX_ENTRY = 256LL * 1024LL * 1024LL; usize64 < 0 || usize64 > MAX_ENTRY) {
                qWarning() << "EPUB: unreasonable entry size, dropped:" << QString::fromStdString(e.name);
                debug << "dropped oversized entry " << e.name << " size=" << usize64 << "\n";
                continue;
            }

            e.data.resize(static_cast<size_t>(usize64));

            if (int32_t rc_e_open = mz_zip_reader_entry_open(reader); rc_e_open != MZ_OK) {
                qWarning() << "EPUB: cannot open entry" << QString::fromStdString(e.name) << "rc=" << rc_e_open;
                debug << "entry_open failed (" << e.name << ") rc=" << rc_e_open << "\n";
                continue;
            }

            int32_t rc_save = MZ_OK;
            if (!e.data.empty()) {
                rc_save = mz_zip_reader_entry_save_buffer(reader,
                                                          e.data.data(),
                                                          static_cast<int32_t>(e.data.size()));
            }

            mz_zip_reader_entry_close(reader);

            if (rc_save != MZ_OK) {
                qWarning() << "EPUB: cannot read entry" << QString::fromStdString(e.name) << "rc=" << rc_save;
                debug << "save_buffer failed (" << e.name << ") rc=" << rc_save << "\n";
                continue;
            }

            entries.push_back(std::move(e));
        } while (mz_zip_reader_goto_next_entry(reader) == MZ_OK);

        mz_zip_reader_close(reader);
        cleanup();
        return true;
    }

    static int32_t AddEntry(void *writer, const std::string &name, const std::vector<uint8_t> &data,
                            const bool store) {
        mz_zip_file file_info = {};
        file_info.filename = name.c_str();
        file_info.flag |= MZ_ZIP_FLAG_UTF8;
        file_info.uncompressed_size = static_cast<int64_t>(data.size());
        file_info.compression_method = store ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE;

        mz_zip_writer_set_compress_method(writer, file_info.compression_method);
        mz_zip_writer_set_compress_level(writer, store ? 0 : MZ_COMPRESS_LEVEL_DEFAULT);

        return mz_zip_writer_add_buffer(writer,
                                        data.empty() ? nullptr : const_cast<uint8_t *>(data.data()),
                                        static_cast<int32_t>(data.size()),
                                        &file_info);
    }

    static bool WriteEntries(const std::vector<Entry> &entries,
                             std::vector<uint8_t> &outBytes,
                             std::ostringstream &debug,
                             std::string &error) {
        void *outStream = mz_stream_mem_create();
        if (!outStream) {
            error = "❌ minizip: failed to create memory stream (output).";
            return false;
        }

        mz_stream_mem_set_grow_size(outStream, 64 * 1024);

        if (int32_t rc_out_open = mz_stream_open(outStream, nullptr, MZ_OPEN_MODE_CREATE); rc_out_open != MZ_OK) {
            mz_stream_mem_delete(&outStream);
            error = "❌ minizip: stream_open(CREATE) failed rc=" + std::to_string(rc_out_open);
            return false;
        }
        mz_stream_seek(outStream, 0, MZ_SEEK_SET);

        auto closeStream = [&outStream]() {
            mz_stream_close(outStream);
            mz_stream_mem_delete(&outStream);
        };

        void *writer = mz_zip_writer_create();
        if (!writer) {
            closeStream();
            error = "❌ minizip: failed to create zip writer.";
            return false;
        }

        if (int32_t rc_w_open = mz_zip_writer_open(writer, outStream, 0); rc_w_open != MZ_OK) {
            mz_zip_writer_delete(&writer);
            closeStream();
            error = "❌ minizip: writer_open failed rc=" + std::to_string(rc_w_open);
            return false;
        }

        bool ok = true;

        // mimetype first, stored (no compression)
        const auto mime = std::find_if(entries.begin(), entries.end(), [](const Entry &e) {
            return !e.isDir && isMimeName(e.name);
        });
        if (mime != entries.end()) {
            if (const int32_t rc_add = AddEntry(writer, "mimetype", mime->data, true); rc_add != MZ_OK) {
                ok = false;
                error = "❌ minizip: add_buffer(mimetype) failed rc=" + std::to_string(rc_add);
            }
        } else {
            qWarning() << "EPUB: archive has no mimetype entry";
            debug << "no mimetype entry in source archive\n";
        }

        // Directories are implied by entry paths; we skip emitting them.
        for (const Entry &e: entries) {
            if (!ok)
                break;
            if (e.isDir || isMimeName(e.name))
                continue;

            if (const int32_t rc_add = AddEntry(writer, e.name, e.data, shouldStore(e)); rc_add != MZ_OK) {
                ok = false;
                error = "❌ minizip: add_buffer(" + e.name + ") failed rc=" + std::to_string(rc_add);
            }
        }

        const int32_t rc_close = mz_zip_writer_close(writer);
        mz_zip_writer_delete(&writer);

        if (!ok) {
            closeStream();
            return false;
        }

        if (rc_close != MZ_OK) {
            closeStream();
            error = "❌ minizip: writer_close failed rc=" + std::to_string(rc_close);
            return false;
        }

        const void *out_buf = nullptr;
        mz_stream_mem_get_buffer(outStream, &out_buf);

        int32_t out_len = 0;
        mz_stream_mem_get_buffer_length(outStream, &out_len);

        if (!out_buf || out_len <= 0) {
            closeStream();
            error = "❌ Output EPUB buffer is empty (unexpected).";
            return false;
        }

        // Copy while the stream is still alive
        outBytes.resize(static_cast<size_t>(out_len));
        std::memcpy(outBytes.data(), out_buf, static_cast<size_t>(out_len));

        closeStream();
        return true;
    }
};
